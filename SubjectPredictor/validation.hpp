#pragma once
#include <string>
#include <algorithm>
#include <iostream>
#include <limits>
#include <stdexcept>
#include "models.hpp"
#include "helpers.hpp"   // trim, parse_param_choice, has_suffix

/*
-------------------------------------------------------------------------------
 validation.hpp - Console input checks and prompts for the predictor menu
-------------------------------------------------------------------------------
Contents
  - Validators: parameter choice (position or name), import path, import
    file type.
  - Prompts (stream parameters default to std::cin / std::cout):
      * prompt_until_valid_or_back : text until the validator accepts it
      * prompt_number_or_back      : whole number in [lo, hi]
      * confirm_or_back            : y/n, empty input counts as no

Control words
  - Back: "0", "b", "B"   (number prompts: "b", "B" only, 0 is a value)
  - Exit: "x", "X", "q", "Q", or end of input
  - Output stays plain ASCII.
-------------------------------------------------------------------------------
*/

// "1".."5" or an exact parameter name, e.g. "teaching"
inline bool is_param_choice(const std::string& x) {
    Param p;
    return parse_param_choice(x, p);
}

// non-empty path
inline bool is_import_path(const std::string& x) {
    return !trim(x).empty();
}

// only .csv and .json files can be imported
inline bool is_supported_import_file(const std::string& x) {
    return has_suffix(x, ".csv") || has_suffix(x, ".json");
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        std::string v;
        os << label << " (0=Back, x=Exit): ";
        if (!std::getline(in >> std::ws, v)) {
            if (in.eof()) return InputCtl::Exit;   // input closed
            in.clear();
            in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            continue;
        }
        v = trim(v);
        if (v == "0" || v == "b" || v == "B") return InputCtl::Back;
        if (v == "x" || v == "X" || v == "q" || v == "Q") return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        os << "  -> " << error_msg << "\n";
    }
}

// Whole-number prompt with range + Back/Exit. "0" is a value here.
inline InputCtl prompt_number_or_back(
    const std::string& label,
    int& out,
    int lo, int hi,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        std::string v;
        os << label << " [" << lo << "-" << hi << "] (b=Back, x=Exit): ";
        if (!std::getline(in >> std::ws, v)) {
            if (in.eof()) return InputCtl::Exit;
            in.clear();
            in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            continue;
        }
        v = trim(v);
        if (v == "b" || v == "B") return InputCtl::Back;
        if (v == "x" || v == "X" || v == "q" || v == "Q") return InputCtl::Exit;
        try {
            std::size_t used = 0;
            int d = std::stoi(v, &used);
            if (used != v.size()) { os << "  -> Please enter a whole number.\n"; continue; }
            if (d < lo || d > hi) { os << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = d; return InputCtl::Ok;
        }
        catch (const std::invalid_argument&) {
            os << "  -> Please enter a number.\n";
        }
        catch (const std::out_of_range&) {
            os << "  -> Must be between " << lo << " and " << hi << ".\n";
        }
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(const std::string& msg,
    std::istream& in = std::cin,
    std::ostream& os = std::cout) {
    for (;;) {
        std::string v;
        os << msg << " [y/N] (0=Back, x=Exit): ";
        if (!std::getline(in, v)) {
            if (in.eof()) return InputCtl::Exit;
            in.clear();
            continue;
        }
        v = trim(v);
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (v == "0" || v == "b" || v == "B") return InputCtl::Back;
        if (v == "x" || v == "X" || v == "q" || v == "Q") return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        os << "  -> Please enter y or n.\n";
    }
}
