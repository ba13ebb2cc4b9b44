/*
-------------------------------------------------------------------------------
 importer.cpp — CSV / JSON row readers for bulk import
-------------------------------------------------------------------------------
Purpose
  - Reads historical parameter rows from a .csv or .json file and hands them
    to the model one row at a time through RowReader.

Design notes
  - CSV is read and checked in full by open(); the header fixes which
    column holds which parameter. A row may be shorter than the header
    (missing cells) but not longer.
  - JSON is parsed in one go with nlohmann::json; its exceptions are caught
    here and reported through `err`, nothing is thrown to the caller.
  - Readers never apply defaults. A field is either a number (possibly
    infinite) or nullopt; coerce_row turns that into a ParameterSet.
-------------------------------------------------------------------------------
*/

#include "importer.hpp"
#include "helpers.hpp"
#include "services.hpp"
#include <cmath>
#include <cstdlib>
#include <utility>

// Strip a trailing '\r' left by CRLF line endings.
static void chomp_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

// ==========================
// CSV
// ==========================

bool CsvRowReader::open(const std::string& path, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open file '" + path + "'";
        return false;
    }

    // Header: first non-blank line.
    std::string line;
    std::size_t line_no = 0;
    bool have_header = false;
    while (std::getline(in, line)) {
        ++line_no;
        chomp_cr(line);
        if (line_no == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);  // UTF-8 BOM
        if (!trim(line).empty()) { have_header = true; break; }
    }
    if (!have_header) {
        err = "no columns to parse in '" + path + "'";
        return false;
    }

    std::vector<std::string> names;
    if (!split_csv_line(line, names)) {
        err = "unterminated quoted field in header of '" + path + "'";
        return false;
    }

    // First column with a given name wins.
    for (std::size_t i = 0; i < names.size(); ++i) {
        Param p;
        if (find_param(trim(names[i]), p) && column_[param_index(p)] < 0)
            column_[param_index(p)] = static_cast<int>(i);
    }

    // Data lines. A row may be shorter than the header but not wider.
    while (std::getline(in, line)) {
        ++line_no;
        chomp_cr(line);
        if (trim(line).empty()) continue;

        std::vector<std::string> cells;
        if (!split_csv_line(line, cells)) {
            err = "line " + std::to_string(line_no) + ": unterminated quoted field";
            return false;
        }
        if (cells.size() > names.size()) {
            err = "line " + std::to_string(line_no) + ": expected "
                + std::to_string(names.size()) + " fields, saw " + std::to_string(cells.size());
            return false;
        }
        rows_.push_back(std::move(cells));
    }
    if (in.bad()) {
        err = "read error after line " + std::to_string(line_no) + " of '" + path + "'";
        return false;
    }

    opened_ = true;
    return true;
}

RowStatus CsvRowReader::next(ImportRow& row) {
    row = ImportRow{};
    if (!opened_) {
        error_ = "reader is not open";
        return RowStatus::Malformed;
    }
    if (index_ >= rows_.size()) return RowStatus::End;

    const std::vector<std::string>& cells = rows_[index_++];
    for (Param p : ALL_PARAMS) {
        int c = column_[param_index(p)];
        if (c >= 0 && static_cast<std::size_t>(c) < cells.size())
            row.fields[param_index(p)] = parse_number(cells[static_cast<std::size_t>(c)]);
    }
    return RowStatus::Ok;
}

// ==========================
// JSON
// ==========================

bool JsonRowReader::open(const std::string& path, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "cannot open file '" + path + "'";
        return false;
    }

    try {
        doc_ = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::exception& e) {   // parse_error, or out_of_range on number overflow
        err = "malformed JSON in '" + path + "': " + e.what();
        return false;
    }

    if (!doc_.is_array()) {
        err = "expected a JSON array of objects in '" + path + "'";
        return false;
    }
    for (std::size_t i = 0; i < doc_.size(); ++i) {
        if (!doc_[i].is_object()) {
            err = "entry " + std::to_string(i + 1) + " is not an object";
            return false;
        }
    }

    opened_ = true;
    return true;
}

RowStatus JsonRowReader::next(ImportRow& row) {
    row = ImportRow{};
    if (!opened_) {
        error_ = "reader is not open";
        return RowStatus::Malformed;
    }
    if (index_ >= doc_.size()) return RowStatus::End;

    const nlohmann::json& entry = doc_.at(index_);
    ++index_;

    // Booleans, strings and null count as non-numeric.
    for (Param p : ALL_PARAMS) {
        auto it = entry.find(param_name(p));
        if (it != entry.end() && it->is_number())
            row.fields[param_index(p)] = it->get<double>();
    }
    return RowStatus::Ok;
}

// ==========================
// Format dispatch
// ==========================

bool detect_import_format(const std::string& path, ImportFormat& out) {
    if (has_suffix(path, ".csv")) { out = ImportFormat::Csv; return true; }
    if (has_suffix(path, ".json")) { out = ImportFormat::Json; return true; }
    return false;
}

std::unique_ptr<RowReader> open_row_reader(const std::string& path, ImportFormat format,
    std::string& err) {
    switch (format) {
    case ImportFormat::Csv: {
        auto reader = std::make_unique<CsvRowReader>();
        if (!reader->open(path, err)) return nullptr;
        return reader;
    }
    case ImportFormat::Json: {
        auto reader = std::make_unique<JsonRowReader>();
        if (!reader->open(path, err)) return nullptr;
        return reader;
    }
    }
    err = "unsupported import format";
    return nullptr;
}

ParameterSet coerce_row(const ImportRow& row, int fallback) {
    ParameterSet out;
    for (Param p : ALL_PARAMS)
        out.set(p, coerce_parameter(row.fields[param_index(p)], fallback));
    return out;
}

// ==========================
// CSV primitives
// ==========================

bool split_csv_line(const std::string& line, std::vector<std::string>& out) {
    out.clear();
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { field.push_back('"'); ++i; }
                else quoted = false;
            }
            else {
                field.push_back(c);
            }
        }
        else if (c == '"') {
            quoted = true;
        }
        else if (c == ',') {
            out.push_back(field);
            field.clear();
        }
        else {
            field.push_back(c);
        }
    }
    if (quoted) return false;
    out.push_back(field);
    return true;
}

std::optional<double> parse_number(const std::string& cell) {
    std::string t = trim(cell);
    if (t.empty()) return std::nullopt;

    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || *end != '\0') return std::nullopt;
    if (std::isnan(v)) return std::nullopt;
    return v;   // overflow gives +-HUGE_VAL, clamped later
}
