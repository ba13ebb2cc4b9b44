#pragma once
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp — Parameter lookup and ParameterSet helpers
-------------------------------------------------------------------------------
These functions map user- and file-supplied names onto the fixed parameter
list and compare / update ParameterSets. They never touch the parameter store.

Naming convention:
  - find_*    -> read-only lookup.
  - apply_*   -> update in place (by name).
  - changed_* -> read-only comparison.

Return values:
  - For lookups, true if the name was recognized.
  - For apply_* helpers, true if the name was recognized and the value stored.
-------------------------------------------------------------------------------
*/

// ==========================
// Text
// ==========================

// Strip surrounding whitespace. Used for menu input and CSV cells.
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// ==========================
// Lookups
// ==========================

/// True if `name` is exactly (case-sensitive) one of the parameter names.
bool find_param(const std::string& name, Param& out);

/// Menu input: "1".."5" (in parameter order) or a parameter name.
bool parse_param_choice(const std::string& text, Param& out);

// ==========================
// Updates
// ==========================

/// Store `value` (clamped) under the parameter called `name`.
/// Returns false and leaves `set` untouched for unknown names.
bool apply_param_update(ParameterSet& set, const std::string& name, int value);

// ==========================
// Comparison
// ==========================

/// Parameters whose value differs between `a` and `b`, in parameter order.
std::vector<Param> changed_params(const ParameterSet& a, const ParameterSet& b);

/// Parameter names joined with `sep`, e.g. "teaching, materials".
std::string join_param_names(const std::vector<Param>& params, const std::string& sep);

/// True if `s` ends with `suffix` (case-sensitive).
bool has_suffix(const std::string& s, const std::string& suffix);
