#include "helpers.hpp"

/*
-------------------------------------------------------------------------------
 helpers.cpp — Parameter lookup and ParameterSet helpers
-------------------------------------------------------------------------------
Used by the model (pending updates, change detection), the parameter store
(row names) and the console front end (menu choices). All lookups are linear
over the five parameters.
-------------------------------------------------------------------------------
*/

// Return true if `name` is one of the recognized parameter names.
bool find_param(const std::string& name, Param& out) {
    for (Param p : ALL_PARAMS)
        if (name == param_name(p)) { out = p; return true; }
    return false;
}

// Accept either a 1-based position in the parameter list or a name.
bool parse_param_choice(const std::string& text, Param& out) {
    if (text.size() == 1 && text[0] >= '1' && text[0] <= '0' + static_cast<int>(PARAM_COUNT)) {
        out = ALL_PARAMS[static_cast<std::size_t>(text[0] - '1')];
        return true;
    }
    return find_param(text, out);
}

// Overwrite one value by name. Unknown names are ignored.
bool apply_param_update(ParameterSet& set, const std::string& name, int value) {
    Param p;
    if (!find_param(name, p)) return false;
    set.set(p, value);
    return true;
}

// List the parameters that differ, keeping parameter order.
std::vector<Param> changed_params(const ParameterSet& a, const ParameterSet& b) {
    std::vector<Param> out;
    for (Param p : ALL_PARAMS)
        if (a.get(p) != b.get(p)) out.push_back(p);
    return out;
}

std::string join_param_names(const std::vector<Param>& params, const std::string& sep) {
    std::string out;
    for (Param p : params) {
        if (!out.empty()) out += sep;
        out += param_name(p);
    }
    return out;
}

bool has_suffix(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
