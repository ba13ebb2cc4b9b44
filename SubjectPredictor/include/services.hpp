#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - Scoring and classification helpers
-------------------------------------------------------------------------------
This header defines the pure functions the model is built from:
  - classify_score / no_score_band : pass/fail band of a score
  - trend_slope                    : least-squares slope over the last points
  - classify_slope / no_trend_band : trend band of a slope
  - coerce_parameter               : tolerant conversion of imported values
  - change_log                     : "name: old -> new" lines between two sets

Design notes
  - Nothing here touches the parameter store or any model state.
  - Band boundaries are fixed. Pass/fail bands include their lower bound;
    trend bands compare with a strict '>' so ties fall into the less extreme
    band.
-------------------------------------------------------------------------------
*/

// ==========================
// PASS / FAIL
// ==========================

inline PassFailBand no_score_band() {
    return PassFailBand{ "No data", "black", "gray" };
}

// Band of a single score. Lower bounds are inclusive.
inline PassFailBand classify_score(double score) {
    if (score >= 70.0) return PassFailBand{ "High pass chance", "green", "#ddffdd" };
    if (score >= 60.0) return PassFailBand{ "Likely to pass", "darkgreen", "#eeffee" };
    if (score >= 50.0) return PassFailBand{ "Borderline", "blue", "#ffffdd" };
    if (score >= 40.0) return PassFailBand{ "Risk of failing", "orange", "#ffeeee" };
    return PassFailBand{ "High fail chance", "red", "#ffdddd" };
}

// ==========================
// TREND
// ==========================

// Ordinary least-squares slope of score over time_step, using the last
// min(window, size) points. Returns nullopt with fewer than two points.
inline std::optional<double> trend_slope(const std::vector<ScorePoint>& series,
    std::size_t window) {
    std::size_t n = std::min(window, series.size());
    if (n < 2) return std::nullopt;

    auto first = series.end() - static_cast<std::ptrdiff_t>(n);
    double mean_x = 0.0, mean_y = 0.0;
    for (auto it = first; it != series.end(); ++it) {
        mean_x += it->time_step;
        mean_y += it->score;
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double sxy = 0.0, sxx = 0.0;
    for (auto it = first; it != series.end(); ++it) {
        double dx = it->time_step - mean_x;
        sxy += dx * (it->score - mean_y);
        sxx += dx * dx;
    }
    if (sxx == 0.0) return std::nullopt;   // all points on one time step
    return sxy / sxx;
}

inline TrendBand no_trend_band() {
    return TrendBand{ "Not enough data", "black", 0.0 };
}

// Trend band of a slope; every test is a strict '>'.
inline TrendBand classify_slope(double slope) {
    if (slope > 1.5)  return TrendBand{ "Rapid improvement", "green", slope };
    if (slope > 0.5)  return TrendBand{ "Improving", "darkgreen", slope };
    if (slope > -0.5) return TrendBand{ "Stable", "blue", slope };
    if (slope > -1.5) return TrendBand{ "Declining", "orange", slope };
    return TrendBand{ "Rapid decline", "red", slope };
}

// ==========================
// IMPORT COERCION
// ==========================

// Coerce-with-default: a missing or NaN value becomes `fallback`; anything
// else, infinities included, is clamped to [0,100] and rounded.
inline int coerce_parameter(const std::optional<double>& raw, int fallback) {
    if (!raw || std::isnan(*raw)) return clamp_param(fallback);
    double v = std::clamp(*raw, static_cast<double>(PARAM_MIN), static_cast<double>(PARAM_MAX));
    return static_cast<int>(std::lround(v));
}

// ==========================
// CHANGE LOG
// ==========================

// One "name: old -> new" line per differing parameter, in parameter order,
// joined with '\n'. Empty when the sets are equal.
inline std::string change_log(const ParameterSet& from, const ParameterSet& to) {
    std::string out;
    for (Param p : ALL_PARAMS) {
        if (from.get(p) == to.get(p)) continue;
        if (!out.empty()) out += '\n';
        out += param_name(p);
        out += ": " + std::to_string(from.get(p)) + " -> " + std::to_string(to.get(p));
    }
    return out;
}
