#pragma once
#include <algorithm>
#include <array>
#include <cstddef>
#include <string>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain structs
-------------------------------------------------------------------------------
Defines plain data structures for the subject performance model:
  - Param         (the five recognized evaluation parameters)
  - ParameterSet  (one 0..100 value per parameter)
  - Weights       (contribution of each parameter to the score)
  - ScorePoint    (one point of the score series)
  - PassFailBand / TrendBand (classification results for display)
  - ImportResult  (outcome of a bulk import)
  - ModelConfig   (everything the model needs at construction)

These are simple value types with public fields. Parameter order is fixed and
is the order used for change logs, reports and persistence.
-------------------------------------------------------------------------------
*/

// The five recognized parameters, in their fixed order.
enum class Param {
    Preparedness = 0,   // student preparedness for the subject
    Teaching,           // teaching effectiveness
    Materials,          // study materials availability
    Participation,      // class participation
    Difficulty          // subject difficulty (higher = harder)
};

constexpr std::size_t PARAM_COUNT = 5;
constexpr int PARAM_MIN = 0;
constexpr int PARAM_MAX = 100;
constexpr int PARAM_DEFAULT = 50;

inline constexpr std::array<Param, PARAM_COUNT> ALL_PARAMS = {
    Param::Preparedness, Param::Teaching, Param::Materials,
    Param::Participation, Param::Difficulty
};

// Wire name: used in the parameter store and as CSV column / JSON key.
inline const char* param_name(Param p) {
    switch (p) {
    case Param::Preparedness:  return "preparedness";
    case Param::Teaching:      return "teaching";
    case Param::Materials:     return "materials";
    case Param::Participation: return "participation";
    case Param::Difficulty:    return "difficulty";
    }
    return "";
}

// Human-readable label for menus and reports.
inline const char* param_label(Param p) {
    switch (p) {
    case Param::Preparedness:  return "Student Preparedness";
    case Param::Teaching:      return "Teaching Effectiveness";
    case Param::Materials:     return "Study Materials";
    case Param::Participation: return "Class Participation";
    case Param::Difficulty:    return "Subject Difficulty";
    }
    return "";
}

inline constexpr std::size_t param_index(Param p) {
    return static_cast<std::size_t>(p);
}

inline int clamp_param(int value) {
    return std::clamp(value, PARAM_MIN, PARAM_MAX);
}

// Weight of each parameter in the pass-probability score.
struct Weights {
    std::array<double, PARAM_COUNT> by_param{ 0.3, 0.3, 0.2, 0.15, -0.05 };

    double of(Param p) const { return by_param[param_index(p)]; }
};

// One value per parameter. Every write goes through set() so the [0,100]
// invariant always holds.
struct ParameterSet {
    std::array<int, PARAM_COUNT> values{
        PARAM_DEFAULT, PARAM_DEFAULT, PARAM_DEFAULT, PARAM_DEFAULT, PARAM_DEFAULT };

    // A set with every parameter at `value` (clamped).
    static ParameterSet filled(int value) {
        ParameterSet s;
        s.values.fill(clamp_param(value));
        return s;
    }

    int get(Param p) const { return values[param_index(p)]; }
    void set(Param p, int value) { values[param_index(p)] = clamp_param(value); }

    // Weighted pass-probability score, clamped to [0,100].
    double weighted(const Weights& w) const {
        double score = 0.0;
        for (Param p : ALL_PARAMS)
            score += get(p) * w.of(p);
        return std::clamp(score, 0.0, 100.0);
    }

    bool operator==(const ParameterSet& o) const { return values == o.values; }
    bool operator!=(const ParameterSet& o) const { return values != o.values; }
};

// One point of the score series.
struct ScorePoint {
    int time_step{ 0 };   // 0, 1, 2, ... in the order points were scored
    double score{ 0.0 };  // 0..100
};

// Pass/fail band of the latest score. Colors are opaque display tokens.
struct PassFailBand {
    std::string label;
    std::string foreground;
    std::string background;
};

// Short-window trend of the series.
struct TrendBand {
    std::string label;
    std::string color;
    double slope{ 0.0 };   // 0 when there is not enough data
};

// Result of a bulk import. `message` is never empty.
struct ImportResult {
    bool success{ false };
    std::string message;
};

enum class ImportFormat { Csv, Json };

// Construction-time settings of the model.
struct ModelConfig {
    std::string store_path = "subject_parameters.db";  // SQLite file, or ":memory:"
    int default_value = PARAM_DEFAULT;                  // used for missing values
    Weights weights;
    std::size_t trend_window = 5;                       // points used by the trend fit
};
