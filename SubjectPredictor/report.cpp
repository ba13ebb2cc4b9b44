#include "report.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

/*
-------------------------------------------------------------------------------
 report.cpp — Console reports for the predictor menu
-------------------------------------------------------------------------------
Reads the model only through its const projections; nothing here changes
model state. Layout follows the menu banner width used by the main loop.
-------------------------------------------------------------------------------
*/

std::string pending_changes_line(const std::vector<Param>& changed) {
    if (changed.empty()) return "No pending changes";
    return "Pending changes: " + join_param_names(changed, ", ");
}

// Print the confirmed and pending value of every parameter. A '*' marks the
// rows that still need confirming.
void show_parameters(const PerformanceModel& model, std::ostream& out) {
    out << "--- ********************** ---\n";
    out << "    Evaluation Parameters     \n";
    out << "--- ********************** ---\n";
    out << "  #  " << std::left << std::setw(24) << "Parameter"
        << std::right << std::setw(10) << "Confirmed" << std::setw(9) << "Pending" << "\n";

    std::size_t i = 1;
    for (Param p : ALL_PARAMS) {
        int c = model.confirmed().get(p);
        int v = model.pending().get(p);
        out << "  " << i++ << "  " << std::left << std::setw(24) << param_label(p)
            << std::right << std::setw(10) << c << std::setw(9) << v
            << (c != v ? "  *" : "") << "\n";
    }
    out << pending_changes_line(model.pending_changes()) << "\n";
}

void show_change_log(const std::optional<std::string>& log, std::ostream& out) {
    if (!log) {
        out << "No parameter changes were made\n";
        return;
    }
    out << "The following changes were applied:\n\n" << *log << "\n";
}

// Score, band and trend of the latest point. With an empty series every line
// shows a placeholder, as the desktop tool did.
void show_prediction(const PerformanceModel& model, std::ostream& out) {
    std::optional<double> score = model.current_score();
    if (!score) {
        out << "Pass Probability: -\n"
            << "Prediction: -\n"
            << "Trend: -\n"
            << "Last update: Never\n";
        return;
    }

    PassFailBand band = model.predict_pass_fail();
    TrendBand trend = model.predict_trend();

    std::ostringstream pct;
    pct << std::fixed << std::setprecision(1) << *score;
    out << "Pass Probability: " << pct.str() << "%\n";
    out << "Prediction: " << band.label
        << " (" << band.foreground << " on " << band.background << ")\n";

    out << "Trend: " << trend.label;
    if (model.series().size() >= 2) {
        std::ostringstream slope;
        slope << std::showpos << std::fixed << std::setprecision(2) << trend.slope;
        out << " (slope " << slope.str() << " per step)";
    }
    out << "\n";

    if (auto t = model.last_update())
        out << "Last update: " << format_timestamp(*t) << "\n";
    else
        out << "Last update: Never\n";
}

void show_chart(const std::vector<ScorePoint>& series, std::ostream& out, std::size_t max_points) {
    out << "Pass Probability Over Time (%)\n";
    if (series.empty() || max_points == 0) {
        out << "  No data to plot.\n";
        return;
    }

    constexpr std::size_t CELL = 2;   // columns per point
    std::size_t n = std::min(series.size(), max_points);
    auto first = series.end() - static_cast<std::ptrdiff_t>(n);

    for (int level = 100; level >= 0; level -= 10) {
        bool threshold = (level == 70 || level == 60 || level == 50 || level == 40);
        std::string row(n * CELL, threshold ? '-' : ' ');
        for (std::size_t i = 0; i < n; ++i) {
            int bucket = static_cast<int>(std::lround(first[i].score / 10.0)) * 10;
            if (bucket == level) row[i * CELL + 1] = '*';
        }
        row.erase(row.find_last_not_of(' ') + 1);
        out << std::setw(3) << level << " |" << row << "\n";
    }
    out << "    +" << std::string(n * CELL, '-') << "\n";

    // Time-step labels under every fifth point.
    std::string labels(n * CELL, ' ');
    for (std::size_t i = 0; i < n; i += 5) {
        std::string t = std::to_string(first[i].time_step);
        labels.replace(i * CELL + 1, t.size(), t);
    }
    labels.erase(labels.find_last_not_of(' ') + 1);
    out << "     " << labels << "\n";
    out << "     time step\n";
}

std::string format_timestamp(PerformanceModel::Clock::time_point t) {
    std::time_t tt = PerformanceModel::Clock::to_time_t(t);
    const std::tm* tm = std::localtime(&tt);
    if (!tm) return "unknown";
    std::ostringstream os;
    os << std::put_time(tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}
