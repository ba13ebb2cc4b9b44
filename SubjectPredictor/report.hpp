#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "models.hpp"
#include "model.hpp"

/*
-------------------------------------------------------------------------------
 report.hpp — Console reports for the predictor menu
-------------------------------------------------------------------------------
Text renderings of the model's read-only projections:
  - show_parameters      : confirmed vs pending table + pending-changes line
  - show_change_log      : result of a confirmation
  - show_prediction      : score, pass/fail band, trend, last update
  - show_chart           : ASCII chart of the series with threshold rows

Every function writes to the given stream (std::cout by default) and keeps
to plain ASCII.
-------------------------------------------------------------------------------
*/

/// "No pending changes" or "Pending changes: a, b".
std::string pending_changes_line(const std::vector<Param>& changed);

/// Table of every parameter: label, confirmed value, pending value.
void show_parameters(const PerformanceModel& model, std::ostream& out = std::cout);

/// Prints the change log of a confirmation, or the "no changes" message.
void show_change_log(const std::optional<std::string>& log, std::ostream& out = std::cout);

/// Current score (one decimal), band, trend and time of the last update.
void show_prediction(const PerformanceModel& model, std::ostream& out = std::cout);

/// Plots up to the last `max_points` points of the series, 0..100 on the
/// y axis in steps of 10, with the 70/60/50/40 thresholds marked.
void show_chart(const std::vector<ScorePoint>& series, std::ostream& out = std::cout,
    std::size_t max_points = 40);

/// Local time as "YYYY-MM-DD HH:MM:SS".
std::string format_timestamp(PerformanceModel::Clock::time_point t);
