/*
-------------------------------------------------------------------------------
 model.cpp — Subject performance model
-------------------------------------------------------------------------------
Purpose
  - Holds confirmed / pending parameters and the score series, and drives the
    parameter store and the import readers.

Design notes
  - All operations are synchronous and run on the caller's thread. There is
    no locking: the front end is the only caller.
  - The store connection is owned here (opened in the constructor, closed in
    the destructor). If it cannot be opened the model still works; saves
    report a diagnostic and return false.
  - calculate_performance() is the only place points enter the series.
-------------------------------------------------------------------------------
*/

#include "model.hpp"
#include "db.hpp"
#include "helpers.hpp"
#include "importer.hpp"
#include "services.hpp"
#include <exception>
#include <iostream>
#include <utility>

PerformanceModel::PerformanceModel(ModelConfig config)
    : config_(std::move(config)),
      confirmed_(ParameterSet::filled(config_.default_value)),
      pending_(confirmed_) {
    open_store();
    if (store_available() && !load_parameters())
        std::cerr << "[model] starting from default parameters\n";
}

PerformanceModel::~PerformanceModel() {
    db_close(db_);
}

PerformanceModel::PerformanceModel(PerformanceModel&& other) noexcept
    : config_(std::move(other.config_)),
      db_(std::exchange(other.db_, nullptr)),
      confirmed_(other.confirmed_),
      pending_(other.pending_),
      series_(std::move(other.series_)),
      current_time_(other.current_time_),
      last_update_(other.last_update_) {
}

PerformanceModel& PerformanceModel::operator=(PerformanceModel&& other) noexcept {
    if (this != &other) {
        db_close(db_);
        config_ = std::move(other.config_);
        db_ = std::exchange(other.db_, nullptr);
        confirmed_ = other.confirmed_;
        pending_ = other.pending_;
        series_ = std::move(other.series_);
        current_time_ = other.current_time_;
        last_update_ = other.last_update_;
    }
    return *this;
}

// Open the store and make sure the table exists. A file that is not a SQLite
// database is left alone; the model then runs from defaults.
void PerformanceModel::open_store() {
    if (!db_open(db_, config_.store_path)) {
        std::cerr << "[store] cannot open '" << config_.store_path << "', using defaults\n";
        return;
    }
    if (!db_init(db_)) {
        std::cerr << "[store] '" << config_.store_path << "' is not a usable parameter store, using defaults\n";
        db_close(db_);
        db_ = nullptr;
    }
}

// --- Pending edits ----------------------------------------------------------

void PerformanceModel::update_pending_parameters(const std::map<std::string, int>& params) {
    for (const auto& kv : params)
        apply_param_update(pending_, kv.first, kv.second);   // unknown names ignored
}

std::vector<Param> PerformanceModel::pending_changes() const {
    return changed_params(confirmed_, pending_);
}

// --- Confirmation and scoring -----------------------------------------------

std::optional<std::string> PerformanceModel::confirm_parameters() {
    std::vector<Param> changed = changed_params(confirmed_, pending_);
    if (changed.empty()) return std::nullopt;

    std::string log = change_log(confirmed_, pending_);
    for (Param p : changed)
        confirmed_.set(p, pending_.get(p));

    if (!save_parameters())
        std::cerr << "[model] confirmed parameters are kept in memory only\n";
    calculate_performance();
    return log;
}

double PerformanceModel::calculate_performance() {
    double score = confirmed_.weighted(config_.weights);
    series_.push_back(ScorePoint{ current_time_, score });
    ++current_time_;
    last_update_ = Clock::now();
    return score;
}

// --- Projections --------------------------------------------------------------

std::optional<double> PerformanceModel::current_score() const {
    if (series_.empty()) return std::nullopt;
    return series_.back().score;
}

PassFailBand PerformanceModel::predict_pass_fail() const {
    if (series_.empty()) return no_score_band();
    return classify_score(series_.back().score);
}

TrendBand PerformanceModel::predict_trend() const {
    std::optional<double> slope = trend_slope(series_, config_.trend_window);
    if (!slope) return no_trend_band();
    return classify_slope(*slope);
}

// --- Bulk import ----------------------------------------------------------------

ImportResult PerformanceModel::import_bulk_data(const std::string& path) {
    // Start a new history; the old one is not restored on failure.
    series_.clear();
    current_time_ = 0;
    last_update_.reset();

    // Readers check the whole file before the first row, so a structural
    // error replays nothing. confirmed_ is restored on any failure.
    const ParameterSet before = confirmed_;
    auto fail = [&](const std::string& reason) {
        confirmed_ = before;
        std::cerr << "[import] " << reason << "\n";
        return ImportResult{ false, "Import failed: " + reason };
    };

    ImportFormat format;
    if (!detect_import_format(path, format))
        return fail("unsupported file type '" + path + "' (expected .csv or .json)");

    try {
        std::string err;
        std::unique_ptr<RowReader> reader = open_row_reader(path, format, err);
        if (!reader) return fail(err);

        ImportRow row;
        for (;;) {
            RowStatus st = reader->next(row);
            if (st == RowStatus::End) break;
            if (st == RowStatus::Malformed) return fail(reader->error());

            confirmed_ = coerce_row(row, config_.default_value);
            calculate_performance();
        }
    }
    catch (const std::exception& e) {
        return fail(e.what());
    }

    if (!save_parameters())
        std::cerr << "[model] imported parameters are kept in memory only\n";
    return ImportResult{ true, "Successfully imported " + std::to_string(series_.size()) + " records" };
}

// --- Persistence ----------------------------------------------------------------

bool PerformanceModel::save_parameters() {
    if (!db_) {
        std::cerr << "[store] no parameter store, confirmed parameters not saved\n";
        return false;
    }
    if (!db_save_parameters(db_, confirmed_)) {
        std::cerr << "[store] failed to save parameters to '" << config_.store_path << "'\n";
        return false;
    }
    return true;
}

bool PerformanceModel::load_parameters() {
    if (!db_) return false;

    ParameterSet loaded = ParameterSet::filled(config_.default_value);
    if (!db_load_parameters(db_, loaded)) {
        std::cerr << "[store] failed to load parameters from '" << config_.store_path << "'\n";
        return false;
    }
    confirmed_ = loaded;
    pending_ = loaded;
    return true;
}

void PerformanceModel::shutdown() {
    if (!save_parameters())
        std::cerr << "[model] shutdown: latest parameters were not saved\n";
}
