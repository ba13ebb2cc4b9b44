#pragma once
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

struct sqlite3;

/*
-------------------------------------------------------------------------------
 model.hpp — Subject performance model
-------------------------------------------------------------------------------
Owns the parameter state, the score series and the connection to the
parameter store.

State
  - confirmed : authoritative values, persisted, used for scoring.
  - pending   : in-progress edits from the front end, never persisted.
  - series    : one ScorePoint per confirmation or imported row.

Data flow
  - Front end edits pending (set_pending / update_pending_parameters).
  - confirm_parameters() copies the differing values into confirmed, saves
    the full set, and scores exactly once.
  - import_bulk_data() throws the series away and rebuilds it from a file,
    one point per row.

Error handling
  - Store problems (cannot open, corrupt file, failed write) are reported on
    stderr and never stop the model; it keeps working from memory.
  - import_bulk_data() reports every failure through ImportResult.
-------------------------------------------------------------------------------
*/

class PerformanceModel {
public:
    using Clock = std::chrono::system_clock;

    /// Opens the store named in `config` and loads the confirmed set from it
    /// (defaults for anything missing). pending starts equal to confirmed.
    explicit PerformanceModel(ModelConfig config = ModelConfig{});
    ~PerformanceModel();

    PerformanceModel(const PerformanceModel&) = delete;
    PerformanceModel& operator=(const PerformanceModel&) = delete;
    PerformanceModel(PerformanceModel&& other) noexcept;
    PerformanceModel& operator=(PerformanceModel&& other) noexcept;

    // ==========================
    // Pending edits
    // ==========================

    int get_pending(Param p) const { return pending_.get(p); }
    void set_pending(Param p, int value) { pending_.set(p, value); }

    /// Overwrite pending values by name; unknown names are ignored.
    void update_pending_parameters(const std::map<std::string, int>& params);

    /// Parameters whose pending value differs from the confirmed one.
    std::vector<Param> pending_changes() const;

    // ==========================
    // Confirmation and scoring
    // ==========================

    /// Commit pending edits. Returns the "name: old -> new" change log, or
    /// nullopt when nothing differs (no save, no new point in that case).
    std::optional<std::string> confirm_parameters();

    /// Score the confirmed set, append it to the series and return it.
    double calculate_performance();

    // ==========================
    // Read-only projections
    // ==========================

    PassFailBand predict_pass_fail() const;
    TrendBand predict_trend() const;

    std::optional<double> current_score() const;
    const std::vector<ScorePoint>& series() const { return series_; }
    const ParameterSet& confirmed() const { return confirmed_; }
    const ParameterSet& pending() const { return pending_; }
    std::optional<Clock::time_point> last_update() const { return last_update_; }
    const ModelConfig& config() const { return config_; }
    bool store_available() const { return db_ != nullptr; }

    // ==========================
    // Bulk import
    // ==========================

    /// Replace the series with one point per row of a .csv / .json file.
    /// Destructive: the old series is cleared first and not restored on
    /// failure. confirmed and the store change only on success.
    ImportResult import_bulk_data(const std::string& path);

    // ==========================
    // Persistence
    // ==========================

    /// Write the confirmed set to the store. False if the write failed.
    bool save_parameters();

    /// Re-read the confirmed set from the store into confirmed and pending.
    bool load_parameters();

    /// Flush confirmed parameters before the front end exits.
    void shutdown();

private:
    void open_store();

    ModelConfig config_;
    sqlite3* db_ = nullptr;
    ParameterSet confirmed_;
    ParameterSet pending_;
    std::vector<ScorePoint> series_;
    int current_time_ = 0;
    std::optional<Clock::time_point> last_update_;
};
