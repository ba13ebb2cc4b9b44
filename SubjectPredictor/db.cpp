/*
-------------------------------------------------------------------------------
 db.cpp — SQLite parameter store for the Subject Pass/Fail Predictor
-------------------------------------------------------------------------------
Purpose
  - Implements all database I/O for the confirmed parameter set using SQLite3.
  - Exposes small, purpose-specific functions called by the performance model.

Design notes
  - Each function returns a bool for success/failure. The model keeps its
    in-memory state either way; a failed save only loses durability.
  - Writes use prepared statements with bound parameters.
  - db_save_parameters wraps DELETE + INSERTs in BEGIN/COMMIT and rolls back
    on the first failed statement, so the table always holds a complete set.

Caveats
  - Values are read with sqlite3_column_int. A text or real value written by
    another tool is converted by SQLite's usual rules before clamping.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "helpers.hpp"
#include <iostream>

// Small helper to run a raw SQL string with sqlite3_exec and report errors.
static bool exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (err) { std::cerr << "SQL error: " << err << "\n"; sqlite3_free(err); }
        return false;
    }
    return true;
}

// Open (or create) the SQLite database file at `path`. Returns false if the
// DB cannot be opened.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        // sqlite3_open hands back a handle even on failure; it still has to be closed.
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

// Create the table if it doesn't exist yet. No seeding: a fresh store simply
// has no rows and the model keeps its defaults.
bool db_init(sqlite3* db) {
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS parameters ("
        "  name  TEXT PRIMARY KEY,"
        "  value INTEGER NOT NULL"
        ");";
    return exec_sql(db, ddl);
}

// Read every stored row into `out`. Rows with unknown names are ignored;
// values are clamped as 64-bit integers before narrowing.
bool db_load_parameters(sqlite3* db, ParameterSet& out) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT name,value FROM parameters;", -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
        sqlite3_finalize(st);
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        Param p;
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(st, 0));
        if (!name || !find_param(name, p)) continue;
        if (sqlite3_column_type(st, 1) == SQLITE_NULL) continue;
        sqlite3_int64 v = sqlite3_column_int64(st, 1);
        if (v < PARAM_MIN) v = PARAM_MIN;
        if (v > PARAM_MAX) v = PARAM_MAX;
        out.set(p, static_cast<int>(v));
    }
    bool ok = (rc == SQLITE_DONE);
    if (!ok) std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
    sqlite3_finalize(st);
    return ok;
}

// Replace all rows with the given set. One transaction: either every row is
// written or the previous contents stay.
bool db_save_parameters(sqlite3* db, const ParameterSet& params) {
    if (!exec_sql(db, "BEGIN IMMEDIATE;")) return false;

    bool ok = exec_sql(db, "DELETE FROM parameters;");

    sqlite3_stmt* st = nullptr;
    if (ok && sqlite3_prepare_v2(db, "INSERT INTO parameters(name,value) VALUES(?,?);", -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
        ok = false;
    }
    for (Param p : ALL_PARAMS) {
        if (!ok) break;
        sqlite3_bind_text(st, 1, param_name(p), -1, SQLITE_STATIC);
        sqlite3_bind_int(st, 2, params.get(p));
        if (sqlite3_step(st) != SQLITE_DONE) {
            std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
            ok = false;
        }
        sqlite3_reset(st);
    }
    sqlite3_finalize(st);

    if (!ok) {
        if (!exec_sql(db, "ROLLBACK;"))
            std::cerr << "[store] rollback failed, store may be locked until close\n";
        return false;
    }
    return exec_sql(db, "COMMIT;");
}

// Row count, used by tests and diagnostics.
bool db_count_parameters(sqlite3* db, int& out) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM parameters;", -1, &st, nullptr) != SQLITE_OK) {
        sqlite3_finalize(st);
        return false;
    }

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out = sqlite3_column_int(st, 0);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok;
}
