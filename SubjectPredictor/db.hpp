#pragma once
#include <string>
#include "sqlite3.h"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite parameter store
-------------------------------------------------------------------------------

This header declares the functions that keep the confirmed parameter set in
SQLite. The store is a flat key-value table:

    parameters(name TEXT PRIMARY KEY, value INTEGER NOT NULL)

with one row per recognized parameter.

Design:
  - Each function returns `bool` to indicate success/failure and prints the
    SQLite error text to stderr.
  - Writes always replace the full set inside one transaction, so a failed
    save leaves the previous set in place.
  - Reads are tolerant: unknown names are skipped, missing names keep the
    caller's value.

Usage convention:
  - Call `db_open` once at startup, then `db_init`.
  - Use `db_load_parameters` to read the confirmed set after opening.
  - Always call `db_close` before exiting.
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr). Call once at shutdown.
void db_close(sqlite3* db);

/// Create the parameters table if missing. Safe to call on every startup.
/// Fails on a file that is not a SQLite database.
bool db_init(sqlite3* db);

/// Overwrite each parameter of `out` that has a row in the store (values are
/// clamped). Parameters without a row keep their current value.
bool db_load_parameters(sqlite3* db, ParameterSet& out);

/// Replace the stored set with `params` (all five rows, one transaction).
bool db_save_parameters(sqlite3* db, const ParameterSet& params);

/// Number of rows in the parameters table.
bool db_count_parameters(sqlite3* db, int& out);
