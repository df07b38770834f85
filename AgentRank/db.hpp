#pragma once
#include <string>
#include <vector>
#include <sqlite3.h>
#include "models.hpp"
#include "services.hpp"   // for MetricSnapshot
#include "scorer.hpp"     // for ScoringConfig

/*
-------------------------------------------------------------------------------
 db.hpp — Public interface to the SQLite metric store
-------------------------------------------------------------------------------

This header declares all functions that interact with the SQLite database.
The ranking engine never calls these; the application loads a snapshot and
a weight regime here and hands plain values to the engine.

Design:
  - Each function returns `bool` to indicate success/failure and prints the
    SQLite error text to std::cerr on failure.
  - Weight regimes are stored next to the data so they can be revised
    without a rebuild. A loaded regime is validated before it is returned.

Usage convention:
  - Call `db_open` once at startup, then `db_init_and_seed`.
  - Use `db_load_snapshot` before each ranking session.
  - Always call `db_close` before exiting.
-------------------------------------------------------------------------------
*/

/// Opens (creates if not exists) the SQLite DB file at path.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr). Call once at shutdown.
void db_close(sqlite3* db);

/// Create tables if missing and insert the agency sample data and the
/// built-in weight regimes (only into empty tables). Safe to call on every startup.
bool db_init_and_seed(sqlite3* db);

/// Load agents, assignments and bookings inside one read transaction so the
/// three collections describe the same moment. Clears `out` first.
bool db_load_snapshot(sqlite3* db, MetricSnapshot& out);

// ==========================
// Weight regimes
// ==========================

/// Insert or replace a regime (settings and weights) under cfg.name.
/// Rejects (false) a config that fails validate_config.
bool db_save_scoring_config(sqlite3* db, const ScoringConfig& cfg);

/// Load the regime called `name`. False if missing, malformed or invalid;
/// the reason is printed to std::cerr.
bool db_load_scoring_config(sqlite3* db, const std::string& name, ScoringConfig& out);

/// Names of all stored regimes, alphabetical.
bool db_list_regimes(sqlite3* db, std::vector<std::string>& out);

// ==========================
// Counts (for dashboards/menus)
// ==========================

/// Simple struct with live counts from DB.
struct DbCounts {
    int agents = 0;
    int assignments = 0;
    int bookings = 0;
};

/// Populate `out` with counts of agents, assignments and bookings.
/// Returns true on success.
bool db_get_counts(sqlite3* db, DbCounts& out);
