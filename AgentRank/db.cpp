/*
-------------------------------------------------------------------------------
 db.cpp — SQLite metric store for the AgentRank console
-------------------------------------------------------------------------------
Purpose
  - Implements all database I/O for agents, assignments, bookings and the
    stored weight regimes using SQLite3.
  - Exposes small, purpose-specific functions called by the console layer.

Design notes
  - Each function returns a bool for success/failure and prints the SQLite
    error text on failure.
  - Foreign key cascades are enabled per-connection (PRAGMA foreign_keys=ON).
  - Writes use prepared statements with bound parameters.
  - Reads that stream many rows use sqlite3_prepare_v2 / sqlite3_step loops.
  - The snapshot load runs in one read transaction so bookings and
    assignments cannot drift apart between the three SELECTs.
  - Text columns may be NULL; col_text maps NULL to an empty string.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include "errors.hpp"
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

// Prepare or print why not.
static bool prepare(sqlite3* db, const char* sql, sqlite3_stmt*& st) {
    st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
        sqlite3_finalize(st);
        st = nullptr;
        return false;
    }
    return true;
}

// A step loop ends cleanly only on SQLITE_DONE; anything else is an error.
static bool rows_done(sqlite3* db, int rc) {
    if (rc == SQLITE_DONE) return true;
    std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
    return false;
}

static std::string col_text(sqlite3_stmt* st, int i) {
    const unsigned char* p = sqlite3_column_text(st, i);
    return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Open (or create) the SQLite database file at `path` and enable FK constraints
// for this connection. Returns false if the DB cannot be opened.
bool db_open(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    // Enforce FK constraints for this connection
    if (!exec_sql(db, "PRAGMA foreign_keys = ON;")) {
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null. Safe to call multiple times.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

// Create tables if they don't exist yet and seed sample data the first
// time the app runs. Safe to call on every startup.
bool db_init_and_seed(sqlite3* db) {
    // 1) Create tables (idempotent).
    const char* ddl =
        "PRAGMA foreign_keys = ON;"

        "CREATE TABLE IF NOT EXISTS agents ("
        "  agent_id        INTEGER PRIMARY KEY,"
        "  name            TEXT NOT NULL,"
        "  department_name TEXT,"
        "  average_customer_service_rating REAL NOT NULL"
        "    CHECK (average_customer_service_rating BETWEEN 1.0 AND 5.0),"
        "  years_of_service INTEGER NOT NULL DEFAULT 0 CHECK (years_of_service >= 0)"
        ");"

        "CREATE TABLE IF NOT EXISTS assignments ("
        "  assignment_id        INTEGER PRIMARY KEY,"
        "  agent_id             INTEGER NOT NULL,"
        "  customer_name        TEXT NOT NULL,"
        "  lead_source          TEXT NOT NULL,"
        "  communication_method TEXT NOT NULL,"
        "  launch_location      TEXT,"
        "  FOREIGN KEY (agent_id) REFERENCES agents(agent_id) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS bookings ("
        "  booking_id     INTEGER PRIMARY KEY,"
        "  assignment_id  INTEGER NOT NULL UNIQUE,"
        "  destination    TEXT NOT NULL,"
        "  booking_status TEXT NOT NULL,"
        "  FOREIGN KEY (assignment_id) REFERENCES assignments(assignment_id) ON DELETE CASCADE"
        ");"

        "CREATE TABLE IF NOT EXISTS scoring_regimes ("
        "  regime            TEXT PRIMARY KEY,"
        "  baseline_rating   REAL NOT NULL,"
        "  service_years_min REAL NOT NULL,"
        "  service_years_max REAL NOT NULL,"
        "  volume_mode       TEXT NOT NULL,"
        "  volume_min        REAL NOT NULL,"
        "  volume_max        REAL NOT NULL,"
        "  tie_tolerance     REAL NOT NULL"
        ");"

        "CREATE TABLE IF NOT EXISTS scoring_weights ("
        "  regime    TEXT NOT NULL,"
        "  dimension TEXT NOT NULL,"
        "  weight    REAL NOT NULL,"
        "  PRIMARY KEY (regime, dimension),"
        "  FOREIGN KEY (regime) REFERENCES scoring_regimes(regime) ON DELETE CASCADE"
        ");";
    if (!exec_sql(db, ddl)) return false;

    // 2) Seed only when tables are empty. A fast existence check per table.
    auto table_empty = [&](const char* table)->bool {
        sqlite3_stmt* st = nullptr;
        std::string q = std::string("SELECT 1 FROM ") + table + " LIMIT 1;";
        bool empty = true;
        if (sqlite3_prepare_v2(db, q.c_str(), -1, &st, nullptr) == SQLITE_OK) {
            if (sqlite3_step(st) == SQLITE_ROW) empty = false;
        }
        sqlite3_finalize(st);
        return empty;
        };

    if (table_empty("agents")) {
        const char* seed_agents =
            "INSERT INTO agents(agent_id,name,department_name,average_customer_service_rating,years_of_service) VALUES"
            "(1,'Ava Stone','Interplanetary Sales',4.5,10),"
            "(2,'Ben Ortiz','Interplanetary Sales',4.0,3),"
            "(3,'Cleo Park','Luxury Voyages',3.5,15),"
            "(4,'Dmitri Volkov','Luxury Voyages',4.8,1),"
            "(5,'Esi Mensah','Family Expeditions',3.9,7),"
            "(6,'Farah Qureshi','Family Expeditions',4.2,0);";
        if (!exec_sql(db, seed_agents)) return false;
    }

    if (table_empty("assignments")) {
        const char* seed_assignments =
            "INSERT INTO assignments(assignment_id,agent_id,customer_name,lead_source,communication_method,launch_location) VALUES"
            "(1,1,'Noah Reyes','Organic','Phone Call','Kennedy Space Center'),"
            "(2,1,'Mia Chen','Bought','Text','Tokyo Spaceport Terminal'),"
            "(3,1,'Liam Walsh','Organic','Text','London Ascension Platform'),"
            "(4,2,'Olivia Grant','Organic','Phone Call','Kennedy Space Center'),"
            "(5,2,'Ethan Brooks','Organic','Phone Call','New York Orbital Gateway'),"
            "(6,3,'Isla Novak','Bought','Text','Sydney Stellar Port'),"
            "(7,3,'Lucas Meyer','Bought','Phone Call','Dubai Interplanetary Hub'),"
            "(8,4,'Zara Haddad','Organic','Phone Call','Dubai Interplanetary Hub'),"
            "(9,4,'Kai Tanaka','Bought','Phone Call','Tokyo Spaceport Terminal'),"
            "(10,4,'Ruby Evans','Bought','Text','London Ascension Platform'),"
            "(11,5,'Omar Farouk','Organic','Text','Dallas-Fort Worth Launch Complex'),"
            "(12,5,'Chloe Martin','Bought','Text','Kennedy Space Center'),"
            "(13,5,'Jack Turner','Organic','Phone Call','Dallas-Fort Worth Launch Complex');";
        if (!exec_sql(db, seed_assignments)) return false;
    }

    if (table_empty("bookings")) {
        const char* seed_bookings =
            "INSERT INTO bookings(booking_id,assignment_id,destination,booking_status) VALUES"
            "(1,1,'Europa','Confirmed'),"
            "(2,2,'Mars','Cancelled'),"
            "(3,3,'Europa','Confirmed'),"
            "(4,4,'Europa','Confirmed'),"
            "(5,5,'Venus','Confirmed'),"
            "(6,6,'Titan','Confirmed'),"
            "(7,8,'Europa','Cancelled'),"
            "(8,9,'Ganymede','Cancelled'),"
            "(9,10,'Mars','Confirmed'),"
            "(10,11,'Mars','Confirmed'),"
            "(11,12,'Europa','Pending'),"
            "(12,13,'Titan','Confirmed');";
        if (!exec_sql(db, seed_bookings)) return false;
    }

    if (table_empty("scoring_regimes")) {
        if (!db_save_scoring_config(db, refined_config())) return false;
        if (!db_save_scoring_config(db, legacy_config())) return false;
    }
    return true;
}

// Read all three collections under one transaction.
bool db_load_snapshot(sqlite3* db, MetricSnapshot& out) {
    out.agents.clear();
    out.assignments.clear();
    out.bookings.clear();

    if (!exec_sql(db, "BEGIN;")) return false;

    bool ok = true;
    sqlite3_stmt* st = nullptr;
    int rc = SQLITE_DONE;

    if (ok && (ok = prepare(db,
        "SELECT agent_id,name,department_name,average_customer_service_rating,years_of_service "
        "FROM agents ORDER BY agent_id;", st))) {
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            AgentRecord a;
            a.agent_id = sqlite3_column_int(st, 0);
            a.name = col_text(st, 1);
            a.department_name = col_text(st, 2);
            a.average_customer_service_rating = sqlite3_column_double(st, 3);
            a.years_of_service = sqlite3_column_int(st, 4);
            out.agents.push_back(a);
        }
        ok = rows_done(db, rc);
        sqlite3_finalize(st);
    }

    if (ok && (ok = prepare(db,
        "SELECT assignment_id,agent_id,customer_name,lead_source,communication_method,launch_location "
        "FROM assignments ORDER BY assignment_id;", st))) {
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            AssignmentRecord a;
            a.assignment_id = sqlite3_column_int(st, 0);
            a.agent_id = sqlite3_column_int(st, 1);
            a.customer_name = col_text(st, 2);
            a.lead_source = col_text(st, 3);
            a.communication_method = col_text(st, 4);
            a.launch_location = col_text(st, 5);
            out.assignments.push_back(a);
        }
        ok = rows_done(db, rc);
        sqlite3_finalize(st);
    }

    if (ok && (ok = prepare(db,
        "SELECT booking_id,assignment_id,destination,booking_status "
        "FROM bookings ORDER BY booking_id;", st))) {
        while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
            BookingRecord b;
            b.booking_id = sqlite3_column_int(st, 0);
            b.assignment_id = sqlite3_column_int(st, 1);
            b.destination = col_text(st, 2);
            b.booking_status = col_text(st, 3);
            out.bookings.push_back(b);
        }
        ok = rows_done(db, rc);
        sqlite3_finalize(st);
    }

    if (!ok) {
        out.agents.clear();
        out.assignments.clear();
        out.bookings.clear();
    }
    if (!exec_sql(db, ok ? "COMMIT;" : "ROLLBACK;")) return false;
    return ok;
}

// Weight regimes --------------------------------------------------------------

bool db_save_scoring_config(sqlite3* db, const ScoringConfig& cfg) {
    try {
        validate_config(cfg);
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Refusing to store regime: " << e.what() << "\n";
        return false;
    }

    if (!exec_sql(db, "BEGIN;")) return false;

    bool ok = true;
    sqlite3_stmt* st = nullptr;

    // Old weights go first so a shrunken dimension list leaves nothing behind.
    if (ok && (ok = prepare(db, "DELETE FROM scoring_weights WHERE regime=?;", st))) {
        sqlite3_bind_text(st, 1, cfg.name.c_str(), -1, SQLITE_TRANSIENT);
        ok = sqlite3_step(st) == SQLITE_DONE;
        sqlite3_finalize(st);
    }

    if (ok && (ok = prepare(db,
        "INSERT OR REPLACE INTO scoring_regimes(regime,baseline_rating,service_years_min,"
        "service_years_max,volume_mode,volume_min,volume_max,tie_tolerance) "
        "VALUES(?,?,?,?,?,?,?,?);", st))) {
        const char* mode = cfg.trip_volume_mode == VolumeDomainMode::Static ? "static" : "observed";
        sqlite3_bind_text(st, 1, cfg.name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(st, 2, cfg.baseline_rating);
        sqlite3_bind_double(st, 3, cfg.service_years_domain.min);
        sqlite3_bind_double(st, 4, cfg.service_years_domain.max);
        sqlite3_bind_text(st, 5, mode, -1, SQLITE_STATIC);
        sqlite3_bind_double(st, 6, cfg.trip_volume_domain.min);
        sqlite3_bind_double(st, 7, cfg.trip_volume_domain.max);
        sqlite3_bind_double(st, 8, cfg.tie_tolerance);
        ok = sqlite3_step(st) == SQLITE_DONE;
        sqlite3_finalize(st);
    }

    if (ok && (ok = prepare(db,
        "INSERT INTO scoring_weights(regime,dimension,weight) VALUES(?,?,?);", st))) {
        for (const auto& w : cfg.weights) {
            sqlite3_bind_text(st, 1, cfg.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(st, 2, to_string(w.dimension), -1, SQLITE_STATIC);
            sqlite3_bind_double(st, 3, w.weight);
            if (sqlite3_step(st) != SQLITE_DONE) { ok = false; break; }
            sqlite3_reset(st);
        }
        sqlite3_finalize(st);
    }

    if (!ok) std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
    if (!exec_sql(db, ok ? "COMMIT;" : "ROLLBACK;")) return false;
    return ok;
}

bool db_load_scoring_config(sqlite3* db, const std::string& name, ScoringConfig& out) {
    ScoringConfig cfg;
    cfg.name = name;

    sqlite3_stmt* st = nullptr;
    if (!prepare(db,
        "SELECT baseline_rating,service_years_min,service_years_max,volume_mode,"
        "volume_min,volume_max,tie_tolerance FROM scoring_regimes WHERE regime=?;", st))
        return false;
    sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool found = false;
    std::string mode;
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        found = true;
        cfg.baseline_rating = sqlite3_column_double(st, 0);
        cfg.service_years_domain = { sqlite3_column_double(st, 1), sqlite3_column_double(st, 2) };
        mode = col_text(st, 3);
        cfg.trip_volume_domain = { sqlite3_column_double(st, 4), sqlite3_column_double(st, 5) };
        cfg.tie_tolerance = sqlite3_column_double(st, 6);
    }
    else if (!rows_done(db, rc)) {
        sqlite3_finalize(st);
        return false;
    }
    sqlite3_finalize(st);
    if (!found) { std::cerr << "Unknown weight regime '" << name << "'.\n"; return false; }

    if (mode == "observed") cfg.trip_volume_mode = VolumeDomainMode::Observed;
    else if (mode == "static") cfg.trip_volume_mode = VolumeDomainMode::Static;
    else { std::cerr << "Regime '" << name << "' has unknown volume mode '" << mode << "'.\n"; return false; }

    if (!prepare(db,
        "SELECT dimension,weight FROM scoring_weights WHERE regime=? ORDER BY rowid;", st))
        return false;
    sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool ok = true;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const std::string dim = col_text(st, 0);
        ScoreDimension d;
        if (!parse_dimension(dim, d)) {
            std::cerr << "Regime '" << name << "' has unknown dimension '" << dim << "'.\n";
            ok = false;
            break;
        }
        cfg.weights.push_back({ d, sqlite3_column_double(st, 1) });
    }
    if (ok) ok = rows_done(db, rc);
    sqlite3_finalize(st);
    if (!ok) return false;

    try {
        validate_config(cfg);
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Invalid regime: " << e.what() << "\n";
        return false;
    }
    out = cfg;
    return true;
}

bool db_list_regimes(sqlite3* db, std::vector<std::string>& out) {
    out.clear();
    sqlite3_stmt* st = nullptr;
    if (!prepare(db, "SELECT regime FROM scoring_regimes ORDER BY regime;", st)) return false;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(col_text(st, 0));
    const bool ok = rows_done(db, rc);
    sqlite3_finalize(st);
    if (!ok) out.clear();
    return ok;
}

// Quick counts for live dashboard/menu. One round-trip using scalar subqueries.
bool db_get_counts(sqlite3* db, DbCounts& out) {
    static const char* SQL =
        "SELECT "
        " (SELECT COUNT(*) FROM agents)      AS a, "
        " (SELECT COUNT(*) FROM assignments) AS s, "
        " (SELECT COUNT(*) FROM bookings)    AS b;";

    sqlite3_stmt* st = nullptr;
    if (!prepare(db, SQL, st)) return false;

    bool ok = false;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out.agents = sqlite3_column_int(st, 0);
        out.assignments = sqlite3_column_int(st, 1);
        out.bookings = sqlite3_column_int(st, 2);
        ok = true;
    }
    sqlite3_finalize(st);
    return ok;
}
