#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

#include "db.hpp"
#include "engine.hpp"
#include "helpers.hpp"
#include "fixtures.hpp"

static bool exec(sqlite3* db, const char* sql) {
  return sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK;
}

int main() {
  std::printf("Starting SQLite store tests...\n");

  sqlite3* db = nullptr;
  assert(db_open(db, ":memory:"));
  assert(db_init_and_seed(db));

  {
    std::printf("Test 1: Seed data and idempotent init... ");
    DbCounts c;
    assert(db_get_counts(db, c));
    assert(c.agents == 6 && c.assignments == 13 && c.bookings == 12);

    assert(db_init_and_seed(db));
    DbCounts again;
    assert(db_get_counts(db, again));
    assert(again.agents == c.agents && again.assignments == c.assignments
           && again.bookings == c.bookings);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 2: Snapshot load... ");
    MetricSnapshot s;
    assert(db_load_snapshot(db, s));
    assert(s.agents.size() == 6);
    assert(s.assignments.size() == 13);
    assert(s.bookings.size() == 12);
    assert(s.agents[0].agent_id == 1 && s.agents[0].name == "Ava Stone");
    assert(eq(s.agents[0].average_customer_service_rating, 4.5));
    assert(find_booking_for(s, 7) == nullptr);
    assert(check_integrity(s).issues.empty());

    // reloading replaces rather than appends
    assert(db_load_snapshot(db, s));
    assert(s.agents.size() == 6);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 3: Foreign keys keep the store consistent... ");
    assert(!exec(db, "INSERT INTO assignments(assignment_id,agent_id,customer_name,lead_source,"
                     "communication_method) VALUES(100,99,'Ghost','Organic','Text');"));
    assert(!exec(db, "INSERT INTO bookings(booking_id,assignment_id,destination,booking_status) "
                     "VALUES(100,1,'Mars','Confirmed');"));   // assignment 1 already booked
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 4: Built-in regimes are stored... ");
    std::vector<std::string> names;
    assert(db_list_regimes(db, names));
    assert(names.size() == 2 && names[0] == "legacy" && names[1] == "refined");

    ScoringConfig cfg;
    assert(db_load_scoring_config(db, "legacy", cfg));
    const auto expected = legacy_config();
    assert(cfg.name == "legacy");
    assert(cfg.weights.size() == expected.weights.size());
    for (std::size_t i = 0; i < cfg.weights.size(); ++i) {
      assert(cfg.weights[i].dimension == expected.weights[i].dimension);
      assert(eq(cfg.weights[i].weight, expected.weights[i].weight));
    }
    assert(eq(cfg.service_years_domain.min, 2.0));
    assert(eq(cfg.service_years_domain.max, 18.0));
    assert(cfg.trip_volume_mode == VolumeDomainMode::Observed);

    ScoringConfig missing;
    assert(!db_load_scoring_config(db, "nope", missing));
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 5: Custom regime save and reload... ");
    ScoringConfig c;
    c.name = "ratings_only";
    c.weights = {{ScoreDimension::Rating, 0.5}, {ScoreDimension::Destination, 0.5}};
    c.trip_volume_mode = VolumeDomainMode::Static;
    c.trip_volume_domain = {0.0, 5.0};
    c.baseline_rating = 2.5;
    assert(db_save_scoring_config(db, c));

    // overwrite with fewer dimensions
    c.weights = {{ScoreDimension::Rating, 1.0}};
    assert(db_save_scoring_config(db, c));

    ScoringConfig back;
    assert(db_load_scoring_config(db, "ratings_only", back));
    assert(back.weights.size() == 1);
    assert(back.weights[0].dimension == ScoreDimension::Rating);
    assert(back.trip_volume_mode == VolumeDomainMode::Static);
    assert(eq(back.trip_volume_domain.max, 5.0));
    assert(eq(back.baseline_rating, 2.5));
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 6: Invalid regimes are never handed out... ");
    ScoringConfig bad = refined_config();
    bad.name = "bad";
    bad.weights[0].weight = 0.9;
    assert(!db_save_scoring_config(db, bad));

    // edited behind our back: sum drifts, then an unknown dimension appears
    assert(exec(db, "UPDATE scoring_weights SET weight=0.5 WHERE regime='ratings_only';"));
    ScoringConfig out;
    assert(!db_load_scoring_config(db, "ratings_only", out));

    assert(exec(db, "UPDATE scoring_weights SET weight=1.0 WHERE regime='ratings_only';"));
    assert(exec(db, "INSERT INTO scoring_weights(regime,dimension,weight) "
                    "VALUES('ratings_only','department',0.0);"));
    assert(!db_load_scoring_config(db, "ratings_only", out));
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 7: Ranking against the seeded store... ");
    MetricSnapshot s;
    assert(db_load_snapshot(db, s));
    ScoringConfig cfg;
    assert(db_load_scoring_config(db, "refined", cfg));
    auto r = rank_for_customer(sarah_johnson(), s, cfg);
    assert(r.agents.size() == 6);
    bool saw_new_hire = false;
    for (std::size_t i = 0; i < r.agents.size(); ++i) {
      assert(r.agents[i].rank == static_cast<int>(i) + 1);
      if (r.agents[i].profile.agent_id == 6) saw_new_hire = true;
    }
    assert(saw_new_hire);
    std::printf("PASSED\n");
  }

  db_close(db);

  {
    std::printf("Test 8: A read failing after the first row is an error, not the end of data... ");
    sqlite3* odd = nullptr;
    assert(db_open(odd, ":memory:"));
    // abs() of the smallest 64-bit integer raises "integer overflow" at step
    // time, here on the second row only.
    assert(exec(odd,
      "CREATE TABLE agent_rows(agent_id INTEGER, name TEXT, department_name TEXT,"
      "  years_of_service INTEGER);"
      "INSERT INTO agent_rows VALUES(1,'Ava Stone','Sales',10),(2,'Ben Ortiz','Sales',3),"
      "  (3,'Cleo Park','Luxury Voyages',15);"
      "CREATE VIEW agents AS SELECT agent_id, name, department_name,"
      "  CASE WHEN agent_id = 2 THEN abs(agent_id - 9223372036854775807 - 3) ELSE 4.0 END"
      "    AS average_customer_service_rating,"
      "  years_of_service FROM agent_rows;"
      "CREATE TABLE assignments(assignment_id INTEGER, agent_id INTEGER, customer_name TEXT,"
      "  lead_source TEXT, communication_method TEXT, launch_location TEXT);"
      "CREATE TABLE bookings(booking_id INTEGER, assignment_id INTEGER, destination TEXT,"
      "  booking_status TEXT);"));

    MetricSnapshot s;
    assert(!db_load_snapshot(odd, s));
    assert(s.agents.empty() && s.assignments.empty() && s.bookings.empty());

    assert(exec(odd,
      "CREATE TABLE regime_rows(n INTEGER);"
      "INSERT INTO regime_rows VALUES(1),(2),(3);"
      "CREATE VIEW scoring_regimes AS SELECT"
      "  CASE WHEN n = 2 THEN abs(n - 9223372036854775807 - 3) ELSE 'r' || n END AS regime"
      "  FROM regime_rows;"));
    std::vector<std::string> names;
    assert(!db_list_regimes(odd, names));
    assert(names.empty());
    db_close(odd);
    std::printf("PASSED\n");
  }

  std::printf("All SQLite store tests passed.\n");
  return 0;
}
