#include <cassert>
#include <cstdio>
#include <string>

#include "engine.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

static void same_fields(const ScoredAgent& a, const ScoredAgent& b) {
  const auto& p = a.profile;
  const auto& q = b.profile;
  assert(p.agent_id == q.agent_id);
  assert(p.lead_source_rating == q.lead_source_rating);
  assert(p.destination_rating == q.destination_rating);
  assert(p.communication_rating == q.communication_rating);
  assert(p.total_bookings == q.total_bookings);
  assert(p.confirmed_bookings == q.confirmed_bookings);
  assert(p.cancelled_bookings == q.cancelled_bookings);
  assert(p.cancellation_rate == q.cancellation_rate);
  assert(a.normalized_service_years == b.normalized_service_years);
  assert(a.normalized_trip_volume == b.normalized_trip_volume);
  assert(a.base_score == b.base_score);
  assert(a.final_score == b.final_score);
  assert(a.rank == b.rank);
}

int main() {
  std::printf("Starting engine tests...\n");

  const auto data = three_agent_fixture();
  const auto cfg = refined_config();
  validate_config(cfg);

  {
    std::printf("Test 1: Golden ranking for Sarah Johnson... ");
    auto r = rank_for_customer(sarah_johnson(), data, cfg);
    assert(r.agents.size() == 3);
    assert(r.agents[0].profile.agent_id == 2 && r.agents[0].rank == 1);
    assert(r.agents[1].profile.agent_id == 1 && r.agents[1].rank == 2);
    assert(r.agents[2].profile.agent_id == 3 && r.agents[2].rank == 3);
    assert(eq(r.agents[0].final_score, 4.2));
    assert(eq(r.agents[1].final_score, 4.6 * 2.0 / 3.0));
    assert(eq(r.agents[2].final_score, 2.8));
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 2: Response echoes the request... ");
    auto r = rank_for_customer(sarah_johnson(), data, cfg);
    assert(r.customer.customer_name == "Sarah Johnson");
    assert(r.customer.destination == "Europa");
    assert(r.customer.launch_location == "Kennedy Space Center");
    assert(r.regime == "refined");
    assert(r.computed_at.size() == 20 && r.computed_at.back() == 'Z');
    assert(r.integrity_issues.empty());
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 3: Same input, same ranking... ");
    auto a = rank_for_customer(sarah_johnson(), data, cfg);
    auto b = rank_for_customer(sarah_johnson(), data, cfg);
    assert(a.agents.size() == b.agents.size());
    for (std::size_t i = 0; i < a.agents.size(); ++i) same_fields(a.agents[i], b.agents[i]);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 4: Unknown destination fails before aggregation... ");
    auto p = sarah_johnson();
    p.destination = "Pluto";
    bool threw = false;
    try { rank_for_customer(p, data, cfg); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 5: Agent without history is ranked, not dropped... ");
    auto d = data;
    d.agents.push_back({4, "Farah Qureshi", "Family Expeditions", 4.2, 0});
    auto r = rank_for_customer(sarah_johnson(), d, cfg);
    assert(r.agents.size() == 4);
    const ScoredAgent* farah = nullptr;
    for (const auto& s : r.agents)
      if (s.profile.agent_id == 4) farah = &s;
    assert(farah != nullptr);
    assert(!farah->profile.lead_source_rating);
    assert(!farah->profile.destination_rating);
    assert(!farah->profile.communication_rating);
    assert(farah->profile.cancellation_rate == 0.0);
    // 0.3*4.2 + 0.5*3.0 (baseline) + 0.2*1.0 (no confirmed trips)
    assert(eq(farah->base_score, 2.96));
    assert(farah->final_score == farah->base_score);
    assert(farah->rank == 4);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 6: Bad records are skipped and reported... ");
    auto d = data;
    d.assignments.push_back({50, 42, "Ghost", "Organic", "Phone Call", "Sydney Stellar Port"});
    auto r = rank_for_customer(sarah_johnson(), d, cfg);
    assert(r.integrity_issues.size() == 1);
    assert(r.agents.size() == 3);
    assert(r.agents[0].profile.agent_id == 2);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 7: Regimes coexist and rank differently... ");
    const auto legacy = legacy_config();
    validate_config(legacy);
    auto a = rank_for_customer(sarah_johnson(), data, cfg);
    auto b = rank_for_customer(sarah_johnson(), data, legacy);
    assert(a.agents[2].profile.agent_id == 3);
    // tenure lifts Cleo past Ava under the legacy weights
    assert(b.agents[0].profile.agent_id == 2);
    assert(b.agents[1].profile.agent_id == 3);
    assert(b.agents[2].profile.agent_id == 1);
    assert(b.regime == "legacy");
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 8: Output invariants... ");
    auto r = rank_for_customer(sarah_johnson(), data, cfg);
    for (std::size_t i = 0; i < r.agents.size(); ++i) {
      const auto& s = r.agents[i];
      assert(s.rank == static_cast<int>(i) + 1);
      if (i > 0) assert(r.agents[i - 1].final_score >= s.final_score);
      assert(s.profile.cancellation_rate >= 0.0 && s.profile.cancellation_rate <= 1.0);
      assert(s.final_score <= s.base_score);
    }
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 9: A bad weight regime is refused before anything is scored... ");
    auto rejected = [&](const ScoringConfig& c) {
      try { rank_for_customer(sarah_johnson(), data, c); }
      catch (const ConfigurationError&) { return true; }
      return false;
    };
    auto c = refined_config();
    for (auto& w : c.weights) w.weight *= 2.0;       // sums to 2.0
    assert(rejected(c));

    c = refined_config();
    c.weights.clear();
    assert(rejected(c));

    c = refined_config();
    c.trip_volume_mode = VolumeDomainMode::Static;
    c.trip_volume_domain = {4.0, 4.0};
    assert(rejected(c));

    // the profile is still checked first
    auto p = sarah_johnson();
    p.lead_source = "Referral";
    bool threw = false;
    try { rank_for_customer(p, data, c); } catch (const ValidationError&) { threw = true; }
    assert(threw);
    std::printf("PASSED\n");
  }

  {
    std::printf("Test 10: Long customer names are ranked and echoed... ");
    auto p = sarah_johnson();
    p.customer_name = std::string(81, 'S');
    auto r = rank_for_customer(p, data, cfg);
    assert(r.customer.customer_name.size() == 81);
    assert(r.agents.size() == 3 && r.agents[0].profile.agent_id == 2);
    std::printf("PASSED\n");
  }

  std::printf("All engine tests passed.\n");
  return 0;
}
