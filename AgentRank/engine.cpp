#include "engine.hpp"
#include "validation.hpp"
#include "helpers.hpp"
#include "aggregator.hpp"
#include "ranker.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

RankingResult rank_for_customer(const CustomerProfile& customer,
    const MetricSnapshot& snapshot,
    const ScoringConfig& cfg) {
    validate_profile(customer);
    validate_config(cfg);

    IntegrityReport integrity = check_integrity(snapshot);

    auto profiles = aggregate_performance(customer, integrity.clean);
    require_consistent_counts(profiles);

    RankingResult r;
    r.customer = customer;
    r.regime = cfg.name;
    r.agents = score_agents(profiles, cfg);
    rank_agents(r.agents, cfg.tie_tolerance);
    r.integrity_issues = std::move(integrity.issues);
    r.computed_at = utc_timestamp();
    return r;
}

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}
