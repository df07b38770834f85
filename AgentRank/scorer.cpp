#include "scorer.hpp"
#include "errors.hpp"
#include <cmath>
#include <set>
#include <utility>

const char* to_string(ScoreDimension d) {
    switch (d) {
    case ScoreDimension::Rating:        return "rating";
    case ScoreDimension::LeadSource:    return "lead_source";
    case ScoreDimension::Destination:   return "destination";
    case ScoreDimension::Communication: return "communication";
    case ScoreDimension::ServiceYears:  return "service_years";
    case ScoreDimension::TripVolume:    return "trip_volume";
    }
    return "unknown";
}

bool parse_dimension(const std::string& name, ScoreDimension& out) {
    static const ScoreDimension all[] = {
        ScoreDimension::Rating, ScoreDimension::LeadSource, ScoreDimension::Destination,
        ScoreDimension::Communication, ScoreDimension::ServiceYears, ScoreDimension::TripVolume };
    for (ScoreDimension d : all) {
        if (name == to_string(d)) { out = d; return true; }
    }
    return false;
}

void validate_config(const ScoringConfig& cfg) {
    const std::string who = "weight regime '" + cfg.name + "': ";

    if (cfg.weights.empty())
        throw ConfigurationError(who + "no weights configured");

    std::set<ScoreDimension> seen;
    double sum = 0.0;
    for (const auto& w : cfg.weights) {
        if (!std::isfinite(w.weight) || w.weight < 0.0)
            throw ConfigurationError(who + "weight for " + to_string(w.dimension)
                + " must be a non-negative number");
        if (!seen.insert(w.dimension).second)
            throw ConfigurationError(who + to_string(w.dimension)
                + " is weighted more than once");
        sum += w.weight;
    }
    if (std::fabs(sum - 1.0) > kWeightSumTolerance)
        throw ConfigurationError(who + "weights sum to " + std::to_string(sum) + ", expected 1.0");

    if (!(cfg.baseline_rating >= kRatingMin && cfg.baseline_rating <= kRatingMax))
        throw ConfigurationError(who + "baseline rating must lie on the 1-5 rating scale");

    require_valid_domain(cfg.service_years_domain, "service years");
    if (cfg.trip_volume_mode == VolumeDomainMode::Static)
        require_valid_domain(cfg.trip_volume_domain, "trip volume");

    if (!(cfg.tie_tolerance >= 0.0))
        throw ConfigurationError(who + "tie tolerance must be >= 0");
}

ScoringConfig refined_config() {
    ScoringConfig c;
    c.name = "refined";
    c.weights = {
        { ScoreDimension::Rating,        0.30 },
        { ScoreDimension::LeadSource,    0.20 },
        { ScoreDimension::Destination,   0.20 },
        { ScoreDimension::Communication, 0.10 },
        { ScoreDimension::TripVolume,    0.20 },
    };
    return c;
}

ScoringConfig legacy_config() {
    ScoringConfig c;
    c.name = "legacy";
    c.weights = {
        { ScoreDimension::Rating,        0.25 },
        { ScoreDimension::LeadSource,    0.15 },
        { ScoreDimension::Destination,   0.15 },
        { ScoreDimension::Communication, 0.10 },
        { ScoreDimension::ServiceYears,  0.15 },
        { ScoreDimension::TripVolume,    0.20 },
    };
    c.service_years_domain = { 2.0, 18.0 };
    return c;
}

double dimension_value(const ScoredAgent& s, ScoreDimension d, const ScoringConfig& cfg) {
    const auto& p = s.profile;
    switch (d) {
    case ScoreDimension::Rating:        return p.rating;
    case ScoreDimension::LeadSource:    return p.lead_source_rating.value_or(cfg.baseline_rating);
    case ScoreDimension::Destination:   return p.destination_rating.value_or(cfg.baseline_rating);
    case ScoreDimension::Communication: return p.communication_rating.value_or(cfg.baseline_rating);
    case ScoreDimension::ServiceYears:  return s.normalized_service_years;
    case ScoreDimension::TripVolume:    return s.normalized_trip_volume;
    }
    return 0.0;
}

std::vector<ScoredAgent> score_agents(
    const std::vector<AgentPerformanceProfile>& profiles, const ScoringConfig& cfg) {
    const NormalizationDomain volume = (cfg.trip_volume_mode == VolumeDomainMode::Observed)
        ? observed_volume_domain(profiles)
        : cfg.trip_volume_domain;

    std::vector<ScoredAgent> out;
    out.reserve(profiles.size());
    for (const auto& p : profiles) {
        ScoredAgent s;
        s.profile = p;
        s.normalized_service_years = normalize(p.years_of_service, cfg.service_years_domain);
        s.normalized_trip_volume = normalize(p.confirmed_bookings, volume);

        double base = 0.0;
        for (const auto& w : cfg.weights)
            base += w.weight * dimension_value(s, w.dimension, cfg);
        s.base_score = base;
        s.final_score = base * (1.0 - p.cancellation_rate);
        out.push_back(std::move(s));
    }
    return out;
}
