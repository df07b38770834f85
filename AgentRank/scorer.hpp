#pragma once
#include <string>
#include <vector>
#include "models.hpp"
#include "normalizer.hpp"

/*
-------------------------------------------------------------------------------
 scorer.hpp — Weighted base score and cancellation penalty
-------------------------------------------------------------------------------
  base_score  = sum(weight_i * value_i) over the configured dimensions
  final_score = base_score * (1 - cancellation_rate)

Dimension values:
  Rating        overall agent rating (always present)
  LeadSource    lead_source_rating,   baseline_rating when absent
  Destination   destination_rating,   baseline_rating when absent
  Communication communication_rating, baseline_rating when absent
  ServiceYears  normalized years_of_service, clamped to [1, 5]
  TripVolume    normalized confirmed_bookings, clamped to [1, 5]

A ScoringConfig is a plain value: build it, run validate_config once, and pass
it to every request. Several configs may live side by side.
-------------------------------------------------------------------------------
*/

constexpr double kRatingMin = 1.0;
constexpr double kRatingMax = 5.0;
constexpr double kWeightSumTolerance = 1e-9;

enum class ScoreDimension {
    Rating,
    LeadSource,
    Destination,
    Communication,
    ServiceYears,
    TripVolume
};

/// Stable lower_snake name, as stored in the scoring_weights table.
const char* to_string(ScoreDimension d);

/// Inverse of to_string. Returns false for an unknown name.
bool parse_dimension(const std::string& name, ScoreDimension& out);

struct WeightEntry {
    ScoreDimension dimension;
    double weight;
};

// Where the trip volume domain comes from
enum class VolumeDomainMode {
    Observed,   // min/max confirmed bookings across the agents being ranked
    Static      // trip_volume_domain as configured
};

struct ScoringConfig {
    std::string name{ "custom" };
    std::vector<WeightEntry> weights;
    double baseline_rating{ 3.0 };
    NormalizationDomain service_years_domain{ 0.0, 20.0 };
    VolumeDomainMode trip_volume_mode{ VolumeDomainMode::Observed };
    NormalizationDomain trip_volume_domain{ 0.0, 10.0 };
    double tie_tolerance{ 1e-9 };
};

/// Throws ConfigurationError when:
///   - the weight list is empty, or a weight is negative or not finite
///   - the weights do not sum to 1.0 +/- kWeightSumTolerance
///   - a dimension appears more than once (one input signal per weight)
///   - baseline_rating is outside [kRatingMin, kRatingMax]
///   - the service years domain, or a Static trip volume domain, has max <= min
///   - tie_tolerance is negative
void validate_config(const ScoringConfig& cfg);

/// Current regime: tenure weight removed.
ScoringConfig refined_config();

/// Pre-refinement regime with a tenure weight over a [2, 18] year domain.
ScoringConfig legacy_config();

/// Value of one dimension for an already normalized agent.
double dimension_value(const ScoredAgent& s, ScoreDimension d, const ScoringConfig& cfg);

/// Normalize, compute base and final scores. Output order follows the input;
/// rank is left at 0. `cfg` must have passed validate_config.
std::vector<ScoredAgent> score_agents(
    const std::vector<AgentPerformanceProfile>& profiles, const ScoringConfig& cfg);
