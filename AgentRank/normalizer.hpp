#pragma once
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 normalizer.hpp — Clamped linear mapping of raw metrics onto the 1..5 scale
-------------------------------------------------------------------------------
  raw        = target_min + (value - min) * (target_max - target_min) / (max - min)
  normalized = clamp(raw, target_min, target_max)

A value outside the domain still lands inside [target_min, target_max], so a
new hire with fewer years than the domain minimum scores exactly 1.0.
-------------------------------------------------------------------------------
*/

constexpr double kTargetMin = 1.0;
constexpr double kTargetMax = 5.0;

// Practical [min, max] range of a raw metric
struct NormalizationDomain {
    double min{ 0.0 };
    double max{ 1.0 };
};

/// Build a domain, throwing ConfigurationError unless max > min and both
/// bounds are finite. `what` names the metric in the error message.
NormalizationDomain make_domain(double min, double max, const char* what);

/// Throws ConfigurationError if `d` could not have come from make_domain.
void require_valid_domain(const NormalizationDomain& d, const char* what);

/// Map `value` from `d` onto [target_min, target_max] and clamp.
double normalize(double value, const NormalizationDomain& d,
    double target_min = kTargetMin, double target_max = kTargetMax);

/// Observed [min, max] of confirmed_bookings across the pool. An empty pool
/// or one where every agent has the same count yields the degenerate range
/// [m, m + 1], which sends everyone to target_min.
NormalizationDomain observed_volume_domain(const std::vector<AgentPerformanceProfile>& pool);
