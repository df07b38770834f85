#include "normalizer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

NormalizationDomain make_domain(double min, double max, const char* what) {
    NormalizationDomain d{ min, max };
    require_valid_domain(d, what);
    return d;
}

void require_valid_domain(const NormalizationDomain& d, const char* what) {
    if (!std::isfinite(d.min) || !std::isfinite(d.max))
        throw ConfigurationError(std::string(what) + " domain bounds must be finite");
    if (!(d.max > d.min))
        throw ConfigurationError(std::string(what) + " domain needs max > min (got ["
            + std::to_string(d.min) + ", " + std::to_string(d.max) + "])");
}

double normalize(double value, const NormalizationDomain& d,
    double target_min, double target_max) {
    require_valid_domain(d, "normalization");
    const double raw = target_min
        + (value - d.min) * (target_max - target_min) / (d.max - d.min);
    return std::clamp(raw, target_min, target_max);
}

NormalizationDomain observed_volume_domain(const std::vector<AgentPerformanceProfile>& pool) {
    if (pool.empty()) return { 0.0, 1.0 };

    auto [lo, hi] = std::minmax_element(pool.begin(), pool.end(),
        [](const AgentPerformanceProfile& a, const AgentPerformanceProfile& b) {
            return a.confirmed_bookings < b.confirmed_bookings;
        });
    const double min = lo->confirmed_bookings;
    const double max = hi->confirmed_bookings;
    if (max > min) return { min, max };
    return { min, min + 1.0 };
}
