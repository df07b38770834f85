#pragma once
#include <vector>
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 aggregator.hpp — Per-agent performance conditioned on one customer
-------------------------------------------------------------------------------
Produces exactly one AgentPerformanceProfile per agent in the snapshot, in
snapshot order, including agents without any history.

Conditional ratings (lead source, communication method, destination) are the
mean of the agent's overall rating over the assignments that match the
request; with no match the field stays empty. Booking counts and the
cancellation rate cover all of the agent's bookings, matched or not.

Expects a snapshot that has passed check_integrity; records referring to
unknown agents or assignments are ignored here rather than counted.
-------------------------------------------------------------------------------
*/

std::vector<AgentPerformanceProfile> aggregate_performance(
    const CustomerProfile& customer, const MetricSnapshot& data);

/// confirmed + cancelled <= total and cancellation_rate in [0, 1] for every
/// profile, else DataIntegrityError.
void require_consistent_counts(const std::vector<AgentPerformanceProfile>& profiles);
