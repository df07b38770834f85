#pragma once
#include <vector>
#include "models.hpp"

/// Sort by final_score descending and number the result 1..N.
/// Scores within `tie_tolerance` of each other are ties and fall back to
/// agent_id ascending. Nobody is dropped.
void rank_agents(std::vector<ScoredAgent>& agents, double tie_tolerance = 1e-9);
