#pragma once
#include <string>
#include "services.hpp"
#include "scorer.hpp"

/*
-------------------------------------------------------------------------------
 engine.hpp — One ranking request, end to end
-------------------------------------------------------------------------------
  profile + snapshot
    -> validate_profile        (ValidationError, nothing else runs)
    -> validate_config         (ConfigurationError, nothing else runs)
    -> check_integrity         (bad records skipped and reported)
    -> aggregate_performance   (one profile per agent, history or not)
    -> score_agents            (normalize, base, final)
    -> rank_agents             (final desc, agent_id asc, 1..N)
    -> RankingResult stamped with the request and the current UTC time

The call reads only its arguments, so concurrent requests may share a
snapshot and a config. Regimes loaded through db_load_scoring_config are
already validated; the check here covers configs built in code.
-------------------------------------------------------------------------------
*/

RankingResult rank_for_customer(const CustomerProfile& customer,
    const MetricSnapshot& snapshot,
    const ScoringConfig& cfg);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp();
