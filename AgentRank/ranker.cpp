#include "ranker.hpp"
#include <algorithm>

void rank_agents(std::vector<ScoredAgent>& agents, double tie_tolerance) {
    auto by_id = [](const ScoredAgent& a, const ScoredAgent& b) {
        return a.profile.agent_id < b.profile.agent_id;
    };

    // exact order first, agent_id breaks exact ties
    std::sort(agents.begin(), agents.end(), [&](const ScoredAgent& a, const ScoredAgent& b) {
        if (a.final_score != b.final_score) return a.final_score > b.final_score;
        return by_id(a, b);
    });

    // runs within tolerance of their leader count as one tie
    for (auto first = agents.begin(); first != agents.end();) {
        const double lead = first->final_score;
        auto last = std::find_if(first, agents.end(),
            [&](const ScoredAgent& s) { return lead - s.final_score > tie_tolerance; });
        std::sort(first, last, by_id);
        first = last;
    }

    int rank = 1;
    for (auto& s : agents) s.rank = rank++;
}
