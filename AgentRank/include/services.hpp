#pragma once
#include <vector>
#include <iostream>
#include <iomanip>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - In-memory snapshot and console printers
-------------------------------------------------------------------------------
This header defines:
  - MetricSnapshot: a read-only copy of agents, assignments and bookings as
    they were when loaded from SQLite. One snapshot backs one or more
    ranking requests; nothing in the engine writes to it.
  - Small printing helpers the console UI uses (agents, ranking).

Design notes
  - The database remains the source of truth. Reload the snapshot to pick up
    changes; the engine only ever reads from the copy it is handed.
  - All output is written to std::cout to keep the UI minimal for the console.
-------------------------------------------------------------------------------
*/

// Consistent read-only view of the metric store
struct MetricSnapshot {
    std::vector<AgentRecord>      agents;
    std::vector<AssignmentRecord> assignments;
    std::vector<BookingRecord>    bookings;
};

// ==========================
// AGENTS
// ==========================

// Print a simple list of agents to stdout.
inline void show_agents(const MetricSnapshot& data) {
    if (data.agents.empty()) {
        std::cout << "No agents on file.\n";
        return;
    }
    std::cout << "--- ********************** ---\n";
    std::cout << "          View Agents         \n";
    std::cout << "--- ********************** ---\n";
    for (const auto& a : data.agents) {
        std::cout << a.agent_id << " - "
            << a.name << " - "
            << a.department_name << " - rating "
            << std::fixed << std::setprecision(1) << a.average_customer_service_rating
            << " - " << a.years_of_service << " yrs\n";
    }
    std::cout.unsetf(std::ios::floatfield);
}

// Assignment history is printed by show_history (helpers.hpp).

// ==========================
// RANKING
// ==========================

// Print a ranking response: request echo, timestamp and the ordered table.
inline void show_ranking(const RankingResult& r) {
    std::cout << "Customer: " << r.customer.customer_name
        << " | " << r.customer.communication_method
        << " | " << r.customer.lead_source
        << " | " << r.customer.destination
        << " | " << r.customer.launch_location << "\n";
    std::cout << "Computed at " << r.computed_at << " (weights: " << r.regime << ")\n";

    if (r.agents.empty()) { std::cout << "No agents to rank.\n"; return; }

    std::cout << std::left
        << std::setw(5) << "Rank" << std::setw(5) << "Id"
        << std::setw(20) << "Name" << std::setw(24) << "Department"
        << std::right
        << std::setw(7) << "Rating" << std::setw(7) << "Total"
        << std::setw(6) << "Conf" << std::setw(6) << "Canc"
        << std::setw(8) << "Cancel%" << std::setw(8) << "Base"
        << std::setw(8) << "Final" << "\n";

    std::cout << std::fixed;
    for (const auto& s : r.agents) {
        const auto& p = s.profile;
        std::cout << std::left
            << std::setw(5) << s.rank << std::setw(5) << p.agent_id
            << std::setw(20) << p.name.substr(0, 19)
            << std::setw(24) << p.department_name.substr(0, 23)
            << std::right << std::setprecision(1)
            << std::setw(7) << p.rating
            << std::setw(7) << p.total_bookings
            << std::setw(6) << p.confirmed_bookings
            << std::setw(6) << p.cancelled_bookings
            << std::setw(8) << p.cancellation_rate * 100.0
            << std::setprecision(3)
            << std::setw(8) << s.base_score
            << std::setw(8) << s.final_score << "\n";
    }
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);

    if (!r.integrity_issues.empty())
        std::cout << r.integrity_issues.size()
            << " record(s) excluded by the integrity check.\n";
}
