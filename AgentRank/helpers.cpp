#include "helpers.hpp"
#include <iostream>
#include <algorithm>
#include <unordered_set>
#include <utility>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Lookups and integrity filtering over MetricSnapshot
-------------------------------------------------------------------------------
Lookups are linear scans; snapshot sizes are those of a single agency.
check_integrity builds hash sets of known keys once, so the pass stays
linear in the number of records.
-------------------------------------------------------------------------------
*/

const AgentRecord* find_agent(const MetricSnapshot& d, int agent_id) {
    for (const auto& a : d.agents)
        if (a.agent_id == agent_id) return &a;
    return nullptr;
}

const BookingRecord* find_booking_for(const MetricSnapshot& d, int assignment_id) {
    for (const auto& b : d.bookings)
        if (b.assignment_id == assignment_id) return &b;
    return nullptr;
}

void show_history(const MetricSnapshot& d, std::ostream& out) {
    if (d.assignments.empty()) {
        out << "No assignment history.\n";
        return;
    }
    for (const auto& as : d.assignments) {
        const AgentRecord* a = find_agent(d, as.agent_id);
        const BookingRecord* b = find_booking_for(d, as.assignment_id);
        out << "#" << as.assignment_id << " agent " << as.agent_id
            << " (" << (a ? a->name : "unknown") << ")"
            << " | " << as.customer_name
            << " | " << as.lead_source << " / " << as.communication_method;
        if (b)
            out << " -> " << b->destination << " (" << b->booking_status << ")";
        else
            out << " -> no booking";
        out << "\n";
    }
}

// Drop a record: remember why and say so on stderr.
static void note(std::vector<std::string>& issues, std::string msg) {
    std::cerr << "Data integrity: " << msg << "\n";
    issues.push_back(std::move(msg));
}

IntegrityReport check_integrity(const MetricSnapshot& d) {
    IntegrityReport r;
    r.clean = d;
    auto& c = r.clean;

    // agents: first row per id wins
    std::unordered_set<int> agent_ids;
    c.agents.erase(std::remove_if(c.agents.begin(), c.agents.end(),
        [&](const AgentRecord& a) {
            if (agent_ids.insert(a.agent_id).second) return false;
            note(r.issues, "duplicate agent " + std::to_string(a.agent_id) + " ignored");
            return true;
        }),
        c.agents.end());

    // assignments must point at a known agent
    std::unordered_set<int> assignment_ids;
    c.assignments.erase(std::remove_if(c.assignments.begin(), c.assignments.end(),
        [&](const AssignmentRecord& a) {
            if (!agent_ids.count(a.agent_id)) {
                note(r.issues, "assignment " + std::to_string(a.assignment_id)
                    + " references unknown agent " + std::to_string(a.agent_id));
                return true;
            }
            if (!assignment_ids.insert(a.assignment_id).second) {
                note(r.issues, "duplicate assignment " + std::to_string(a.assignment_id) + " ignored");
                return true;
            }
            return false;
        }),
        c.assignments.end());

    // bookings must point at a known assignment, at most one each
    std::unordered_set<int> booked;
    c.bookings.erase(std::remove_if(c.bookings.begin(), c.bookings.end(),
        [&](const BookingRecord& b) {
            if (!assignment_ids.count(b.assignment_id)) {
                note(r.issues, "booking " + std::to_string(b.booking_id)
                    + " references unknown assignment " + std::to_string(b.assignment_id));
                return true;
            }
            if (!booked.insert(b.assignment_id).second) {
                note(r.issues, "booking " + std::to_string(b.booking_id)
                    + " is a second booking for assignment " + std::to_string(b.assignment_id));
                return true;
            }
            return false;
        }),
        c.bookings.end());

    return r;
}
