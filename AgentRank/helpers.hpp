#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "services.hpp"   // brings in MetricSnapshot, AgentRecord, ...

/*
-------------------------------------------------------------------------------
 helpers.hpp — Snapshot lookups and the data integrity pass
-------------------------------------------------------------------------------
These functions operate on a MetricSnapshot without touching SQLite.

Naming convention:
  - find_*     -> pointer to the record, or nullptr.
  - show_*     -> console listing built on the lookups.
  - check_integrity -> copy of the snapshot with inconsistent records removed.

Integrity policy (skip, never guess):
  - duplicate agent_id                 -> later rows dropped
  - assignment with unknown agent_id   -> dropped
  - booking with unknown assignment_id -> dropped
  - second booking for one assignment  -> dropped (0..1 booking each)
Each drop is described in IntegrityReport::issues and logged to std::cerr.
-------------------------------------------------------------------------------
*/

// ==========================
// Lookups
// ==========================

/// Agent with given id, or nullptr.
const AgentRecord* find_agent(const MetricSnapshot& d, int agent_id);

/// Booking linked to the assignment, or nullptr.
const BookingRecord* find_booking_for(const MetricSnapshot& d, int assignment_id);

/// Print every assignment with its agent's name and booking outcome, if any.
void show_history(const MetricSnapshot& d, std::ostream& out = std::cout);

// ==========================
// Integrity
// ==========================

struct IntegrityReport {
    MetricSnapshot clean;
    std::vector<std::string> issues;
};

/// Return a consistent copy of `d`; the input is left untouched.
IntegrityReport check_integrity(const MetricSnapshot& d);
