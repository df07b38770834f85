#pragma once
#include <array>
#include <optional>
#include <string>
#include <vector>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain structs
-------------------------------------------------------------------------------
Defines plain data structures for the agency data and the ranking pipeline:
  - CustomerProfile   (request input, validated before scoring)
  - AgentRecord       (one service agent)
  - AssignmentRecord  (one historical customer assignment to an agent)
  - BookingRecord     (booking outcome linked to an assignment, 0..1)
  - AgentPerformanceProfile / ScoredAgent / RankingResult (derived)

Record types mirror the SQLite tables one-to-one. Derived types are rebuilt
for every ranking request and never written back to the database.
-------------------------------------------------------------------------------
*/

// Closed value sets accepted in a CustomerProfile.
inline const std::array<const char*, 2> kCommunicationMethods = { "Phone Call", "Text" };
inline const std::array<const char*, 2> kLeadSources = { "Organic", "Bought" };
inline const std::array<const char*, 5> kDestinations = {
    "Mars", "Europa", "Venus", "Titan", "Ganymede" };
inline const std::array<const char*, 7> kLaunchLocations = {
    "Kennedy Space Center",
    "Dallas-Fort Worth Launch Complex",
    "New York Orbital Gateway",
    "Tokyo Spaceport Terminal",
    "Dubai Interplanetary Hub",
    "London Ascension Platform",
    "Sydney Stellar Port" };

// Booking status values with meaning for scoring; anything else is in progress.
inline const char* const kStatusConfirmed = "Confirmed";
inline const char* const kStatusCancelled = "Cancelled";

// The incoming customer the agents are ranked against
struct CustomerProfile {
    std::string communication_method;
    std::string lead_source;
    std::string destination;
    std::string launch_location;
    std::string customer_name;
};

// A service agent
struct AgentRecord {
    int agent_id{ 0 };                 // primary key
    std::string name;
    std::string department_name;       // descriptive only
    double average_customer_service_rating{ 0.0 }; // 1.0..5.0
    int years_of_service{ 0 };
};

// One historical assignment of a customer to an agent
struct AssignmentRecord {
    int assignment_id{ 0 };            // primary key
    int agent_id{ 0 };                 // foreign key -> AgentRecord
    std::string customer_name;
    std::string lead_source;
    std::string communication_method;
    std::string launch_location;
};

// Booking outcome of an assignment
struct BookingRecord {
    int booking_id{ 0 };               // primary key
    int assignment_id{ 0 };            // foreign key -> AssignmentRecord
    std::string destination;
    std::string booking_status;        // Confirmed, Cancelled, Pending, ...
};

// Per-agent history conditioned on one CustomerProfile
struct AgentPerformanceProfile {
    int agent_id{ 0 };
    std::string name;
    std::string department_name;
    double rating{ 0.0 };
    int years_of_service{ 0 };

    // Absent when the agent has no qualifying history for that attribute.
    std::optional<double> lead_source_rating;
    std::optional<double> destination_rating;
    std::optional<double> communication_rating;

    int total_bookings{ 0 };
    int confirmed_bookings{ 0 };
    int cancelled_bookings{ 0 };
    double cancellation_rate{ 0.0 };   // 0..1, 0 when total_bookings == 0
};

// Performance profile plus the fields filled in by scoring and ranking
struct ScoredAgent {
    AgentPerformanceProfile profile;
    double normalized_service_years{ 1.0 };
    double normalized_trip_volume{ 1.0 };
    double base_score{ 0.0 };
    double final_score{ 0.0 };
    int rank{ 0 };                     // 1 = best
};

// Full response of one ranking request
struct RankingResult {
    CustomerProfile customer;          // echo of the request
    std::string computed_at;           // UTC, ISO-8601
    std::string regime;                // weight regime used
    std::vector<ScoredAgent> agents;   // ordered best to worst
    std::vector<std::string> integrity_issues; // records excluded from aggregation
};
