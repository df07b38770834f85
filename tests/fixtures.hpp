#pragma once
#include <cmath>
#include "services.hpp"

// Three agents with hand-checked history, used by the aggregation, scoring
// and end-to-end tests. Ranked for {Phone Call, Organic, Europa} under the
// refined weights the order is Ben (4.2), Ava (4.6 * 2/3), Cleo (2.8).
inline MetricSnapshot three_agent_fixture() {
  MetricSnapshot d;
  d.agents = {
    {1, "Ava Stone", "Interplanetary Sales", 4.5, 10},
    {2, "Ben Ortiz", "Interplanetary Sales", 4.0, 3},
    {3, "Cleo Park", "Luxury Voyages", 3.5, 15},
  };
  d.assignments = {
    {1, 1, "Noah Reyes",   "Organic", "Phone Call", "Kennedy Space Center"},
    {2, 1, "Mia Chen",     "Bought",  "Text",       "Tokyo Spaceport Terminal"},
    {3, 1, "Liam Walsh",   "Organic", "Text",       "London Ascension Platform"},
    {4, 2, "Olivia Grant", "Organic", "Phone Call", "Kennedy Space Center"},
    {5, 2, "Ethan Brooks", "Organic", "Phone Call", "New York Orbital Gateway"},
    {6, 3, "Isla Novak",   "Bought",  "Text",       "Sydney Stellar Port"},
    {7, 3, "Lucas Meyer",  "Bought",  "Phone Call", "Dubai Interplanetary Hub"},
  };
  d.bookings = {
    {1, 1, "Europa", "Confirmed"},
    {2, 2, "Mars",   "Cancelled"},
    {3, 3, "Europa", "Confirmed"},
    {4, 4, "Europa", "Confirmed"},
    {5, 5, "Venus",  "Confirmed"},
    {6, 6, "Titan",  "Confirmed"},
  };
  return d;
}

inline CustomerProfile sarah_johnson() {
  return {"Phone Call", "Organic", "Europa", "Kennedy Space Center", "Sarah Johnson"};
}

inline bool eq(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}
