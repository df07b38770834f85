#include "aggregator.hpp"
#include "errors.hpp"
#include <string>
#include <unordered_map>
#include <utility>

namespace {

// Running mean of the agent rating over matching assignments
struct Mean {
    double sum = 0.0;
    int n = 0;

    void add(double v) { sum += v; ++n; }
    std::optional<double> value() const {
        if (n == 0) return std::nullopt;
        return sum / n;
    }
};

struct Tally {
    Mean lead_source;
    Mean destination;
    Mean communication;
    int total = 0;
    int confirmed = 0;
    int cancelled = 0;
};

} // namespace

std::vector<AgentPerformanceProfile> aggregate_performance(
    const CustomerProfile& customer, const MetricSnapshot& data) {
    // agent_id -> slot, first occurrence wins
    std::unordered_map<int, std::size_t> slot;
    for (std::size_t i = 0; i < data.agents.size(); ++i)
        slot.emplace(data.agents[i].agent_id, i);

    std::unordered_map<int, const BookingRecord*> booking_of;
    for (const auto& b : data.bookings)
        booking_of.emplace(b.assignment_id, &b);

    std::vector<Tally> tally(data.agents.size());

    for (const auto& as : data.assignments) {
        auto it = slot.find(as.agent_id);
        if (it == slot.end()) continue;
        const double rating = data.agents[it->second].average_customer_service_rating;
        auto& t = tally[it->second];

        if (as.lead_source == customer.lead_source) t.lead_source.add(rating);
        if (as.communication_method == customer.communication_method) t.communication.add(rating);

        auto bk = booking_of.find(as.assignment_id);
        if (bk == booking_of.end()) continue;
        const BookingRecord& b = *bk->second;

        if (b.destination == customer.destination) t.destination.add(rating);

        // volume and risk are agent-wide, not filtered by the request
        ++t.total;
        if (b.booking_status == kStatusConfirmed) ++t.confirmed;
        else if (b.booking_status == kStatusCancelled) ++t.cancelled;
    }

    std::vector<AgentPerformanceProfile> out;
    out.reserve(data.agents.size());
    for (std::size_t i = 0; i < data.agents.size(); ++i) {
        const auto& a = data.agents[i];
        if (slot.at(a.agent_id) != i) continue;   // duplicate id
        const auto& t = tally[i];

        AgentPerformanceProfile p;
        p.agent_id = a.agent_id;
        p.name = a.name;
        p.department_name = a.department_name;
        p.rating = a.average_customer_service_rating;
        p.years_of_service = a.years_of_service;
        p.lead_source_rating = t.lead_source.value();
        p.destination_rating = t.destination.value();
        p.communication_rating = t.communication.value();
        p.total_bookings = t.total;
        p.confirmed_bookings = t.confirmed;
        p.cancelled_bookings = t.cancelled;
        p.cancellation_rate = (t.total > 0)
            ? static_cast<double>(t.cancelled) / t.total
            : 0.0;
        out.push_back(std::move(p));
    }
    return out;
}

void require_consistent_counts(const std::vector<AgentPerformanceProfile>& profiles) {
    for (const auto& p : profiles) {
        const bool ok = p.total_bookings >= 0 && p.confirmed_bookings >= 0
            && p.cancelled_bookings >= 0
            && p.confirmed_bookings + p.cancelled_bookings <= p.total_bookings
            && p.cancellation_rate >= 0.0 && p.cancellation_rate <= 1.0;
        if (!ok)
            throw DataIntegrityError("inconsistent booking counts for agent "
                + std::to_string(p.agent_id));
    }
}
