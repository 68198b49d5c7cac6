#include "PassengerSchedule.h"

#include <sstream>
#include <stdexcept>

namespace rhdispatch {

std::string Manifest::to_string() const
{
    std::ostringstream oss;
    oss << "[" << riders.size() << "riders;" << boarders.size() << "boarders;"
        << alighters.size() << "alighters]";
    return oss.str();
}

PassengerSchedule PassengerSchedule::add_legs(const std::vector<Leg>& legs) const
{
    LegMap next = schedule;
    for (const auto& leg : legs)
        next.emplace(leg, Manifest());
    return PassengerSchedule(next);
}

PassengerSchedule PassengerSchedule::add_passenger(const VehiclePersonId& passenger,
                                                   const std::vector<Leg>& legs) const
{
    LegMap next = schedule;
    for (const auto& leg : legs)
    {
        auto it = next.find(leg);
        if (it == next.end())
        {
            std::ostringstream oss;
            oss << "leg (" << leg.start_time << "," << leg.duration
                << ") is not part of the schedule; add the legs before binding passenger "
                << passenger.person_id;
            throw std::out_of_range(oss.str());
        }
        it->second.riders.insert(passenger);
    }
    if (!legs.empty())
    {
        next.find(legs.front())->second.boarders.insert(passenger.vehicle_id);
        next.find(legs.back())->second.alighters.insert(passenger.vehicle_id);
    }
    return PassengerSchedule(next);
}

const Manifest& PassengerSchedule::manifest(const Leg& leg) const
{
    auto it = schedule.find(leg);
    if (it == schedule.end())
        throw std::out_of_range("leg is not part of the schedule");
    return it->second;
}

std::vector<Leg> PassengerSchedule::leg_sequence() const
{
    std::vector<Leg> out;
    out.reserve(schedule.size());
    for (const auto& kv : schedule)
        out.push_back(kv.first);
    return out;
}

int PassengerSchedule::num_passengers() const
{
    std::set<VehiclePersonId> all;
    for (const auto& kv : schedule)
        all.insert(kv.second.riders.begin(), kv.second.riders.end());
    return (int)all.size();
}

std::string PassengerSchedule::to_string() const
{
    std::ostringstream oss;
    bool first = true;
    for (const auto& kv : schedule)
    {
        if (!first) oss << "--";
        first = false;
        oss << "Leg(" << kv.first.start_time << "," << kv.first.duration << ") -> "
            << kv.second.to_string();
    }
    return oss.str();
}

} // namespace rhdispatch
