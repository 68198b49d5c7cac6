#include "FleetStateTracker.h"

#include <algorithm>

namespace rhdispatch {

const char* status_name(VehicleStatus status)
{
    switch (status)
    {
        case VehicleStatus::Idle:         return "idle";
        case VehicleStatus::InService:    return "in-service";
        case VehicleStatus::OutOfService: return "out-of-service";
    }
    return "unknown";
}

bool FleetStateTracker::add_vehicle(const VehicleId& id, VehicleAgent* agent,
                                    const Coord& location, VehicleStatus status)
{
    if (vehicles.find(id) != vehicles.end())
        return false;
    VehicleLocation v;
    v.vehicle_id = id;
    v.agent = agent;
    v.location = location;
    v.status = status;
    vehicles.emplace(id, v);
    return true;
}

bool FleetStateTracker::remove_vehicle(const VehicleId& id)
{
    return vehicles.erase(id) > 0;
}

bool FleetStateTracker::set_status(const VehicleId& id, const Coord& location, VehicleStatus status)
{
    auto it = vehicles.find(id);
    if (it == vehicles.end())
        return false;
    it->second.location = location;
    it->second.status = status;
    return true;
}

bool FleetStateTracker::set_idle(const VehicleId& id, const Coord& location)
{
    return set_status(id, location, VehicleStatus::Idle);
}

bool FleetStateTracker::set_in_service(const VehicleId& id, const Coord& location)
{
    return set_status(id, location, VehicleStatus::InService);
}

bool FleetStateTracker::set_out_of_service(const VehicleId& id, const Coord& location)
{
    return set_status(id, location, VehicleStatus::OutOfService);
}

const VehicleLocation* FleetStateTracker::get(const VehicleId& id) const
{
    auto it = vehicles.find(id);
    if (it == vehicles.end())
        return nullptr;
    return &it->second;
}

std::vector<VehicleLocation> FleetStateTracker::idle_vehicles() const
{
    std::vector<VehicleLocation> out;
    for (const auto& kv : vehicles)
        if (kv.second.status == VehicleStatus::Idle)
            out.push_back(kv.second);
    return out;
}

std::vector<VehicleLocation> FleetStateTracker::idle_and_in_service_vehicles() const
{
    std::vector<VehicleLocation> out;
    for (const auto& kv : vehicles)
        if (kv.second.status != VehicleStatus::OutOfService)
            out.push_back(kv.second);
    return out;
}

std::vector<std::pair<VehicleLocation, double>>
FleetStateTracker::closest_idle_vehicles_within_radius(const Coord& pickup, double radius) const
{
    std::vector<std::pair<VehicleLocation, double>> out;
    for (const auto& kv : vehicles)
    {
        if (kv.second.status != VehicleStatus::Idle)
            continue;
        double d = euclidean_distance(pickup, kv.second.location);
        if (d <= radius)
            out.emplace_back(kv.second, d);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const std::pair<VehicleLocation, double>& a,
                        const std::pair<VehicleLocation, double>& b) {
                         if (a.second != b.second) return a.second < b.second;
                         return a.first.vehicle_id < b.first.vehicle_id;
                     });
    return out;
}

boost::optional<std::pair<VehicleLocation, double>>
FleetStateTracker::closest_idle_vehicle(const Coord& pickup, double radius) const
{
    boost::optional<std::pair<VehicleLocation, double>> best;
    for (const auto& kv : vehicles)
    {
        if (kv.second.status != VehicleStatus::Idle)
            continue;
        double d = euclidean_distance(pickup, kv.second.location);
        if (d > radius)
            continue;
        // map order already yields the smaller id first on equal distance
        if (!best || d < best->second)
            best = std::make_pair(kv.second, d);
    }
    return best;
}

size_t FleetStateTracker::count(VehicleStatus status) const
{
    size_t n = 0;
    for (const auto& kv : vehicles)
        if (kv.second.status == status)
            ++n;
    return n;
}

} // namespace rhdispatch
