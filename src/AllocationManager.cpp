#include "AllocationManager.h"

#include <unordered_set>

namespace rhdispatch {

boost::optional<VehicleAllocation>
AllocationManager::propose_allocation(const Coord& pickup, double radius, const EligibilityFn& eligible) const
{
    if (!eligible)
    {
        auto closest = fleet.closest_idle_vehicle(pickup, radius);
        if (!closest)
            return boost::none;
        VehicleAllocation a;
        a.vehicle_id = closest->first.vehicle_id;
        a.current_location = closest->first.location;
        a.distance = closest->second;
        return a;
    }

    for (const auto& cand : fleet.closest_idle_vehicles_within_radius(pickup, radius))
    {
        if (!eligible(cand.first.vehicle_id))
            continue;
        VehicleAllocation a;
        a.vehicle_id = cand.first.vehicle_id;
        a.current_location = cand.first.location;
        a.distance = cand.second;
        return a;
    }
    return boost::none;
}

boost::optional<VehicleAllocation>
AllocationManager::propose_allocation(const VehicleAllocationRequest& request, const EligibilityFn& eligible) const
{
    return propose_allocation(request.pickup, search_radius, eligible);
}

std::vector<AllocationResult>
AllocationManager::allocate_batch(const std::vector<VehicleAllocationRequest>& requests,
                                  const EligibilityFn& eligible) const
{
    std::vector<AllocationResult> out;
    out.reserve(requests.size());
    std::unordered_set<VehicleId> already_used;

    for (const auto& request : requests)
    {
        boost::optional<VehicleAllocation> allocation;
        for (const auto& cand : fleet.closest_idle_vehicles_within_radius(request.pickup, search_radius))
        {
            const VehicleId& vid = cand.first.vehicle_id;
            if (already_used.count(vid))
                continue;
            if (eligible && !eligible(vid))
                continue;
            VehicleAllocation a;
            a.vehicle_id = vid;
            a.current_location = cand.first.location;
            a.distance = cand.second;
            allocation = a;
            already_used.insert(vid);
            break;
        }
        out.emplace_back(request, allocation);
    }
    return out;
}

std::vector<std::pair<VehicleId, Coord>>
AllocationManager::reposition_vehicles(int /*tick*/, const EligibilityFn& eligible) const
{
    std::vector<VehicleLocation> idle;
    for (const auto& v : fleet.idle_vehicles())
        if (!eligible || eligible(v.vehicle_id))
            idle.push_back(v);

    std::vector<std::pair<VehicleId, Coord>> moves;
    if (idle.size() >= 2)
        moves.emplace_back(idle[0].vehicle_id, idle[1].location);
    return moves;
}

} // namespace rhdispatch
