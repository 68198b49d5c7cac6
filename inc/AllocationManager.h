#pragma once
// inc/AllocationManager.h
//
// Vehicle selection for pickup requests:
//   - propose_allocation : nearest idle vehicle within the search radius
//   - allocate_batch     : greedy single pass over a batch of requests, each
//                          vehicle used at most once. Not assignment-optimal;
//                          an earlier request may take the vehicle a later
//                          one needed more.
//   - reposition_vehicles: move an idle vehicle toward another idle one
//
// Allocation never touches a vehicle's schedule. The caller commits the
// choice through the ScheduleMutationCoordinator.

#include "FleetStateTracker.h"

#include <boost/optional.hpp>

#include <functional>
#include <utility>
#include <vector>

namespace rhdispatch {

struct VehicleAllocationRequest {
    RequestId request_id = -1;
    PersonId  person_id;
    int   request_time = 0;
    Coord pickup;
    Coord dropoff;
};

struct VehicleAllocation {
    VehicleId vehicle_id;
    Coord current_location;
    double distance = 0;   // to pickup
};

typedef std::pair<VehicleAllocationRequest, boost::optional<VehicleAllocation>> AllocationResult;

class AllocationManager
{
public:
    // restricts candidates beyond "idle within radius"; empty means no restriction
    typedef std::function<bool(const VehicleId&)> EligibilityFn;

    double search_radius = 5000;

    explicit AllocationManager(const FleetStateTracker& fleet) : fleet(fleet) {}

    boost::optional<VehicleAllocation> propose_allocation(const Coord& pickup, double radius,
                                                          const EligibilityFn& eligible = EligibilityFn()) const;
    boost::optional<VehicleAllocation> propose_allocation(const VehicleAllocationRequest& request,
                                                          const EligibilityFn& eligible = EligibilityFn()) const;

    // output keeps the input order, one entry per request
    std::vector<AllocationResult> allocate_batch(const std::vector<VehicleAllocationRequest>& requests,
                                                 const EligibilityFn& eligible = EligibilityFn()) const;

    // (vehicle, destination) moves for idle vehicles
    std::vector<std::pair<VehicleId, Coord>> reposition_vehicles(int tick,
                                                                  const EligibilityFn& eligible = EligibilityFn()) const;

private:
    const FleetStateTracker& fleet;
};

} // namespace rhdispatch
