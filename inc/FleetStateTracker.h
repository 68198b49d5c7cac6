#pragma once
// inc/FleetStateTracker.h
//
// Authoritative view of the fleet: operational status and last known
// location per vehicle. Iteration is ordered by vehicle id so every query
// is deterministic for a fixed snapshot.

#include "DispatchTypes.h"

#include <boost/optional.hpp>

#include <map>
#include <utility>
#include <vector>

namespace rhdispatch {

class VehicleAgent;

enum class VehicleStatus { Idle, InService, OutOfService };

const char* status_name(VehicleStatus status);

struct VehicleLocation {
    VehicleId vehicle_id;
    VehicleAgent* agent = nullptr;   // not owned
    Coord location;
    VehicleStatus status = VehicleStatus::Idle;
};

class FleetStateTracker
{
public:
    FleetStateTracker() = default;

    // false if the id is already tracked
    bool add_vehicle(const VehicleId& id, VehicleAgent* agent, const Coord& location,
                     VehicleStatus status = VehicleStatus::Idle);
    bool remove_vehicle(const VehicleId& id);

    // false if the vehicle is unknown
    bool set_idle(const VehicleId& id, const Coord& location);
    bool set_in_service(const VehicleId& id, const Coord& location);
    bool set_out_of_service(const VehicleId& id, const Coord& location);

    const VehicleLocation* get(const VehicleId& id) const;
    bool contains(const VehicleId& id) const { return vehicles.find(id) != vehicles.end(); }

    std::vector<VehicleLocation> idle_vehicles() const;
    std::vector<VehicleLocation> idle_and_in_service_vehicles() const;

    // nearest idle vehicle within radius; ties go to the smaller vehicle id
    boost::optional<std::pair<VehicleLocation, double>>
    closest_idle_vehicle(const Coord& pickup, double radius) const;

    // every idle vehicle within radius, sorted by (distance, vehicle id)
    std::vector<std::pair<VehicleLocation, double>>
    closest_idle_vehicles_within_radius(const Coord& pickup, double radius) const;

    size_t size() const { return vehicles.size(); }
    size_t count(VehicleStatus status) const;

private:
    bool set_status(const VehicleId& id, const Coord& location, VehicleStatus status);

    std::map<VehicleId, VehicleLocation> vehicles;
};

} // namespace rhdispatch
