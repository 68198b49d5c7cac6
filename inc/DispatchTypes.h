#pragma once
// inc/DispatchTypes.h
//
// Plain value types shared by every dispatch component: identifiers,
// planar coordinates and passenger references.

#include <string>
#include <cmath>

namespace rhdispatch {

typedef std::string VehicleId;
typedef std::string PersonId;
typedef std::string InterruptId;
typedef int RequestId;

// planar coordinate in meters
struct Coord {
    double x = 0;
    double y = 0;

    Coord() = default;
    Coord(double x, double y) : x(x), y(y) {}

    bool operator==(const Coord& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
};

inline double euclidean_distance(const Coord& a, const Coord& b)
{
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// A person riding a vehicle is identified by the person and the "body"
// vehicle that represents the person while walking/boarding.
struct VehiclePersonId {
    VehicleId vehicle_id;
    PersonId  person_id;

    VehiclePersonId() = default;
    VehiclePersonId(const VehicleId& vehicle_id, const PersonId& person_id)
        : vehicle_id(vehicle_id), person_id(person_id) {}

    bool operator<(const VehiclePersonId& other) const
    {
        if (vehicle_id != other.vehicle_id)
            return vehicle_id < other.vehicle_id;
        return person_id < other.person_id;
    }
    bool operator==(const VehiclePersonId& other) const
    {
        return vehicle_id == other.vehicle_id && person_id == other.person_id;
    }
};

} // namespace rhdispatch
