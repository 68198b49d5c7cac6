#pragma once
// inc/PassengerSchedule.h
//
// Ordered legs of one vehicle plan, each annotated with a manifest of who
// rides, boards and alights on it. The schedule is a value: every mutation
// returns a fresh copy and leaves the receiver untouched, so a plan can be
// shared freely before it is committed to a vehicle.

#include "DispatchTypes.h"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace rhdispatch {

struct Leg {
    int   start_time = 0;   // seconds
    int   duration   = 0;   // seconds
    Coord origin;
    Coord destination;
    double distance  = 0;   // meters

    Leg() = default;
    Leg(int start_time, int duration, const Coord& origin, const Coord& destination, double distance = 0)
        : start_time(start_time), duration(duration), origin(origin),
          destination(destination), distance(distance) {}

    int end_time() const { return start_time + duration; }

    bool operator==(const Leg& other) const
    {
        return start_time == other.start_time && duration == other.duration &&
               origin == other.origin && destination == other.destination &&
               distance == other.distance;
    }
};

// legs are keyed by (start_time, duration) only
struct LegOrder {
    bool operator()(const Leg& a, const Leg& b) const
    {
        if (a.start_time != b.start_time)
            return a.start_time < b.start_time;
        return a.duration < b.duration;
    }
};

struct Manifest {
    std::set<VehiclePersonId> riders;
    std::set<VehicleId> boarders;
    std::set<VehicleId> alighters;

    bool operator==(const Manifest& other) const
    {
        return riders == other.riders && boarders == other.boarders && alighters == other.alighters;
    }

    std::string to_string() const;
};

class PassengerSchedule
{
public:
    typedef std::map<Leg, Manifest, LegOrder> LegMap;

    PassengerSchedule() = default;

    // Legs must arrive already in time order; each gets an empty manifest.
    // A leg that is already present keeps its manifest.
    PassengerSchedule add_legs(const std::vector<Leg>& legs) const;

    // Adds the passenger as a rider of every given leg, as a boarder of the
    // first one and an alighter of the last one.
    // Throws std::out_of_range when a leg is not part of this schedule.
    PassengerSchedule add_passenger(const VehiclePersonId& passenger, const std::vector<Leg>& legs) const;

    const LegMap& legs() const { return schedule; }
    bool empty() const { return schedule.empty(); }
    size_t size() const { return schedule.size(); }
    bool contains(const Leg& leg) const { return schedule.find(leg) != schedule.end(); }

    // throws std::out_of_range for an unknown leg
    const Manifest& manifest(const Leg& leg) const;

    std::vector<Leg> leg_sequence() const;
    int num_passengers() const;

    bool operator==(const PassengerSchedule& other) const { return schedule == other.schedule; }
    bool operator!=(const PassengerSchedule& other) const { return !(*this == other); }

    std::string to_string() const;

private:
    explicit PassengerSchedule(const LegMap& schedule) : schedule(schedule) {}

    LegMap schedule;
};

} // namespace rhdispatch
