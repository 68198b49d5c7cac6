// tests/test_passenger_schedule.cpp
#include "PassengerSchedule.h"
#include <iostream>
#include <cassert>
#include <stdexcept>
using namespace rhdispatch;

int main() {
    const Leg a(100, 50, Coord(0, 0), Coord(500, 0), 500);
    const Leg b(150, 80, Coord(500, 0), Coord(500, 800), 800);
    const Leg c(230, 20, Coord(500, 800), Coord(600, 800), 100);

    // legs come back in (start_time, duration) order regardless of insertion order
    PassengerSchedule s = PassengerSchedule().add_legs({c, a, b});
    auto seq = s.leg_sequence();
    assert(seq.size() == 3);
    assert(seq[0] == a && seq[1] == b && seq[2] == c);
    for (const auto& leg : seq)
        assert(s.manifest(leg) == Manifest());

    // one passenger over two legs: rider of both, boards on the first, alights on the last
    const VehiclePersonId alice("body-alice", "alice");
    PassengerSchedule with_alice = s.add_passenger(alice, {a, b});
    assert(with_alice.manifest(a).riders.count(alice));
    assert(with_alice.manifest(b).riders.count(alice));
    assert(with_alice.manifest(c).riders.empty());
    assert(with_alice.manifest(a).boarders.count("body-alice"));
    assert(with_alice.manifest(a).alighters.empty());
    assert(with_alice.manifest(b).alighters.count("body-alice"));
    assert(with_alice.manifest(b).boarders.empty());
    assert(with_alice.num_passengers() == 1);

    // value semantics: the original schedule is untouched
    assert(s.num_passengers() == 0);
    assert(s.manifest(a).riders.empty());
    assert(s != with_alice);

    // single-leg trip: boards and alights on the same leg
    const VehiclePersonId bob("body-bob", "bob");
    PassengerSchedule both = with_alice.add_passenger(bob, {c});
    assert(both.manifest(c).boarders.count("body-bob"));
    assert(both.manifest(c).alighters.count("body-bob"));
    assert(both.num_passengers() == 2);
    assert(with_alice.num_passengers() == 1);

    // re-adding a leg keeps its manifest
    PassengerSchedule again = both.add_legs({a});
    assert(again == both);
    assert(again.size() == 3);

    // a leg that is not part of the schedule is rejected
    const Leg stranger(999, 1, Coord(1, 1), Coord(2, 2), 1);
    bool threw = false;
    try {
        s.add_passenger(alice, {stranger});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        s.manifest(stranger);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    // partial failure leaves no trace on the receiver
    threw = false;
    try {
        s.add_passenger(alice, {a, stranger});
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    assert(s.manifest(a).riders.empty());

    assert(PassengerSchedule().empty());
    assert(Manifest().to_string() == "[0riders;0boarders;0alighters]");
    assert(with_alice.manifest(a).to_string() == "[1riders;1boarders;0alighters]");
    std::cout << "schedule: " << both.to_string() << "\n";

    std::cout << "PassengerSchedule test OK\n";
    return 0;
}
