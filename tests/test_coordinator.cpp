// tests/test_coordinator.cpp
#include "ScheduleMutationCoordinator.h"
#include <iostream>
#include <sstream>
#include <cassert>
#include <string>
#include <vector>
using namespace rhdispatch;

// Collects every message the coordinator sends; replies are fed back by hand.
struct RecordingAgent : public VehicleAgent {
    VehicleId vid;
    std::vector<VehicleMessage> inbox;

    explicit RecordingAgent(const VehicleId& id) : vid(id) {}
    const VehicleId& id() const override { return vid; }
    void send(const VehicleMessage& msg) override { inbox.push_back(msg); }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& m : inbox) out.push_back(message_name(m));
        return out;
    }
    InterruptId last_interrupt_id() const {
        for (auto it = inbox.rbegin(); it != inbox.rend(); ++it)
            if (const Interrupt* i = boost::get<Interrupt>(&*it))
                return i->interrupt_id;
        return "";
    }
};

struct Fixture {
    FleetStateTracker fleet;
    std::vector<CompletionNotice> sent;
    WaveController waves;
    ScheduleMutationCoordinator coord;
    RecordingAgent v1, v2, v3;
    std::vector<RequestId> failed;

    Fixture()
        : waves([this](const CompletionNotice& n) { sent.push_back(n); }),
          coord(fleet, waves), v1("v1"), v2("v2"), v3("v3")
    {
        waves.reposition_interval = 300;
        waves.buffer_interval = 60;
        fleet.add_vehicle("v1", &v1, Coord(0, 0));
        fleet.add_vehicle("v2", &v2, Coord(1000, 0));
        fleet.add_vehicle("v3", &v3, Coord(2000, 0));
        coord.on_reservation_failed = [this](RequestId id) { failed.push_back(id); };
    }
};

static PassengerSchedule one_leg(int tick, const Coord& from, const Coord& to) {
    return PassengerSchedule().add_legs({Leg(tick, 50, from, to, euclidean_distance(from, to))});
}

static std::vector<std::string> seq(std::initializer_list<const char*> names) {
    return std::vector<std::string>(names.begin(), names.end());
}

// three idle vehicles, one repositioned, the others released
static void test_reposition_wave() {
    Fixture f;
    f.coord.begin_wave_over_fleet(WaveKind::Reposition, 100, 42);
    assert(f.waves.is_repositioning());
    assert(f.coord.num_attempts() == 3);
    assert(f.coord.num_pending_replies() == 3);
    assert(!f.coord.all_interrupt_confirmations_received());

    f.coord.on_interrupt_reply(InterruptReply::idle(f.v1.last_interrupt_id(), "v1", 100));
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v2.last_interrupt_id(), "v2", 100));
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v3.last_interrupt_id(), "v3", 100));
    assert(f.coord.all_interrupt_confirmations_received());

    f.coord.apply_mutation("v1", one_leg(100, Coord(0, 0), Coord(1000, 0)), 100);
    f.coord.release_hold("v2");
    f.coord.release_hold("v3");
    assert(f.sent.empty());
    assert(f.waves.num_waiting() == 1);

    assert(f.v1.names() == seq({"Interrupt", "ModifyPassengerSchedule", "Resume"}));
    assert(f.v2.names() == seq({"Interrupt", "Resume"}));
    assert(f.v3.names() == seq({"Interrupt", "Resume"}));

    auto rest = f.coord.acknowledge_mutation("v1", {ScheduleTrigger(TriggerKind::EndLeg, 150, "v1", 1)}, 100);
    assert(rest.empty());
    assert(f.sent.size() == 1);
    assert(f.sent[0].trigger_id == 42);
    assert(f.sent[0].new_triggers.size() == 2);
    assert(f.sent[0].new_triggers[0].kind == TriggerKind::EndLeg);
    assert(f.sent[0].new_triggers[1].kind == TriggerKind::Reposition);
    assert(f.sent[0].new_triggers[1].tick == 400);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
    assert(!f.waves.is_active());
    assert(f.coord.metrics().holds_released == 2);
    assert(f.coord.metrics().protocol_errors == 0);
}

// StopDriving precedes the new schedule, which precedes Resume
static void test_driving_vehicle_ordering() {
    Fixture f;
    const PassengerSchedule current = one_leg(50, Coord(0, 0), Coord(500, 0));
    const PassengerSchedule next = one_leg(120, Coord(250, 0), Coord(800, 0));
    f.fleet.set_in_service("v1", Coord(0, 0));

    f.coord.begin_wave(WaveKind::Reposition, {"v1"}, 120, 1);
    f.coord.on_interrupt_reply(InterruptReply::driving(f.v1.last_interrupt_id(), "v1", 120, current));
    const ModificationAttempt* a = f.coord.attempt_for("v1");
    assert(a && a->interrupt_reply && a->interrupt_reply->passenger_schedule == current);

    f.coord.apply_mutation("v1", next, 120);
    assert(f.v1.names() == seq({"Interrupt", "StopDriving", "ModifyPassengerSchedule", "Resume"}));
    const ModifyPassengerSchedule* m = boost::get<ModifyPassengerSchedule>(&f.v1.inbox[2]);
    assert(m && m->updated_schedule == next);
    assert(f.coord.attempt_for("v1")->status == AttemptStatus::ModifySent);
    assert(f.coord.metrics().stop_driving_sent == 1);

    // a second mutation for the same interrupt is refused; the first still resolves the wave
    f.coord.apply_mutation("v1", next, 120);
    assert(f.coord.metrics().protocol_errors == 1);
    assert(f.v1.inbox.size() == 4);
    assert(f.waves.is_waiting_for("v1"));
    assert(f.coord.attempt_for("v1")->status == AttemptStatus::ModifySent);

    f.coord.acknowledge_mutation("v1", {ScheduleTrigger(TriggerKind::EndLeg, 170, "v1", 2)}, 120);
    assert(f.sent.size() == 1);
    assert(f.sent[0].new_triggers.size() == 2);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
}

// every idle vehicle repositioned; acks arrive out of order
static void test_reposition_all_vehicles() {
    Fixture f;
    f.coord.begin_wave_over_fleet(WaveKind::Reposition, 100, 8);
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v3.last_interrupt_id(), "v3", 100));
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v1.last_interrupt_id(), "v1", 100));
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v2.last_interrupt_id(), "v2", 100));
    assert(f.coord.all_interrupt_confirmations_received());

    f.coord.apply_mutation("v1", one_leg(100, Coord(0, 0), Coord(500, 500)), 100);
    f.coord.apply_mutation("v2", one_leg(100, Coord(1000, 0), Coord(1000, 500)), 100);
    f.coord.apply_mutation("v3", one_leg(100, Coord(2000, 0), Coord(1500, 500)), 100);
    assert(f.coord.metrics().mutations_sent == 3);
    assert(f.v2.names() == seq({"Interrupt", "ModifyPassengerSchedule", "Resume"}));

    f.coord.acknowledge_mutation("v2", {ScheduleTrigger(TriggerKind::EndLeg, 150, "v2", 1)}, 100);
    assert(f.sent.empty());
    f.coord.acknowledge_mutation("v3", {ScheduleTrigger(TriggerKind::EndLeg, 150, "v3", 1)}, 100);
    assert(f.sent.empty());
    assert(f.waves.num_waiting() == 1);
    f.coord.acknowledge_mutation("v1", {ScheduleTrigger(TriggerKind::EndLeg, 150, "v1", 1)}, 100);

    assert(f.sent.size() == 1);
    assert(f.sent[0].trigger_id == 8);
    const std::vector<ScheduleTrigger>& triggers = f.sent[0].new_triggers;
    assert(triggers.size() == 4);
    int end_legs = 0;
    for (const auto& t : triggers)
        if (t.kind == TriggerKind::EndLeg)
            end_legs++;
    assert(end_legs == 3);
    assert(triggers.back().kind == TriggerKind::Reposition);
    assert(triggers.back().tick == 400);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
    assert(!f.waves.is_active());
    assert(f.coord.metrics().acks_received == 3);

    // a late duplicate ack does not produce a second notice
    f.coord.acknowledge_mutation("v1", {}, 100);
    assert(f.sent.size() == 1);
    assert(f.coord.metrics().protocol_errors == 1);
}

// a pending single reservation is never overwritten by a wave
static void test_single_reservation_blocks_wave() {
    Fixture f;
    const PassengerSchedule trip = one_leg(10, Coord(0, 0), Coord(300, 0));
    assert(f.coord.send_reservation_interrupt("v1", trip, 10, 7));
    assert(f.coord.is_pending_reservation("v1"));
    assert(f.coord.does_pending_reservation_contain_schedule("v1", trip));
    assert(!f.coord.is_vehicle_neither_repositioning_nor_processing_reservation("v1"));

    // a second reservation for the same vehicle is refused
    assert(!f.coord.send_reservation_interrupt("v1", trip, 10, 8));

    f.coord.begin_wave(WaveKind::Reposition, {"v1", "v2"}, 10, 5);
    assert(f.coord.metrics().refused_blocked == 2);
    assert(f.v1.inbox.size() == 1);
    assert(!f.waves.is_waiting_for("v1"));
    assert(f.waves.is_waiting_for("v2"));
    assert(f.coord.is_pending_reservation("v1"));
    assert(f.coord.attempt_for("v1")->origin == InterruptOrigin::SingleReservation);

    // the reservation completes outside the wave: triggers go back to the caller
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v1.last_interrupt_id(), "v1", 10));
    f.coord.apply_mutation("v1", trip, 10, 7);
    const ModifyPassengerSchedule* m = boost::get<ModifyPassengerSchedule>(&f.v1.inbox[1]);
    assert(m && m->reservation_request_id && *m->reservation_request_id == 7);
    auto rest = f.coord.acknowledge_mutation("v1", {ScheduleTrigger(TriggerKind::EndLeg, 60, "v1", 1)}, 10);
    assert(rest.size() == 1);
    assert(!f.coord.attempt_for("v1"));
    assert(f.waves.is_active());
}

// offline during a reposition wave: no schedule, resume and resolve
static void test_offline_reposition() {
    Fixture f;
    f.coord.begin_wave(WaveKind::Reposition, {"v1", "v2"}, 200, 3);
    f.coord.on_interrupt_reply(InterruptReply::offline(f.v1.last_interrupt_id(), "v1", 200));
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v2.last_interrupt_id(), "v2", 200));

    f.coord.apply_mutation("v1", one_leg(200, Coord(0, 0), Coord(10, 0)), 200);
    assert(f.v1.names() == seq({"Interrupt", "Resume"}));
    assert(f.coord.metrics().repositions_abandoned == 1);
    assert(!f.coord.attempt_for("v1"));
    assert(!f.waves.is_waiting_for("v1"));
    assert(f.failed.empty());

    f.coord.release_hold("v2");
    assert(f.sent.size() == 1);
    assert(f.coord.is_cache_empty());
}

// offline reply to a single reservation: the request is reported failed
static void test_offline_reservation() {
    Fixture f;
    assert(f.coord.send_reservation_interrupt("v2", one_leg(10, Coord(1000, 0), Coord(0, 0)), 10, 99));
    f.coord.on_interrupt_reply(InterruptReply::offline(f.v2.last_interrupt_id(), "v2", 10));
    f.coord.apply_mutation("v2", one_leg(10, Coord(1000, 0), Coord(0, 0)), 10);
    assert(f.v2.names() == seq({"Interrupt", "Resume"}));
    assert(f.failed.size() == 1 && f.failed[0] == 99);
    assert(f.coord.metrics().reservations_failed == 1);
    assert(f.coord.is_cache_empty());
}

// offline reply from a batched wave member releases its membership
static void test_offline_batched_member() {
    Fixture f;
    f.coord.begin_wave(WaveKind::BatchedReservation, {"v3"}, 60, 4);
    f.coord.on_interrupt_reply(InterruptReply::offline(f.v3.last_interrupt_id(), "v3", 60));
    f.coord.apply_mutation("v3", one_leg(60, Coord(2000, 0), Coord(0, 0)), 60, 12);
    assert(f.failed.size() == 1 && f.failed[0] == 12);
    assert(f.sent.size() == 1);
    assert(f.sent[0].new_triggers.back().kind == TriggerKind::BufferedRequests);
    assert(f.sent[0].new_triggers.back().tick == 120);
}

static void test_stale_and_duplicate_replies() {
    Fixture f;
    f.coord.on_interrupt_reply(InterruptReply::idle("no-such-interrupt", "v1", 5));
    assert(f.coord.metrics().stale_replies == 1);
    assert(f.coord.is_cache_empty());

    f.coord.begin_wave(WaveKind::Reposition, {"v1"}, 5, 1);
    const InterruptId id = f.v1.last_interrupt_id();
    f.coord.on_interrupt_reply(InterruptReply::idle(id, "v1", 5));
    f.coord.on_interrupt_reply(InterruptReply::idle(id, "v1", 5));
    assert(f.coord.metrics().stale_replies == 2);
    assert(f.coord.num_pending_replies() == 0);

    // a reply that arrives after the attempt was released is stale too
    f.coord.release_hold("v1");
    f.coord.on_interrupt_reply(InterruptReply::idle(id, "v1", 5));
    assert(f.coord.metrics().stale_replies == 3);
    assert(f.sent.size() == 1);
}

static void test_protocol_errors() {
    Fixture f;
    // mutation without any attempt
    f.coord.apply_mutation("v1", PassengerSchedule(), 0);
    assert(f.coord.metrics().protocol_errors == 1);

    // mutation before the reply: the attempt is abandoned and the vehicle resumed
    f.coord.begin_wave(WaveKind::Reposition, {"v1", "v2"}, 0, 2);
    f.coord.apply_mutation("v1", PassengerSchedule(), 0);
    assert(f.coord.metrics().protocol_errors == 2);
    assert(!f.waves.is_waiting_for("v1"));
    assert(!f.coord.attempt_for("v1"));
    assert(f.v1.names() == seq({"Interrupt", "Resume"}));
    assert(f.coord.num_pending_replies() == 1);
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v2.last_interrupt_id(), "v2", 0));
    f.coord.release_hold("v2");
    assert(f.sent.size() == 1);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
    assert(f.coord.all_interrupt_confirmations_received());

    // the same with a lone wave member
    f.coord.begin_wave(WaveKind::Reposition, {"v1"}, 100, 3);
    f.coord.apply_mutation("v1", one_leg(100, Coord(0, 0), Coord(10, 0)), 100);
    assert(f.coord.metrics().protocol_errors == 3);
    assert(!f.waves.is_active());
    assert(f.sent.size() == 2);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
    assert(f.v1.names().back() == "Resume");
    assert(f.v1.inbox.size() == 4);

    // a reservation mutated before its reply is reported failed
    assert(f.coord.send_reservation_interrupt("v3", PassengerSchedule(), 100, 77));
    f.coord.apply_mutation("v3", PassengerSchedule(), 100, 77);
    assert(f.coord.metrics().protocol_errors == 4);
    assert(f.failed.size() == 1 && f.failed[0] == 77);
    assert(f.v3.names() == seq({"Interrupt", "Resume"}));
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);

    // ack with no modification in flight
    auto rest = f.coord.acknowledge_mutation("v3", {ScheduleTrigger(TriggerKind::EndLeg, 9, "v3", 0)}, 0);
    assert(rest.size() == 1);
    assert(f.coord.metrics().protocol_errors == 5);

    // unknown vehicle in a wave is dropped
    f.coord.begin_wave(WaveKind::Reposition, {"ghost"}, 0, 4);
    assert(f.coord.metrics().protocol_errors == 6);
    assert(!f.waves.is_active());
}

static void test_clear_is_idempotent() {
    Fixture f;
    f.coord.begin_wave_over_fleet(WaveKind::Reposition, 0, 1);
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v1.last_interrupt_id(), "v1", 0));
    f.coord.clear_all_pending_interrupts();
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);
    assert(f.v1.names().back() == "Resume");
    assert(f.v2.names().back() == "Resume");
    const size_t n = f.v1.inbox.size();
    f.coord.clear_all_pending_interrupts();
    assert(f.coord.is_cache_empty());
    assert(f.v1.inbox.size() == n);
    assert(f.coord.num_pending_replies() == 0);
}

// an interrupt nobody answers is abandoned after the timeout
static void test_bounded_wait() {
    Fixture f;
    f.coord.interrupt_timeout = 30;
    f.coord.begin_wave(WaveKind::Reposition, {"v1", "v2"}, 100, 6);
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v2.last_interrupt_id(), "v2", 100));
    f.coord.release_hold("v2");

    assert(f.coord.expire_unanswered_interrupts(120) == 0);
    assert(f.waves.is_active());
    assert(f.coord.expire_unanswered_interrupts(130) == 1);
    assert(f.v1.names().back() == "Resume");
    assert(f.coord.metrics().interrupts_expired == 1);
    assert(f.sent.size() == 1);
    assert(f.coord.is_cache_empty());
    assert(f.coord.num_pending_replies() == 0);

    // the late reply is only reported
    f.coord.on_interrupt_reply(InterruptReply::idle(f.v1.last_interrupt_id(), "v1", 100));
    assert(f.coord.metrics().stale_replies == 1);

    // an expiring reservation is reported failed
    assert(f.coord.send_reservation_interrupt("v3", PassengerSchedule(), 200, 55));
    assert(f.coord.expire_unanswered_interrupts(230) == 1);
    assert(f.failed.size() == 1 && f.failed[0] == 55);

    // disabled by default
    Fixture g;
    g.coord.begin_wave(WaveKind::Reposition, {"v1"}, 0, 1);
    assert(g.coord.expire_unanswered_interrupts(1000000) == 0);
    assert(g.waves.is_active());
}

static void test_queries() {
    Fixture f;
    f.coord.begin_wave(WaveKind::Reposition, {"v1"}, 0, 1);
    const InterruptId id = f.v1.last_interrupt_id();
    const ModificationAttempt* a = f.coord.attempt_for_interrupt(id);
    assert(a && a->vehicle_id == "v1" && a->origin == InterruptOrigin::HoldForPlanning);
    assert(!f.coord.is_pending_reservation("v1"));

    // set_status_to_idle stands in for the reply
    f.coord.set_status_to_idle("v1");
    assert(f.coord.all_interrupt_confirmations_received());
    assert(f.coord.attempt_for("v1")->interrupt_reply->kind == InterruptReply::Kind::WhileIdle);

    std::ostringstream oss;
    f.coord.print_state(oss);
    assert(oss.str().find(id) != std::string::npos);

    assert(f.coord.clear_attempt_for_vehicle("v1"));
    assert(!f.coord.clear_attempt_for_vehicle("v1"));
    assert(f.coord.is_cache_empty());

    // interrupt ids never repeat
    f.waves.cancel();
    f.coord.begin_wave(WaveKind::Reposition, {"v1"}, 0, 2);
    assert(f.v1.last_interrupt_id() != id);
}

int main() {
    test_reposition_wave();
    test_driving_vehicle_ordering();
    test_reposition_all_vehicles();
    test_single_reservation_blocks_wave();
    test_offline_reposition();
    test_offline_reservation();
    test_offline_batched_member();
    test_stale_and_duplicate_replies();
    test_protocol_errors();
    test_clear_is_idempotent();
    test_bounded_wait();
    test_queries();

    std::cout << "ScheduleMutationCoordinator test OK\n";
    return 0;
}
