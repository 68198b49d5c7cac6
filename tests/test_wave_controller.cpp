// tests/test_wave_controller.cpp
#include "WaveController.h"
#include <iostream>
#include <cassert>
#include <stdexcept>
#include <vector>
using namespace rhdispatch;

int main() {
    std::vector<CompletionNotice> sent;
    WaveController waves([&sent](const CompletionNotice& n) { sent.push_back(n); });
    waves.reposition_interval = 300;
    waves.buffer_interval = 60;

    std::vector<WaveKind> completed;
    waves.on_wave_complete = [&completed](WaveKind k, int) { completed.push_back(k); };

    // ---- reposition wave over three vehicles: exactly one completion ----
    waves.begin(WaveKind::Reposition, {"a", "b", "c"}, 100, 7);
    assert(waves.is_active() && waves.is_repositioning());
    assert(waves.holds_trigger());
    assert(waves.num_waiting() == 3);

    waves.add_trigger_to_send_with_completion(ScheduleTrigger(TriggerKind::EndLeg, 150, "a", 1));
    waves.vehicle_resolved("a");
    waves.vehicle_resolved("b");
    assert(sent.empty());
    waves.vehicle_resolved("c");
    assert(sent.size() == 1);
    assert(!waves.is_active());
    assert(!waves.holds_trigger());

    const CompletionNotice& n = sent[0];
    assert(n.trigger_id == 7);
    assert(n.new_triggers.size() == 2);
    assert(n.new_triggers[0].kind == TriggerKind::EndLeg && n.new_triggers[0].tick == 150);
    assert(n.new_triggers[1].kind == TriggerKind::Reposition && n.new_triggers[1].tick == 400);
    assert(completed.size() == 1 && completed[0] == WaveKind::Reposition);
    assert(waves.triggers_in_wave().empty());

    // a late resolution after completion is counted, not fatal
    waves.vehicle_resolved("c");
    assert(sent.size() == 1);
    assert(waves.unknown_resolutions() == 1);

    // ---- empty batched wave completes immediately with the buffer timer ----
    waves.begin(WaveKind::BatchedReservation, {}, 200, 8);
    assert(sent.size() == 2);
    assert(!waves.is_active());
    assert(sent[1].trigger_id == 8);
    assert(sent[1].new_triggers.size() == 1);
    assert(sent[1].new_triggers[0].kind == TriggerKind::BufferedRequests);
    assert(sent[1].new_triggers[0].tick == 260);

    // trigger buffer was reset by the previous completion
    waves.begin(WaveKind::BatchedReservation, {"x"}, 300, 9);
    assert(!waves.is_repositioning());
    assert(waves.is_waiting_for("x") && !waves.is_waiting_for("a"));
    waves.vehicle_resolved("x");
    assert(sent.size() == 3);
    assert(sent[2].new_triggers.size() == 1);

    // ---- fatal misuse ----
    bool threw = false;
    try {
        waves.release_tick_and_trigger();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    waves.begin(WaveKind::Reposition, {"y"}, 400, 10);
    threw = false;
    try {
        waves.begin(WaveKind::BatchedReservation, {"z"}, 400, 11);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        waves.hold_tick_and_trigger(400, 12);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    // teardown forgets the wave without a notice
    waves.cancel();
    assert(!waves.is_active() && !waves.holds_trigger());
    assert(sent.size() == 3);
    assert(waves.waves_completed() == 3);

    std::cout << "WaveController test OK\n";
    return 0;
}
