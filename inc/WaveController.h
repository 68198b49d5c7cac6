#pragma once
// inc/WaveController.h
//
// Tracks the vehicles still awaited by the active wave (repositioning or
// batched reservations) and sends exactly one completion notice per wave to
// the tick scheduler. The notice carries every follow-up trigger gathered
// during the wave plus one timer trigger for the next wave of the same kind.

#include "DispatchTypes.h"
#include "Triggers.h"

#include <boost/optional.hpp>

#include <functional>
#include <set>
#include <utility>
#include <vector>

namespace rhdispatch {

enum class WaveKind { Reposition, BatchedReservation };

const char* wave_name(WaveKind kind);

class WaveController
{
public:
    typedef std::function<void(const CompletionNotice&)> CompletionSink;

    // seconds between two waves of the same kind
    int reposition_interval = 300;
    int buffer_interval     = 60;
    int screen = 0;

    // called after the completion notice went out
    std::function<void(WaveKind, int /*tick*/)> on_wave_complete;

    explicit WaveController(CompletionSink sink) : sink(std::move(sink)) {}

    // The scheduler's (tick, trigger id) is held for the whole wave and must
    // be released exactly once, when the completion notice is sent.
    void hold_tick_and_trigger(int tick, long long trigger_id);
    std::pair<int, long long> release_tick_and_trigger();
    bool holds_trigger() const { return static_cast<bool>(held); }

    // Arms a wave. An empty wave completes immediately.
    // Throws std::logic_error if a wave is already active.
    void begin(WaveKind kind, const std::set<VehicleId>& vehicles, int tick, long long trigger_id);

    void vehicle_resolved(const VehicleId& vehicle_id);

    bool is_active() const { return active; }
    WaveKind kind() const { return wave_kind; }
    bool is_repositioning() const { return active && wave_kind == WaveKind::Reposition; }
    bool is_waiting_for(const VehicleId& vehicle_id) const { return waiting.count(vehicle_id) > 0; }
    const std::set<VehicleId>& waiting_vehicles() const { return waiting; }
    size_t num_waiting() const { return waiting.size(); }

    void add_trigger_to_send_with_completion(const ScheduleTrigger& trigger);
    void add_triggers_to_send_with_completion(const std::vector<ScheduleTrigger>& triggers);
    const std::vector<ScheduleTrigger>& triggers_in_wave() const { return all_triggers_in_wave; }

    // Teardown only: forgets the wave without notifying the scheduler.
    void cancel();

    long long waves_completed() const { return m_waves_completed_total; }
    long long unknown_resolutions() const { return m_unknown_resolutions_total; }

private:
    void wave_complete();

    CompletionSink sink;
    boost::optional<std::pair<int, long long>> held;   // (tick, trigger id)

    bool active = false;
    WaveKind wave_kind = WaveKind::Reposition;
    std::set<VehicleId> waiting;
    std::vector<ScheduleTrigger> all_triggers_in_wave;

    long long m_waves_completed_total     = 0;
    long long m_unknown_resolutions_total = 0;
};

} // namespace rhdispatch
