#pragma once
// inc/ScheduleMutationCoordinator.h
//
// Serializes every schedule change a vehicle receives through the
// interrupt -> reply -> mutate -> resume protocol:
//
//   dispatcher                         vehicle
//     Interrupt(id, tick)        --->
//                                <---  InterruptedWhile{Driving,Idle,Offline}
//     [StopDriving(tick)]        --->  (only if it was driving)
//     ModifyPassengerSchedule    --->
//     Resume                     --->
//                                <---  ModifyPassengerScheduleAck(triggers)
//
// One attempt per vehicle at a time, indexed both by interrupt id and by
// vehicle id. An attempt is removed as soon as it reaches a terminal outcome
// (acknowledged, or abandoned and resumed), so both indices are empty
// whenever no wave or reservation is in flight.
//
// Single-threaded by contract: all calls come from the dispatcher's control
// loop. Protocol anomalies are logged and counted, never thrown.

#include "FleetStateTracker.h"
#include "VehicleMessages.h"
#include "WaveController.h"

#include <boost/optional.hpp>
#include <boost/unordered_map.hpp>

#include <functional>
#include <iosfwd>
#include <set>
#include <vector>

namespace rhdispatch {

enum class InterruptOrigin { BatchedReservation, SingleReservation, Reposition, HoldForPlanning };
enum class AttemptStatus { InterruptSent, ModifySent };

const char* origin_name(InterruptOrigin origin);

struct ModificationAttempt {
    InterruptId interrupt_id;
    VehicleId vehicle_id;
    ModifyPassengerSchedule modify_passenger_schedule;
    InterruptOrigin origin = InterruptOrigin::HoldForPlanning;
    boost::optional<InterruptReply> interrupt_reply;
    int tick = 0;
    VehicleAgent* agent = nullptr;
    AttemptStatus status = AttemptStatus::InterruptSent;
};

struct CoordinatorMetrics {
    long long interrupts_sent      = 0;
    long long replies_received     = 0;
    long long stale_replies        = 0;
    long long mutations_sent       = 0;
    long long stop_driving_sent    = 0;
    long long acks_received        = 0;
    long long repositions_abandoned = 0;
    long long reservations_failed  = 0;
    long long refused_blocked      = 0;
    long long holds_released       = 0;
    long long protocol_errors      = 0;
    long long interrupts_expired   = 0;
};

class ScheduleMutationCoordinator
{
public:
    typedef std::function<void(RequestId)> ReservationFailureFn;

    int screen = 0;
    // ticks to wait for an interrupt reply before abandoning; 0 waits forever
    int interrupt_timeout = 0;
    // told when a reservation's mutation failed because the vehicle went offline
    ReservationFailureFn on_reservation_failed;

    ScheduleMutationCoordinator(const FleetStateTracker& fleet, WaveController& waves);

    // Arms a wave over the given vehicles and interrupts each of them with a
    // HoldForPlanning attempt. Vehicles pending a single reservation are
    // skipped and their wave membership is cancelled.
    void begin_wave(WaveKind kind, const std::set<VehicleId>& vehicles, int tick, long long trigger_id);
    // same, over every idle or in-service vehicle of the fleet
    void begin_wave_over_fleet(WaveKind kind, int tick, long long trigger_id);

    // Starts a SingleReservation attempt carrying the schedule to apply.
    // false if the vehicle is unknown or already busy with another attempt.
    bool send_reservation_interrupt(const VehicleId& vehicle_id, const PassengerSchedule& schedule,
                                    int tick, RequestId reservation_request_id);

    void on_interrupt_reply(const InterruptReply& reply);
    bool all_interrupt_confirmations_received() const { return num_interrupt_replies_pending == 0; }
    int  num_pending_replies() const { return num_interrupt_replies_pending; }

    // Requires the reply of the vehicle's attempt. Offline vehicles are
    // abandoned; otherwise StopDriving (if driving), the new schedule and
    // Resume are sent in that order.
    void apply_mutation(const VehicleId& vehicle_id, const PassengerSchedule& schedule, int tick,
                        const boost::optional<RequestId>& reservation_request_id = boost::none);

    // Wave member the planner leaves as it is: resume it and resolve it.
    void release_hold(const VehicleId& vehicle_id);

    // The vehicle confirmed the new schedule. Inside a wave the triggers are
    // kept for the completion notice and an empty vector is returned;
    // otherwise they are handed back to the caller.
    std::vector<ScheduleTrigger> acknowledge_mutation(const VehicleId& vehicle_id,
                                                      const std::vector<ScheduleTrigger>& triggers_to_schedule,
                                                      int tick);

    // Resumes every vehicle still holding an attempt and empties both
    // indices. Safe to call repeatedly.
    void clear_all_pending_interrupts();

    // Abandons attempts whose interrupt went unanswered for interrupt_timeout
    // ticks. Returns the number of abandoned attempts.
    int expire_unanswered_interrupts(int now);

    // Treats the vehicle as if it had replied idle (used when the dispatcher
    // already knows the vehicle stopped on its own).
    void set_status_to_idle(const VehicleId& vehicle_id);
    bool clear_attempt_for_vehicle(const VehicleId& vehicle_id);

    bool is_pending_reservation(const VehicleId& vehicle_id) const;
    bool does_pending_reservation_contain_schedule(const VehicleId& vehicle_id,
                                                   const PassengerSchedule& schedule) const;
    bool is_vehicle_neither_repositioning_nor_processing_reservation(const VehicleId& vehicle_id) const;
    bool is_cache_empty() const { return interrupt_id_to_attempt.empty() && vehicle_id_to_interrupt_id.empty(); }
    size_t num_attempts() const { return vehicle_id_to_interrupt_id.size(); }

    const ModificationAttempt* attempt_for(const VehicleId& vehicle_id) const;
    const ModificationAttempt* attempt_for_interrupt(const InterruptId& interrupt_id) const;

    const CoordinatorMetrics& metrics() const { return m; }
    void print_state(std::ostream& os) const;
    void metrics_print_summary() const;

private:
    ModificationAttempt* find_by_vehicle(const VehicleId& vehicle_id);
    void save_attempt(const ModificationAttempt& attempt);
    void clear_attempt_with_interrupt_id(const InterruptId& interrupt_id);
    void send_interrupt(const ModificationAttempt& attempt);
    void send_modify_passenger_schedule(ModificationAttempt& attempt, bool stop_driving);
    void drop_wave_membership(const VehicleId& vehicle_id);
    void protocol_error(const VehicleId& vehicle_id, const char* what);

    static InterruptId next_interrupt_id();

    const FleetStateTracker& fleet;
    WaveController& waves;

    boost::unordered_map<InterruptId, ModificationAttempt> interrupt_id_to_attempt;
    boost::unordered_map<VehicleId, InterruptId> vehicle_id_to_interrupt_id;
    int num_interrupt_replies_pending = 0;

    CoordinatorMetrics m;
};

} // namespace rhdispatch
