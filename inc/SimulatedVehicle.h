#pragma once
// inc/SimulatedVehicle.h
//
// A vehicle agent that drives its own timeline on the MessageBus. It follows
// legs at their planned durations, pauses on Interrupt, answers with its true
// state, and starts a new schedule only on Resume. Status changes are pushed
// to the FleetStateTracker.

#include "FleetStateTracker.h"
#include "MessageBus.h"
#include "VehicleMessages.h"

#include <boost/optional.hpp>

#include <functional>
#include <string>
#include <vector>

namespace rhdispatch {

// where the vehicle sends its replies and acknowledgements
struct DispatcherPort {
    std::string mailbox = "dispatcher";
    std::function<void(const InterruptReply&)> on_interrupt_reply;
    std::function<void(const ModifyPassengerScheduleAck&)> on_modify_ack;
};

class SimulatedVehicle : public VehicleAgent
{
public:
    enum class DriveState { Idle, Driving, Offline };

    SimulatedVehicle(const VehicleId& id, const Coord& start, MessageBus& bus,
                     FleetStateTracker& fleet, const DispatcherPort& port);

    const VehicleId& id() const override { return vehicle_id; }
    void send(const VehicleMessage& msg) override;

    // EndLeg trigger from the scheduler; returns the triggers to schedule next
    std::vector<ScheduleTrigger> end_leg(int tick, int generation);

    void go_offline(int tick);
    void go_online(int tick);

    DriveState state() const { return drive_state; }
    bool is_paused() const { return paused; }
    const Coord& location() const { return current_location; }
    const PassengerSchedule& schedule() const { return plan; }
    int plan_generation() const { return generation; }

    int passengers_boarded()  const { return m_boarded_total; }
    int passengers_alighted() const { return m_alighted_total; }
    int legs_completed()      const { return m_legs_completed_total; }
    int legs_aborted()        const { return m_legs_aborted_total; }
    int schedules_accepted()  const { return m_schedules_accepted_total; }

    // names of the messages handled so far, in handling order
    const std::vector<std::string>& message_log() const { return handled; }

private:
    struct MessageHandler;

    void handle(const VehicleMessage& msg);
    void handle_interrupt(const Interrupt& msg);
    void handle_stop_driving(const StopDriving& msg);
    void handle_modify(const ModifyPassengerSchedule& msg);
    void handle_resume();

    ScheduleTrigger start_leg(int tick);
    Coord position_at(int tick) const;
    void reply(const InterruptReply& r);
    void post_ack(const ModifyPassengerScheduleAck& ack);

    VehicleId vehicle_id;
    MessageBus& bus;
    FleetStateTracker& fleet;
    DispatcherPort port;

    DriveState drive_state = DriveState::Idle;
    bool paused = false;
    Coord current_location;

    PassengerSchedule plan;
    std::vector<Leg> remaining;
    size_t current_leg = 0;
    int leg_started_at = 0;
    int generation = 0;

    boost::optional<ModifyPassengerSchedule> pending_modify;

    std::vector<std::string> handled;

    int m_boarded_total            = 0;
    int m_alighted_total           = 0;
    int m_legs_completed_total     = 0;
    int m_legs_aborted_total       = 0;
    int m_schedules_accepted_total = 0;
};

} // namespace rhdispatch
