#include "SimulatedVehicle.h"

#include <algorithm>
#include <iostream>

namespace rhdispatch {

struct SimulatedVehicle::MessageHandler : public boost::static_visitor<void> {
    SimulatedVehicle& v;
    explicit MessageHandler(SimulatedVehicle& v) : v(v) {}

    void operator()(const Interrupt& msg) const { v.handle_interrupt(msg); }
    void operator()(const StopDriving& msg) const { v.handle_stop_driving(msg); }
    void operator()(const ModifyPassengerSchedule& msg) const { v.handle_modify(msg); }
    void operator()(const Resume&) const { v.handle_resume(); }
};

SimulatedVehicle::SimulatedVehicle(const VehicleId& id, const Coord& start, MessageBus& bus,
                                   FleetStateTracker& fleet, const DispatcherPort& port)
    : vehicle_id(id), bus(bus), fleet(fleet), port(port), current_location(start) {}

void SimulatedVehicle::send(const VehicleMessage& msg)
{
    bus.post(vehicle_id, [this, msg]() { handle(msg); });
}

void SimulatedVehicle::handle(const VehicleMessage& msg)
{
    handled.push_back(message_name(msg));
    boost::apply_visitor(MessageHandler(*this), msg);
}

void SimulatedVehicle::handle_interrupt(const Interrupt& msg)
{
    paused = true;
    switch (drive_state)
    {
        case DriveState::Driving:
            reply(InterruptReply::driving(msg.interrupt_id, vehicle_id, msg.tick, plan));
            break;
        case DriveState::Idle:
            reply(InterruptReply::idle(msg.interrupt_id, vehicle_id, msg.tick));
            break;
        case DriveState::Offline:
            reply(InterruptReply::offline(msg.interrupt_id, vehicle_id, msg.tick));
            break;
    }
}

void SimulatedVehicle::handle_stop_driving(const StopDriving& msg)
{
    if (drive_state != DriveState::Driving)
        return;
    current_location = position_at(msg.tick);
    m_legs_aborted_total += (int)(remaining.size() - current_leg);
    plan = PassengerSchedule();
    remaining.clear();
    current_leg = 0;
    generation++;
    drive_state = DriveState::Idle;
    fleet.set_idle(vehicle_id, current_location);
}

void SimulatedVehicle::handle_modify(const ModifyPassengerSchedule& msg)
{
    pending_modify = msg;
}

void SimulatedVehicle::handle_resume()
{
    paused = false;
    if (!pending_modify)
        return;

    const ModifyPassengerSchedule modify = *pending_modify;
    pending_modify = boost::none;

    ModifyPassengerScheduleAck ack;
    ack.vehicle_id = vehicle_id;
    ack.tick = modify.tick;
    ack.reservation_request_id = modify.reservation_request_id;

    if (drive_state == DriveState::Offline)
    {
        // went offline after replying; the schedule is refused but still acknowledged
        std::cerr << "[WARN] offline vehicle " << vehicle_id << " refused a passenger schedule" << std::endl;
        ack.accepted = false;
        post_ack(ack);
        return;
    }

    generation++;
    plan = modify.updated_schedule;
    remaining = plan.leg_sequence();
    current_leg = 0;
    m_schedules_accepted_total++;

    if (remaining.empty())
    {
        drive_state = DriveState::Idle;
        fleet.set_idle(vehicle_id, current_location);
    }
    else
    {
        drive_state = DriveState::Driving;
        fleet.set_in_service(vehicle_id, current_location);
        ack.triggers_to_schedule.push_back(start_leg(modify.tick));
    }
    post_ack(ack);
}

std::vector<ScheduleTrigger> SimulatedVehicle::end_leg(int tick, int leg_generation)
{
    std::vector<ScheduleTrigger> next;
    if (leg_generation != generation || drive_state != DriveState::Driving || current_leg >= remaining.size())
        return next;   // superseded plan

    if (paused)
    {
        // cannot finish a leg while held; try again a second later
        next.emplace_back(TriggerKind::EndLeg, tick + 1, vehicle_id, generation);
        return next;
    }

    const Leg& leg = remaining[current_leg];
    current_location = leg.destination;
    m_alighted_total += (int)plan.manifest(leg).alighters.size();
    m_legs_completed_total++;
    current_leg++;

    if (current_leg < remaining.size())
    {
        fleet.set_in_service(vehicle_id, current_location);
        next.push_back(start_leg(tick));
        return next;
    }

    plan = PassengerSchedule();
    remaining.clear();
    current_leg = 0;
    drive_state = DriveState::Idle;
    fleet.set_idle(vehicle_id, current_location);
    return next;
}

ScheduleTrigger SimulatedVehicle::start_leg(int tick)
{
    const Leg& leg = remaining[current_leg];
    leg_started_at = std::max(tick, leg.start_time);
    m_boarded_total += (int)plan.manifest(leg).boarders.size();
    return ScheduleTrigger(TriggerKind::EndLeg, leg_started_at + leg.duration, vehicle_id, generation);
}

Coord SimulatedVehicle::position_at(int tick) const
{
    if (current_leg >= remaining.size())
        return current_location;
    const Leg& leg = remaining[current_leg];
    if (leg.duration <= 0 || tick <= leg_started_at)
        return current_location;
    const double f = std::min(1.0, (double)(tick - leg_started_at) / leg.duration);
    return Coord(current_location.x + f * (leg.destination.x - current_location.x),
                 current_location.y + f * (leg.destination.y - current_location.y));
}

void SimulatedVehicle::reply(const InterruptReply& r)
{
    bus.post(port.mailbox, [this, r]() {
        if (port.on_interrupt_reply)
            port.on_interrupt_reply(r);
    });
}

void SimulatedVehicle::post_ack(const ModifyPassengerScheduleAck& ack)
{
    bus.post(port.mailbox, [this, ack]() {
        if (port.on_modify_ack)
            port.on_modify_ack(ack);
    });
}

void SimulatedVehicle::go_offline(int /*tick*/)
{
    if (drive_state == DriveState::Driving)
        m_legs_aborted_total += (int)(remaining.size() - current_leg);
    plan = PassengerSchedule();
    remaining.clear();
    current_leg = 0;
    generation++;
    drive_state = DriveState::Offline;
    fleet.set_out_of_service(vehicle_id, current_location);
}

void SimulatedVehicle::go_online(int /*tick*/)
{
    if (drive_state != DriveState::Offline)
        return;
    drive_state = DriveState::Idle;
    fleet.set_idle(vehicle_id, current_location);
}

} // namespace rhdispatch
