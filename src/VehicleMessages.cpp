#include "VehicleMessages.h"

namespace rhdispatch {

namespace {

struct MessageNameVisitor : public boost::static_visitor<const char*> {
    const char* operator()(const Interrupt&) const { return "Interrupt"; }
    const char* operator()(const StopDriving&) const { return "StopDriving"; }
    const char* operator()(const ModifyPassengerSchedule&) const { return "ModifyPassengerSchedule"; }
    const char* operator()(const Resume&) const { return "Resume"; }
};

} // namespace

const char* message_name(const VehicleMessage& msg)
{
    return boost::apply_visitor(MessageNameVisitor(), msg);
}

const char* reply_name(InterruptReply::Kind kind)
{
    switch (kind)
    {
        case InterruptReply::Kind::WhileDriving: return "InterruptedWhileDriving";
        case InterruptReply::Kind::WhileIdle:    return "InterruptedWhileIdle";
        case InterruptReply::Kind::WhileOffline: return "InterruptedWhileOffline";
    }
    return "UnknownReply";
}

InterruptReply InterruptReply::driving(const InterruptId& interrupt_id, const VehicleId& vehicle_id,
                                       int tick, const PassengerSchedule& schedule)
{
    InterruptReply r;
    r.kind = Kind::WhileDriving;
    r.interrupt_id = interrupt_id;
    r.vehicle_id = vehicle_id;
    r.tick = tick;
    r.passenger_schedule = schedule;
    return r;
}

InterruptReply InterruptReply::idle(const InterruptId& interrupt_id, const VehicleId& vehicle_id, int tick)
{
    InterruptReply r;
    r.kind = Kind::WhileIdle;
    r.interrupt_id = interrupt_id;
    r.vehicle_id = vehicle_id;
    r.tick = tick;
    return r;
}

InterruptReply InterruptReply::offline(const InterruptId& interrupt_id, const VehicleId& vehicle_id, int tick)
{
    InterruptReply r;
    r.kind = Kind::WhileOffline;
    r.interrupt_id = interrupt_id;
    r.vehicle_id = vehicle_id;
    r.tick = tick;
    return r;
}

} // namespace rhdispatch
