#pragma once
// inc/VehicleMessages.h
//
// Protocol between the dispatcher and the vehicle agents.
//   dispatcher -> vehicle : Interrupt, StopDriving, ModifyPassengerSchedule, Resume
//   vehicle -> dispatcher : InterruptReply (driving / idle / offline),
//                           ModifyPassengerScheduleAck

#include "DispatchTypes.h"
#include "PassengerSchedule.h"
#include "Triggers.h"

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <vector>

namespace rhdispatch {

struct Interrupt {
    InterruptId interrupt_id;
    int tick = 0;
};

struct StopDriving {
    int tick = 0;
};

struct ModifyPassengerSchedule {
    PassengerSchedule updated_schedule;
    int tick = 0;
    boost::optional<RequestId> reservation_request_id;
};

struct Resume {};

typedef boost::variant<Interrupt, StopDriving, ModifyPassengerSchedule, Resume> VehicleMessage;

const char* message_name(const VehicleMessage& msg);

// The vehicle's true condition when the interrupt reached it. The kind is a
// closed tag; only WhileDriving carries the schedule the vehicle was executing.
struct InterruptReply {
    enum class Kind { WhileDriving, WhileIdle, WhileOffline };

    Kind kind = Kind::WhileIdle;
    InterruptId interrupt_id;
    VehicleId vehicle_id;
    int tick = 0;
    PassengerSchedule passenger_schedule;

    static InterruptReply driving(const InterruptId& interrupt_id, const VehicleId& vehicle_id,
                                  int tick, const PassengerSchedule& schedule);
    static InterruptReply idle(const InterruptId& interrupt_id, const VehicleId& vehicle_id, int tick);
    static InterruptReply offline(const InterruptId& interrupt_id, const VehicleId& vehicle_id, int tick);
};

const char* reply_name(InterruptReply::Kind kind);

struct ModifyPassengerScheduleAck {
    VehicleId vehicle_id;
    std::vector<ScheduleTrigger> triggers_to_schedule;
    int tick = 0;
    boost::optional<RequestId> reservation_request_id;
    bool accepted = true;   // false when the vehicle could not take the schedule
};

// The only capability the dispatcher needs from a vehicle: who it is and a
// fire-and-forget mailbox.
class VehicleAgent
{
public:
    virtual ~VehicleAgent() {}
    virtual const VehicleId& id() const = 0;
    virtual void send(const VehicleMessage& msg) = 0;
};

} // namespace rhdispatch
