#pragma once
// inc/Triggers.h
//
// Messages exchanged with the step-synchronized tick scheduler.

#include <string>
#include <vector>

namespace rhdispatch {

enum class TriggerKind {
    Reposition = 0,        // next repositioning wave
    BufferedRequests = 1,  // next batched-reservation wave
    RequestArrival = 2,    // a customer request enters the system
    EndLeg = 3             // a vehicle finishes its current leg
};

const char* trigger_name(TriggerKind kind);

struct ScheduleTrigger {
    TriggerKind kind = TriggerKind::Reposition;
    int tick = 0;
    std::string target;   // receiving vehicle for EndLeg, empty otherwise
    int payload = -1;     // request index for RequestArrival, plan generation for EndLeg

    ScheduleTrigger() = default;
    ScheduleTrigger(TriggerKind kind, int tick, const std::string& target = "", int payload = -1)
        : kind(kind), tick(tick), target(target), payload(payload) {}
};

// One completion per delivered trigger; carries every trigger the receiver
// wants scheduled next.
struct CompletionNotice {
    long long trigger_id = -1;
    std::vector<ScheduleTrigger> new_triggers;

    CompletionNotice() = default;
    CompletionNotice(long long trigger_id, const std::vector<ScheduleTrigger>& new_triggers)
        : trigger_id(trigger_id), new_triggers(new_triggers) {}
};

} // namespace rhdispatch
