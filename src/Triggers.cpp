#include "Triggers.h"

namespace rhdispatch {

const char* trigger_name(TriggerKind kind)
{
    switch (kind)
    {
        case TriggerKind::Reposition:       return "RepositioningTrigger";
        case TriggerKind::BufferedRequests: return "BufferedRequestsTrigger";
        case TriggerKind::RequestArrival:   return "RequestArrivalTrigger";
        case TriggerKind::EndLeg:           return "EndLegTrigger";
    }
    return "UnknownTrigger";
}

} // namespace rhdispatch
