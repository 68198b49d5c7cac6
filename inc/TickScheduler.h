#pragma once
// inc/TickScheduler.h
//
// Step-synchronized discrete-event scheduler. Triggers are ordered by
// (tick, insertion order); each delivered trigger gets a fresh trigger id and
// stays outstanding until its receiver sends back a CompletionNotice, whose
// carried triggers are then scheduled.

#include "Triggers.h"

#include <boost/heap/fibonacci_heap.hpp>

#include <functional>
#include <map>

namespace rhdispatch {

class TickScheduler
{
public:
    typedef std::function<void(const ScheduleTrigger& trigger, long long trigger_id)> Handler;

    int screen = 0;

    TickScheduler() = default;

    void register_handler(TriggerKind kind, Handler handler);

    // Triggers in the past are moved to the current tick.
    void schedule(const ScheduleTrigger& trigger);
    void complete(const CompletionNotice& notice);

    // Delivers the earliest trigger. false when nothing is queued.
    bool step();

    bool empty() const { return queue.empty(); }
    int  next_tick() const;   // INT_MAX when empty
    int  now() const { return current_tick; }

    size_t num_queued() const { return queue.size(); }
    size_t num_outstanding() const { return outstanding.size(); }
    bool is_outstanding(long long trigger_id) const { return outstanding.count(trigger_id) > 0; }

    long long triggers_delivered() const { return m_delivered_total; }
    long long unknown_completions() const { return m_unknown_completions_total; }

private:
    struct QueuedTrigger {
        ScheduleTrigger trigger;
        long long seq = 0;
    };
    struct QueuedTriggerCompare {
        // min-heap on (tick, seq)
        bool operator()(const QueuedTrigger& a, const QueuedTrigger& b) const
        {
            if (a.trigger.tick != b.trigger.tick)
                return a.trigger.tick > b.trigger.tick;
            return a.seq > b.seq;
        }
    };
    typedef boost::heap::fibonacci_heap<QueuedTrigger, boost::heap::compare<QueuedTriggerCompare>> TriggerHeap;

    TriggerHeap queue;
    std::map<TriggerKind, Handler> handlers;
    std::map<long long, ScheduleTrigger> outstanding;

    int current_tick = 0;
    long long next_seq = 0;
    long long next_trigger_id = 0;

    long long m_delivered_total = 0;
    long long m_unknown_completions_total = 0;
};

} // namespace rhdispatch
