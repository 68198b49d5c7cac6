#include "TickScheduler.h"

#include <climits>
#include <iostream>

using std::cout;
using std::endl;

namespace rhdispatch {

void TickScheduler::register_handler(TriggerKind kind, Handler handler)
{
    handlers[kind] = std::move(handler);
}

void TickScheduler::schedule(const ScheduleTrigger& trigger)
{
    QueuedTrigger q;
    q.trigger = trigger;
    q.seq = next_seq++;
    if (q.trigger.tick < current_tick)
    {
        if (screen > 1)
            cout << "WARN " << trigger_name(trigger.kind) << " scheduled in the past ("
                 << trigger.tick << " < " << current_tick << "); moved to now" << endl;
        q.trigger.tick = current_tick;
    }
    queue.push(q);
}

void TickScheduler::complete(const CompletionNotice& notice)
{
    auto it = outstanding.find(notice.trigger_id);
    if (it == outstanding.end())
    {
        m_unknown_completions_total++;
        std::cerr << "[ERROR] completion for unknown trigger id " << notice.trigger_id << std::endl;
        return;
    }
    outstanding.erase(it);
    for (const auto& t : notice.new_triggers)
        schedule(t);
}

int TickScheduler::next_tick() const
{
    if (queue.empty())
        return INT_MAX;
    return queue.top().trigger.tick;
}

bool TickScheduler::step()
{
    if (queue.empty())
        return false;

    QueuedTrigger q = queue.top();
    queue.pop();
    current_tick = q.trigger.tick;

    const long long trigger_id = next_trigger_id++;
    outstanding.emplace(trigger_id, q.trigger);
    m_delivered_total++;

    auto h = handlers.find(q.trigger.kind);
    if (h == handlers.end() || !h->second)
    {
        std::cerr << "[ERROR] no handler for " << trigger_name(q.trigger.kind) << std::endl;
        outstanding.erase(trigger_id);
        return true;
    }

    if (screen > 1)
        cout << "[t=" << current_tick << "] deliver " << trigger_name(q.trigger.kind)
             << " #" << trigger_id << endl;
    h->second(q.trigger, trigger_id);
    return true;
}

} // namespace rhdispatch
