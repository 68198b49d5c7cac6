#include "WaveController.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using std::cout;
using std::endl;

namespace rhdispatch {

const char* wave_name(WaveKind kind)
{
    return kind == WaveKind::Reposition ? "Reposition" : "BatchedReservation";
}

void WaveController::hold_tick_and_trigger(int tick, long long trigger_id)
{
    if (held)
    {
        std::cerr << "[BUG] trigger " << held->second << " @ " << held->first
                  << " still held while holding trigger " << trigger_id << std::endl;
        throw std::logic_error("tick and trigger id already held");
    }
    held = std::make_pair(tick, trigger_id);
}

std::pair<int, long long> WaveController::release_tick_and_trigger()
{
    if (!held)
    {
        std::cerr << "[BUG] completion requested without a held tick/trigger" << std::endl;
        throw std::logic_error("no tick and trigger id held");
    }
    auto out = *held;
    held = boost::none;
    return out;
}

void WaveController::begin(WaveKind kind, const std::set<VehicleId>& vehicles, int tick, long long trigger_id)
{
    if (active)
    {
        std::cerr << "[BUG] " << wave_name(kind) << " wave begun while a "
                  << wave_name(wave_kind) << " wave is still waiting for "
                  << waiting.size() << " vehicles" << std::endl;
        throw std::logic_error("wave already active");
    }
    hold_tick_and_trigger(tick, trigger_id);
    active = true;
    wave_kind = kind;
    waiting = vehicles;

    if (screen > 1)
        cout << "[t=" << tick << "] " << wave_name(kind) << " wave over "
             << waiting.size() << " vehicles" << endl;

    if (waiting.empty())
        wave_complete();
}

void WaveController::vehicle_resolved(const VehicleId& vehicle_id)
{
    if (!active || waiting.erase(vehicle_id) == 0)
    {
        std::cerr << "[ERROR] vehicle " << vehicle_id << " not found in waiting set" << std::endl;
        m_unknown_resolutions_total++;
        return;
    }
    if (waiting.empty())
        wave_complete();
}

void WaveController::add_trigger_to_send_with_completion(const ScheduleTrigger& trigger)
{
    all_triggers_in_wave.push_back(trigger);
}

void WaveController::add_triggers_to_send_with_completion(const std::vector<ScheduleTrigger>& triggers)
{
    all_triggers_in_wave.insert(all_triggers_in_wave.end(), triggers.begin(), triggers.end());
}

void WaveController::wave_complete()
{
    const auto held_trigger = release_tick_and_trigger();
    const int current_tick = held_trigger.first;
    const WaveKind kind = wave_kind;
    active = false;

    ScheduleTrigger timer = (kind == WaveKind::Reposition)
        ? ScheduleTrigger(TriggerKind::Reposition, current_tick + reposition_interval)
        : ScheduleTrigger(TriggerKind::BufferedRequests, current_tick + buffer_interval);

    if (screen > 1 && !all_triggers_in_wave.empty())
    {
        auto mm = std::minmax_element(all_triggers_in_wave.begin(), all_triggers_in_wave.end(),
                                      [](const ScheduleTrigger& a, const ScheduleTrigger& b) {
                                          return a.tick < b.tick;
                                      });
        cout << "Earliest tick in triggers to schedule is " << mm.first->tick
             << " and latest is " << mm.second->tick << endl;
    }

    CompletionNotice notice(held_trigger.second, all_triggers_in_wave);
    notice.new_triggers.push_back(timer);
    all_triggers_in_wave.clear();
    m_waves_completed_total++;

    sink(notice);
    if (on_wave_complete)
        on_wave_complete(kind, current_tick);
}

void WaveController::cancel()
{
    if (active && screen > 0)
        cout << "Cancelling " << wave_name(wave_kind) << " wave with "
             << waiting.size() << " vehicles outstanding" << endl;
    active = false;
    waiting.clear();
    all_triggers_in_wave.clear();
    held = boost::none;
}

} // namespace rhdispatch
