#include "DispatchSystem.h"

#include <boost/tokenizer.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <random>

using boost::char_separator;
using boost::tokenizer;
using std::cout;
using std::endl;

namespace rhdispatch {

DispatchSystem::DispatchSystem()
    : allocator(tracker),
      wave_controller([this](const CompletionNotice& notice) { scheduler.complete(notice); }),
      coordinator(tracker, wave_controller)
{
    wave_controller.on_wave_complete = [this](WaveKind kind, int tick) { on_wave_complete(kind, tick); };
    coordinator.on_reservation_failed = [this](RequestId id) { on_reservation_failed(id); };

    scheduler.register_handler(TriggerKind::Reposition,
        [this](const ScheduleTrigger& t, long long id) { on_reposition_trigger(t, id); });
    scheduler.register_handler(TriggerKind::BufferedRequests,
        [this](const ScheduleTrigger& t, long long id) { on_buffered_requests_trigger(t, id); });
    scheduler.register_handler(TriggerKind::RequestArrival,
        [this](const ScheduleTrigger& t, long long id) { on_request_arrival(t, id); });
    scheduler.register_handler(TriggerKind::EndLeg,
        [this](const ScheduleTrigger& t, long long id) { on_end_leg(t, id); });
}

DispatchSystem::~DispatchSystem() = default;

// ------------------------------- setup --------------------------------------

bool DispatchSystem::add_vehicle(const VehicleId& id, const Coord& location, bool offline)
{
    if (vehicles.count(id))
    {
        std::cerr << "Vehicle " << id << " is defined twice" << endl;
        return false;
    }

    DispatcherPort port;
    port.on_interrupt_reply = [this](const InterruptReply& r) { on_interrupt_reply(r); };
    port.on_modify_ack = [this](const ModifyPassengerScheduleAck& a) { on_modify_ack(a); };

    std::unique_ptr<SimulatedVehicle> v(new SimulatedVehicle(id, location, bus, tracker, port));
    tracker.add_vehicle(id, v.get(), location);
    if (offline)
        v->go_offline(0);
    vehicles[id] = std::move(v);
    return true;
}

bool DispatchSystem::add_request(const VehicleAllocationRequest& request)
{
    if (request_index.count(request.request_id))
    {
        std::cerr << "Request " << request.request_id << " is defined twice" << endl;
        return false;
    }
    CustomerRequest cr;
    cr.request = request;
    request_index[request.request_id] = requests.size();
    requests.push_back(cr);
    return true;
}

// fleet file: first line is the number of vehicles, then id,x,y[,offline]
bool DispatchSystem::load_fleet(const std::string& fname)
{
    std::ifstream myfile(fname.c_str());
    if (!myfile.is_open())
    {
        std::cerr << "Fleet file " << fname << " not found." << endl;
        return false;
    }

    std::string line;
    getline(myfile, line);
    const int n = atoi(line.c_str());
    char_separator<char> sep(",");
    for (int k = 0; k < n; k++)
    {
        if (!getline(myfile, line))
        {
            std::cerr << "Fleet file " << fname << " ends after " << k << " of " << n << " vehicles." << endl;
            return false;
        }
        tokenizer<char_separator<char>> tok(line, sep);
        std::vector<std::string> fields(tok.begin(), tok.end());
        if (fields.size() < 3)
        {
            std::cerr << "Malformed vehicle line: " << line << endl;
            return false;
        }
        const bool offline = fields.size() > 3 && atoi(fields[3].c_str()) != 0;
        if (!add_vehicle(fields[0], Coord(atof(fields[1].c_str()), atof(fields[2].c_str())), offline))
            return false;
    }
    myfile.close();
    return true;
}

// request file: first line is the number of requests, then id,time,px,py,dx,dy
bool DispatchSystem::load_requests(const std::string& fname)
{
    std::ifstream myfile(fname.c_str());
    if (!myfile.is_open())
    {
        std::cerr << "Request file " << fname << " not found." << endl;
        return false;
    }

    std::string line;
    getline(myfile, line);
    const int n = atoi(line.c_str());
    char_separator<char> sep(",");
    for (int k = 0; k < n; k++)
    {
        if (!getline(myfile, line))
        {
            std::cerr << "Request file " << fname << " ends after " << k << " of " << n << " requests." << endl;
            return false;
        }
        tokenizer<char_separator<char>> tok(line, sep);
        std::vector<std::string> fields(tok.begin(), tok.end());
        if (fields.size() < 6)
        {
            std::cerr << "Malformed request line: " << line << endl;
            return false;
        }
        VehicleAllocationRequest r;
        r.request_id = atoi(fields[0].c_str());
        r.person_id = "person-" + fields[0];
        r.request_time = atoi(fields[1].c_str());
        r.pickup = Coord(atof(fields[2].c_str()), atof(fields[3].c_str()));
        r.dropoff = Coord(atof(fields[4].c_str()), atof(fields[5].c_str()));
        if (!add_request(r))
            return false;
    }
    myfile.close();
    return true;
}

void DispatchSystem::generate_random_fleet()
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> coord(0, area_size);
    std::uniform_real_distribution<double> unit(0, 1);
    for (int k = 0; k < num_of_vehicles; k++)
    {
        const double x = coord(rng);
        const double y = coord(rng);
        add_vehicle("rideHailVehicle-" + std::to_string(k), Coord(x, y), unit(rng) < offline_fraction);
    }
}

void DispatchSystem::generate_random_requests()
{
    std::mt19937 rng(seed + 1);
    std::uniform_real_distribution<double> coord(0, area_size);
    std::uniform_int_distribution<int> when(0, std::max(0, simulation_time - 1));
    for (int k = 0; k < num_of_requests; k++)
    {
        VehicleAllocationRequest r;
        r.request_id = k;
        r.person_id = "person-" + std::to_string(k);
        r.request_time = when(rng);
        r.pickup.x = coord(rng);
        r.pickup.y = coord(rng);
        r.dropoff.x = coord(rng);
        r.dropoff.y = coord(rng);
        add_request(r);
    }
}

void DispatchSystem::initialize()
{
    wave_controller.reposition_interval = reposition_interval;
    wave_controller.buffer_interval = buffer_interval;
    wave_controller.screen = screen;
    coordinator.screen = screen;
    coordinator.interrupt_timeout = interrupt_timeout;
    scheduler.screen = screen;
    allocator.search_radius = search_radius;
    bus.seed(seed);

    if (vehicles.empty())
    {
        if (screen > 0)
            cout << "Randomly generating " << num_of_vehicles << " vehicles" << endl;
        generate_random_fleet();
    }
    if (requests.empty())
    {
        if (screen > 0)
            cout << "Randomly generating " << num_of_requests << " requests" << endl;
        generate_random_requests();
    }

    for (size_t i = 0; i < requests.size(); i++)
        scheduler.schedule(ScheduleTrigger(TriggerKind::RequestArrival, requests[i].request.request_time, "", (int)i));
    if (reposition_interval > 0)
        scheduler.schedule(ScheduleTrigger(TriggerKind::Reposition, 0));
    if (allocation_mode == AllocationMode::Buffered)
        scheduler.schedule(ScheduleTrigger(TriggerKind::BufferedRequests, 0));
}

// ------------------------------- simulation ---------------------------------

void DispatchSystem::simulate(int simulation_time)
{
    if (screen > 0)
        cout << "*** Simulating " << seed << " ***" << endl;
    this->simulation_time = simulation_time;
    clock_t start = std::clock();
    initialize();

    while (!scheduler.empty() && scheduler.next_tick() < simulation_time)
    {
        scheduler.step();
        bus.pump();
    }

    // teardown: nothing may reach the dispatcher any more
    shutting_down = true;
    wave_controller.cancel();
    coordinator.clear_all_pending_interrupts();
    bus.pump();

    const double runtime = (double)(std::clock() - start) / CLOCKS_PER_SEC;
    if (screen > 0)
    {
        cout << "Done! (" << runtime << " s)" << endl;
        print_summary();
        coordinator.metrics_print_summary();
    }
    if (!outfile.empty())
        save_results();
}

void DispatchSystem::on_reposition_trigger(const ScheduleTrigger& trigger, long long trigger_id)
{
    coordinator.expire_unanswered_interrupts(trigger.tick);
    if (defer_if_wave_active(trigger, trigger_id))
        return;
    wave_planned = false;
    coordinator.begin_wave_over_fleet(WaveKind::Reposition, trigger.tick, trigger_id);
    maybe_plan_wave();
}

void DispatchSystem::on_buffered_requests_trigger(const ScheduleTrigger& trigger, long long trigger_id)
{
    coordinator.expire_unanswered_interrupts(trigger.tick);
    if (defer_if_wave_active(trigger, trigger_id))
        return;
    drop_expired_requests(trigger.tick);

    wave_planned = false;
    bool any_ready = false;
    for (size_t idx : buffered)
        if (requests[idx].request.request_time <= trigger.tick)
            any_ready = true;

    if (any_ready)
        coordinator.begin_wave_over_fleet(WaveKind::BatchedReservation, trigger.tick, trigger_id);
    else
        coordinator.begin_wave(WaveKind::BatchedReservation, std::set<VehicleId>(), trigger.tick, trigger_id);
    maybe_plan_wave();
}

// One wave at a time: a timer that fires during another wave is retried next tick.
bool DispatchSystem::defer_if_wave_active(const ScheduleTrigger& trigger, long long trigger_id)
{
    if (!wave_controller.is_active())
        return false;
    if (screen > 1)
        cout << "[t=" << trigger.tick << "] " << trigger_name(trigger.kind) << " deferred, "
             << wave_name(wave_controller.kind()) << " wave still open" << endl;
    m_deferred_waves_total++;
    scheduler.complete(CompletionNotice(trigger_id, {ScheduleTrigger(trigger.kind, trigger.tick + 1)}));
    return true;
}

void DispatchSystem::on_request_arrival(const ScheduleTrigger& trigger, long long trigger_id)
{
    if (trigger.payload < 0 || trigger.payload >= (int)requests.size())
    {
        std::cerr << "[ERROR] request arrival for unknown request index " << trigger.payload << endl;
        scheduler.complete(CompletionNotice(trigger_id, {}));
        return;
    }
    const size_t idx = (size_t)trigger.payload;
    if (screen > 1)
        cout << "[t=" << trigger.tick << "] request " << requests[idx].request.request_id << " arrives" << endl;

    if (allocation_mode == AllocationMode::Buffered)
    {
        buffered.push_back(idx);
        scheduler.complete(CompletionNotice(trigger_id, {}));
        return;
    }
    try_single_reservation(idx, trigger.tick, trigger_id);
}

void DispatchSystem::on_end_leg(const ScheduleTrigger& trigger, long long trigger_id)
{
    std::vector<ScheduleTrigger> next;
    auto it = vehicles.find(trigger.target);
    if (it == vehicles.end())
        std::cerr << "[ERROR] EndLeg for unknown vehicle " << trigger.target << endl;
    else
        next = it->second->end_leg(trigger.tick, trigger.payload);
    scheduler.complete(CompletionNotice(trigger_id, next));
}

// ------------------------------- callbacks ----------------------------------

void DispatchSystem::on_interrupt_reply(const InterruptReply& reply)
{
    if (shutting_down)
        return;
    coordinator.on_interrupt_reply(reply);

    const ModificationAttempt* attempt = coordinator.attempt_for_interrupt(reply.interrupt_id);
    if (attempt != nullptr && attempt->origin == InterruptOrigin::SingleReservation &&
        attempt->interrupt_reply && attempt->status == AttemptStatus::InterruptSent)
    {
        const VehicleId vid = attempt->vehicle_id;
        const PassengerSchedule schedule = attempt->modify_passenger_schedule.updated_schedule;
        const boost::optional<RequestId> rid = attempt->modify_passenger_schedule.reservation_request_id;
        coordinator.apply_mutation(vid, schedule, scheduler.now(), rid);
    }
    maybe_plan_wave();
}

void DispatchSystem::on_modify_ack(const ModifyPassengerScheduleAck& ack)
{
    if (shutting_down)
        return;
    std::vector<ScheduleTrigger> leftover =
        coordinator.acknowledge_mutation(ack.vehicle_id, ack.triggers_to_schedule, scheduler.now());

    if (!ack.accepted)
    {
        m_refused_schedules_total++;
        if (ack.reservation_request_id)
            on_reservation_failed(*ack.reservation_request_id);
        for (const auto& t : leftover)
            scheduler.schedule(t);
        return;
    }

    if (ack.reservation_request_id)
    {
        auto it = request_index.find(*ack.reservation_request_id);
        if (it != request_index.end())
        {
            requests[it->second].outcome = CustomerRequest::Outcome::Assigned;
            in_flight.erase(it->second);
            if (screen > 1)
                cout << "[t=" << scheduler.now() << "] request " << *ack.reservation_request_id
                     << " assigned to " << ack.vehicle_id << endl;
        }
        auto jt = request_triggers.find(*ack.reservation_request_id);
        if (jt != request_triggers.end())
        {
            const long long trigger_id = jt->second;
            request_triggers.erase(jt);
            scheduler.complete(CompletionNotice(trigger_id, leftover));
            leftover.clear();
        }
    }
    for (const auto& t : leftover)
        scheduler.schedule(t);
}

void DispatchSystem::on_reservation_failed(RequestId request_id)
{
    if (shutting_down)
        return;
    m_reservation_failures_total++;
    auto it = request_index.find(request_id);
    if (it == request_index.end())
    {
        std::cerr << "[ERROR] reservation failed for unknown request " << request_id << endl;
        return;
    }
    const size_t idx = it->second;
    in_flight.erase(idx);

    auto jt = request_triggers.find(request_id);
    if (jt != request_triggers.end())
    {
        const long long trigger_id = jt->second;
        request_triggers.erase(jt);
        retry_or_drop(idx, scheduler.now(), trigger_id);
        return;
    }
    if (allocation_mode == AllocationMode::Buffered)
        buffered.push_back(idx);   // next batched wave tries again
    else
        requests[idx].outcome = CustomerRequest::Outcome::Unserved;
}

void DispatchSystem::on_wave_complete(WaveKind kind, int tick)
{
    // both coordinator indices are drained by the time a wave resolves
    if (!coordinator.is_cache_empty() || coordinator.num_pending_replies() != 0)
    {
        m_unclean_waves_total++;
        std::cerr << "[BUG] " << wave_name(kind) << " wave @ " << tick << " completed with "
                  << coordinator.num_attempts() << " attempts still cached" << endl;
    }
    if (screen > 1)
        cout << "[t=" << tick << "] " << wave_name(kind) << " wave complete" << endl;
    if (!metrics_csv_path.empty())
        metrics_log_wave(kind, tick);
}

// ------------------------------- planning -----------------------------------

void DispatchSystem::maybe_plan_wave()
{
    if (!wave_controller.is_active() || wave_planned || !coordinator.all_interrupt_confirmations_received())
        return;
    wave_planned = true;
    if (wave_controller.kind() == WaveKind::Reposition)
        plan_reposition_wave(scheduler.now());
    else
        plan_reservation_wave(scheduler.now());
}

bool DispatchSystem::is_held_and_idle(const VehicleId& vehicle_id) const
{
    const ModificationAttempt* a = coordinator.attempt_for(vehicle_id);
    return a != nullptr && a->origin == InterruptOrigin::HoldForPlanning &&
           a->status == AttemptStatus::InterruptSent && a->interrupt_reply &&
           a->interrupt_reply->kind == InterruptReply::Kind::WhileIdle &&
           wave_controller.is_waiting_for(vehicle_id);
}

void DispatchSystem::plan_reposition_wave(int tick)
{
    const std::set<VehicleId> members = wave_controller.waiting_vehicles();
    auto moves = allocator.reposition_vehicles(tick, [this](const VehicleId& vid) { return is_held_and_idle(vid); });

    std::set<VehicleId> moved;
    for (const auto& move : moves)
    {
        const VehicleLocation* loc = tracker.get(move.first);
        if (loc == nullptr)
            continue;
        moved.insert(move.first);
        m_repositions_total++;
        if (screen > 1)
            cout << "[t=" << tick << "] reposition " << move.first << " to ("
                 << move.second.x << "," << move.second.y << ")" << endl;
        coordinator.apply_mutation(move.first, build_reposition_schedule(loc->location, move.second, tick), tick);
    }

    for (const auto& vid : members)
    {
        if (!moved.count(vid) && wave_controller.is_active() && wave_controller.is_waiting_for(vid))
            coordinator.release_hold(vid);
    }
}

void DispatchSystem::plan_reservation_wave(int tick)
{
    const std::set<VehicleId> members = wave_controller.waiting_vehicles();

    std::vector<size_t> ready;
    std::vector<VehicleAllocationRequest> batch;
    for (size_t idx : buffered)
    {
        if (requests[idx].request.request_time <= tick)
        {
            ready.push_back(idx);
            batch.push_back(requests[idx].request);
        }
    }

    auto results = allocator.allocate_batch(batch, [this](const VehicleId& vid) { return is_held_and_idle(vid); });

    std::set<VehicleId> used;
    std::set<size_t> assigned;
    std::vector<std::pair<VehicleId, size_t>> commits;
    for (size_t i = 0; i < results.size(); i++)
    {
        if (!results[i].second)
            continue;
        used.insert(results[i].second->vehicle_id);
        assigned.insert(ready[i]);
        commits.emplace_back(results[i].second->vehicle_id, ready[i]);
    }

    // take the assigned requests out of the buffer before any callback can re-buffer them
    std::deque<size_t> still_buffered;
    for (size_t idx : buffered)
        if (!assigned.count(idx))
            still_buffered.push_back(idx);
    buffered.swap(still_buffered);

    for (const auto& c : commits)
    {
        const VehicleLocation* loc = tracker.get(c.first);
        if (loc == nullptr)
            continue;
        const VehicleAllocationRequest& r = requests[c.second].request;
        in_flight.insert(c.second);
        if (screen > 1)
            cout << "[t=" << tick << "] request " << r.request_id << " -> " << c.first << endl;
        coordinator.apply_mutation(c.first, build_reservation_schedule(loc->location, r, tick), tick, r.request_id);
    }

    for (const auto& vid : members)
    {
        if (!used.count(vid) && wave_controller.is_active() && wave_controller.is_waiting_for(vid))
            coordinator.release_hold(vid);
    }
}

void DispatchSystem::try_single_reservation(size_t idx, int tick, long long trigger_id)
{
    const VehicleAllocationRequest& r = requests[idx].request;
    auto proposal = allocator.propose_allocation(r, [this](const VehicleId& vid) {
        return coordinator.is_vehicle_neither_repositioning_nor_processing_reservation(vid);
    });

    if (proposal)
    {
        const PassengerSchedule schedule = build_reservation_schedule(proposal->current_location, r, tick);
        request_triggers[r.request_id] = trigger_id;
        in_flight.insert(idx);
        if (coordinator.send_reservation_interrupt(proposal->vehicle_id, schedule, tick, r.request_id))
            return;
        request_triggers.erase(r.request_id);
        in_flight.erase(idx);
    }
    retry_or_drop(idx, tick, trigger_id);
}

void DispatchSystem::retry_or_drop(size_t idx, int tick, long long trigger_id)
{
    CustomerRequest& cr = requests[idx];
    if (cr.retries < max_reservation_retries)
    {
        cr.retries++;
        scheduler.complete(CompletionNotice(trigger_id,
            {ScheduleTrigger(TriggerKind::RequestArrival, tick + std::max(1, buffer_interval), "", (int)idx)}));
        return;
    }
    cr.outcome = CustomerRequest::Outcome::Unserved;
    if (screen > 1)
        cout << "[t=" << tick << "] request " << cr.request.request_id << " unserved after "
             << cr.retries << " retries" << endl;
    scheduler.complete(CompletionNotice(trigger_id, {}));
}

void DispatchSystem::drop_expired_requests(int tick)
{
    std::deque<size_t> kept;
    for (size_t idx : buffered)
    {
        CustomerRequest& cr = requests[idx];
        if (max_request_wait > 0 && tick - cr.request.request_time > max_request_wait)
        {
            cr.outcome = CustomerRequest::Outcome::Unserved;
            if (screen > 1)
                cout << "[t=" << tick << "] request " << cr.request.request_id << " expired" << endl;
        }
        else
            kept.push_back(idx);
    }
    buffered.swap(kept);
}

int DispatchSystem::travel_time(const Coord& a, const Coord& b) const
{
    const double v = speed > 0 ? speed : 1;
    return std::max(1, (int)std::ceil(euclidean_distance(a, b) / v));
}

// deadhead to the pickup, then the trip with the customer aboard
PassengerSchedule DispatchSystem::build_reservation_schedule(const Coord& from, const VehicleAllocationRequest& request,
                                                             int tick) const
{
    const Leg pickup_leg(tick, travel_time(from, request.pickup), from, request.pickup,
                         euclidean_distance(from, request.pickup));
    const Leg trip_leg(pickup_leg.end_time(), travel_time(request.pickup, request.dropoff),
                       request.pickup, request.dropoff, euclidean_distance(request.pickup, request.dropoff));
    return PassengerSchedule()
        .add_legs({pickup_leg, trip_leg})
        .add_passenger(VehiclePersonId("body-" + request.person_id, request.person_id), {trip_leg});
}

PassengerSchedule DispatchSystem::build_reposition_schedule(const Coord& from, const Coord& to, int tick) const
{
    return PassengerSchedule().add_legs({Leg(tick, travel_time(from, to), from, to, euclidean_distance(from, to))});
}

// ------------------------------- results ------------------------------------

const SimulatedVehicle* DispatchSystem::get_vehicle(const VehicleId& id) const
{
    auto it = vehicles.find(id);
    return it == vehicles.end() ? nullptr : it->second.get();
}

int DispatchSystem::get_num_assigned() const
{
    int n = 0;
    for (const auto& cr : requests)
        if (cr.outcome == CustomerRequest::Outcome::Assigned)
            n++;
    return n;
}

int DispatchSystem::get_num_unserved() const
{
    int n = 0;
    for (const auto& cr : requests)
        if (cr.outcome == CustomerRequest::Outcome::Unserved)
            n++;
    return n;
}

int DispatchSystem::get_num_open() const
{
    return get_num_requests() - get_num_assigned() - get_num_unserved();
}

int DispatchSystem::get_num_completed_trips() const
{
    int n = 0;
    for (const auto& kv : vehicles)
        n += kv.second->passengers_alighted();
    return n;
}

void DispatchSystem::metrics_log_wave(WaveKind kind, int tick) const
{
    std::ofstream f(metrics_csv_path, std::ios::app);
    if (!f.is_open())
    {
        std::cerr << "[WARN] cannot open metrics file " << metrics_csv_path << endl;
        return;
    }
    if (f.tellp() == 0)
        f << "tick,wave,waves_total,assigned,unserved,buffered,idle,in_service,out_of_service\n";
    f << tick << "," << wave_name(kind) << "," << wave_controller.waves_completed() << ","
      << get_num_assigned() << "," << get_num_unserved() << "," << buffered.size() << ","
      << tracker.count(VehicleStatus::Idle) << "," << tracker.count(VehicleStatus::InService) << ","
      << tracker.count(VehicleStatus::OutOfService) << "\n";
}

void DispatchSystem::print_summary() const
{
    int boarded = 0, legs = 0, aborted = 0;
    for (const auto& kv : vehicles)
    {
        boarded += kv.second->passengers_boarded();
        legs += kv.second->legs_completed();
        aborted += kv.second->legs_aborted();
    }
    cout << "\n=== Dispatch Summary ===\n";
    cout << "vehicles:                " << vehicles.size() << "\n";
    cout << "requests:                " << get_num_requests() << "\n";
    cout << "assigned:                " << get_num_assigned() << "\n";
    cout << "unserved:                " << get_num_unserved() << "\n";
    cout << "open at end:             " << get_num_open() << "\n";
    cout << "passengers_boarded:      " << boarded << "\n";
    cout << "trips_completed:         " << get_num_completed_trips() << "\n";
    cout << "legs_completed:          " << legs << "\n";
    cout << "legs_aborted:            " << aborted << "\n";
    cout << "repositions:             " << m_repositions_total << "\n";
    cout << "reservation_failures:    " << m_reservation_failures_total << "\n";
    cout << "waves_completed:         " << wave_controller.waves_completed() << "\n";
    cout << "waves_deferred:          " << m_deferred_waves_total << "\n";
    cout << "waves_unclean:           " << m_unclean_waves_total << "\n";
    cout << "schedules_refused:       " << m_refused_schedules_total << "\n";
    cout << "triggers_delivered:      " << scheduler.triggers_delivered() << "\n";
    cout << "========================\n";
}

void DispatchSystem::save_results() const
{
    if (screen > 0)
        cout << "*** Saving " << seed << " ***" << endl;
    std::ofstream output;

    // settings
    output.open(outfile + "/config.txt", std::ios::out);
    output << "#vehicles: " << vehicles.size() << endl
           << "#requests: " << requests.size() << endl
           << "seed: " << seed << endl
           << "allocation_mode: " << (allocation_mode == AllocationMode::Buffered ? "BUFFERED" : "IMMEDIATE") << endl
           << "simulation_time: " << simulation_time << endl
           << "reposition_interval: " << reposition_interval << endl
           << "buffer_interval: " << buffer_interval << endl
           << "search_radius: " << search_radius << endl
           << "speed: " << speed << endl
           << "interrupt_timeout: " << interrupt_timeout << endl
           << "max_request_wait: " << max_request_wait << endl
           << "max_reservation_retries: " << max_reservation_retries << endl;
    output.close();

    // one line per request: id,time,outcome,retries
    output.open(outfile + "/results.txt", std::ios::out);
    output << requests.size() << endl;
    for (const auto& cr : requests)
    {
        const char* outcome = cr.outcome == CustomerRequest::Outcome::Assigned ? "assigned"
                            : cr.outcome == CustomerRequest::Outcome::Unserved ? "unserved" : "open";
        output << cr.request.request_id << "," << cr.request.request_time << "," << outcome << ","
               << cr.retries << endl;
    }
    output.close();

    // final vehicle positions: id,x,y,status
    output.open(outfile + "/vehicles.txt", std::ios::out);
    output << vehicles.size() << endl;
    for (const auto& kv : vehicles)
    {
        const VehicleLocation* loc = tracker.get(kv.first);
        output << kv.first << "," << kv.second->location().x << "," << kv.second->location().y << ","
               << (loc ? status_name(loc->status) : "unknown") << endl;
    }
    output.close();
    if (screen > 0)
        cout << "Done!" << endl;
}

} // namespace rhdispatch
