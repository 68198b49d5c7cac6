#include "ScheduleMutationCoordinator.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <sstream>

using std::cout;
using std::endl;

namespace rhdispatch {

const char* origin_name(InterruptOrigin origin)
{
    switch (origin)
    {
        case InterruptOrigin::BatchedReservation: return "BatchedReservation";
        case InterruptOrigin::SingleReservation:  return "SingleReservation";
        case InterruptOrigin::Reposition:         return "Reposition";
        case InterruptOrigin::HoldForPlanning:    return "HoldForPlanning";
    }
    return "Unknown";
}

ScheduleMutationCoordinator::ScheduleMutationCoordinator(const FleetStateTracker& fleet, WaveController& waves)
    : fleet(fleet), waves(waves) {}

// microseconds since epoch plus a process-wide sequence, so two ids never collide
InterruptId ScheduleMutationCoordinator::next_interrupt_id()
{
    static std::atomic<unsigned long long> sequence(0);
    const long long micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::ostringstream oss;
    oss << std::hex << micros << "-" << std::dec << ++sequence;
    return oss.str();
}

// ------------------------------- waves --------------------------------------

void ScheduleMutationCoordinator::begin_wave(WaveKind kind, const std::set<VehicleId>& vehicles,
                                             int tick, long long trigger_id)
{
    waves.begin(kind, vehicles, tick, trigger_id);

    for (const auto& vid : vehicles)
    {
        if (!waves.is_waiting_for(vid))
            continue;

        const VehicleLocation* loc = fleet.get(vid);
        if (loc == nullptr || loc->agent == nullptr)
        {
            protocol_error(vid, "wave member is not a tracked vehicle");
            drop_wave_membership(vid);
            continue;
        }
        if (is_pending_reservation(vid))
        {
            m.refused_blocked++;
            if (screen > 1)
                cout << "Interrupt ignored as " << wave_name(kind)
                     << " cannot overwrite reservation of " << vid << endl;
            drop_wave_membership(vid);
            continue;
        }
        if (vehicle_id_to_interrupt_id.count(vid))
        {
            protocol_error(vid, "unresolved attempt left over from an earlier round; replacing it");
            clear_attempt_for_vehicle(vid);
        }

        ModificationAttempt attempt;
        attempt.interrupt_id = next_interrupt_id();
        attempt.vehicle_id = vid;
        attempt.modify_passenger_schedule.tick = tick;
        attempt.origin = InterruptOrigin::HoldForPlanning;
        attempt.tick = tick;
        attempt.agent = loc->agent;
        attempt.status = AttemptStatus::InterruptSent;

        save_attempt(attempt);
        send_interrupt(attempt);
    }
}

void ScheduleMutationCoordinator::begin_wave_over_fleet(WaveKind kind, int tick, long long trigger_id)
{
    std::set<VehicleId> cohort;
    for (const auto& v : fleet.idle_and_in_service_vehicles())
        cohort.insert(v.vehicle_id);
    begin_wave(kind, cohort, tick, trigger_id);
}

bool ScheduleMutationCoordinator::send_reservation_interrupt(const VehicleId& vehicle_id,
                                                             const PassengerSchedule& schedule,
                                                             int tick, RequestId reservation_request_id)
{
    const VehicleLocation* loc = fleet.get(vehicle_id);
    if (loc == nullptr || loc->agent == nullptr)
    {
        protocol_error(vehicle_id, "reservation for an untracked vehicle");
        return false;
    }
    if (!is_vehicle_neither_repositioning_nor_processing_reservation(vehicle_id))
    {
        m.refused_blocked++;
        if (screen > 1)
            cout << "Reservation " << reservation_request_id << " refused: vehicle " << vehicle_id
                 << " already has an attempt in flight" << endl;
        return false;
    }

    ModificationAttempt attempt;
    attempt.interrupt_id = next_interrupt_id();
    attempt.vehicle_id = vehicle_id;
    attempt.modify_passenger_schedule.updated_schedule = schedule;
    attempt.modify_passenger_schedule.tick = tick;
    attempt.modify_passenger_schedule.reservation_request_id = reservation_request_id;
    attempt.origin = InterruptOrigin::SingleReservation;
    attempt.tick = tick;
    attempt.agent = loc->agent;
    attempt.status = AttemptStatus::InterruptSent;

    save_attempt(attempt);
    send_interrupt(attempt);
    return true;
}

// ------------------------------- replies ------------------------------------

void ScheduleMutationCoordinator::on_interrupt_reply(const InterruptReply& reply)
{
    auto it = interrupt_id_to_attempt.find(reply.interrupt_id);
    if (it == interrupt_id_to_attempt.end())
    {
        m.stale_replies++;
        std::cerr << "[ERROR] interruptId not found: interruptId " << reply.interrupt_id
                  << ", interruptedPassengerSchedule "
                  << (reply.kind == InterruptReply::Kind::WhileDriving
                          ? reply.passenger_schedule.to_string() : std::string("NA"))
                  << ", vehicle " << reply.vehicle_id << ", tick " << reply.tick << std::endl;
        return;
    }

    ModificationAttempt& attempt = it->second;
    if (attempt.interrupt_reply)
    {
        m.stale_replies++;
        std::cerr << "[ERROR] duplicate reply for interruptId " << reply.interrupt_id
                  << " from vehicle " << reply.vehicle_id << std::endl;
        return;
    }

    attempt.interrupt_reply = reply;
    num_interrupt_replies_pending--;
    m.replies_received++;

    if (screen > 1)
        cout << "[t=" << reply.tick << "] " << reply_name(reply.kind) << " from " << reply.vehicle_id
             << " (" << num_interrupt_replies_pending << " replies pending)" << endl;
}

// ------------------------------- mutation -----------------------------------

void ScheduleMutationCoordinator::apply_mutation(const VehicleId& vehicle_id, const PassengerSchedule& schedule,
                                                 int tick, const boost::optional<RequestId>& reservation_request_id)
{
    ModificationAttempt* attempt = find_by_vehicle(vehicle_id);
    if (attempt == nullptr)
    {
        protocol_error(vehicle_id, "schedule mutation requested without an interrupt attempt");
        drop_wave_membership(vehicle_id);
        return;
    }
    if (!attempt->interrupt_reply)
    {
        // abandon the attempt: the vehicle is resumed on its current plan
        protocol_error(vehicle_id, "schedule mutation requested before the interrupt reply arrived");
        const InterruptId interrupt_id = attempt->interrupt_id;
        boost::optional<RequestId> request_id = attempt->modify_passenger_schedule.reservation_request_id;
        if (!request_id)
            request_id = reservation_request_id;
        attempt->agent->send(Resume());
        clear_attempt_with_interrupt_id(interrupt_id);
        drop_wave_membership(vehicle_id);
        if (request_id)
        {
            m.reservations_failed++;
            if (on_reservation_failed)
                on_reservation_failed(*request_id);
        }
        return;
    }
    if (attempt->status != AttemptStatus::InterruptSent)
    {
        // the first mutation stands; membership resolves with its ack
        protocol_error(vehicle_id, "schedule mutation requested twice for one interrupt");
        return;
    }

    if (screen > 1)
        cout << "Modifying passenger schedule of " << vehicle_id << " (" << origin_name(attempt->origin)
             << ", " << reply_name(attempt->interrupt_reply->kind) << ")" << endl;

    switch (attempt->interrupt_reply->kind)
    {
        case InterruptReply::Kind::WhileOffline:
        {
            VehicleAgent* agent = attempt->agent;
            const InterruptId interrupt_id = attempt->interrupt_id;

            if (waves.is_repositioning() && waves.is_waiting_for(vehicle_id))
            {
                if (screen > 1)
                    cout << "Cancelling repositioning for " << vehicle_id
                         << " because InterruptedWhileOffline, interruptId " << interrupt_id << endl;
                m.repositions_abandoned++;
                agent->send(Resume());
                clear_attempt_with_interrupt_id(interrupt_id);
                waves.vehicle_resolved(vehicle_id);
                return;
            }

            boost::optional<RequestId> request_id = attempt->modify_passenger_schedule.reservation_request_id;
            if (!request_id)
                request_id = reservation_request_id;

            if (screen > 1)
                cout << "Abandoning attempt to modify passenger schedule of vehicle " << vehicle_id
                     << " @ " << attempt->interrupt_reply->tick << " because InterruptedWhileOffline" << endl;
            m.reservations_failed++;
            agent->send(Resume());
            clear_attempt_with_interrupt_id(interrupt_id);
            drop_wave_membership(vehicle_id);
            if (request_id && on_reservation_failed)
                on_reservation_failed(*request_id);
            return;
        }
        case InterruptReply::Kind::WhileDriving:
        case InterruptReply::Kind::WhileIdle:
        {
            attempt->modify_passenger_schedule.updated_schedule = schedule;
            attempt->modify_passenger_schedule.tick = tick;
            if (reservation_request_id)
                attempt->modify_passenger_schedule.reservation_request_id = reservation_request_id;
            send_modify_passenger_schedule(*attempt,
                                           attempt->interrupt_reply->kind == InterruptReply::Kind::WhileDriving);
            return;
        }
    }

    protocol_error(vehicle_id, "unrecognized interrupt reply");
    drop_wave_membership(vehicle_id);
}

void ScheduleMutationCoordinator::send_modify_passenger_schedule(ModificationAttempt& attempt, bool stop_driving)
{
    if (stop_driving)
    {
        StopDriving stop;
        stop.tick = attempt.modify_passenger_schedule.tick;
        attempt.agent->send(stop);
        m.stop_driving_sent++;
    }
    attempt.agent->send(attempt.modify_passenger_schedule);
    attempt.agent->send(Resume());
    attempt.status = AttemptStatus::ModifySent;
    m.mutations_sent++;
}

void ScheduleMutationCoordinator::release_hold(const VehicleId& vehicle_id)
{
    ModificationAttempt* attempt = find_by_vehicle(vehicle_id);
    if (attempt == nullptr || attempt->status != AttemptStatus::InterruptSent)
    {
        protocol_error(vehicle_id, "release requested for a vehicle that is not on hold");
        drop_wave_membership(vehicle_id);
        return;
    }
    attempt->agent->send(Resume());
    clear_attempt_with_interrupt_id(attempt->interrupt_id);
    m.holds_released++;
    drop_wave_membership(vehicle_id);
}

std::vector<ScheduleTrigger>
ScheduleMutationCoordinator::acknowledge_mutation(const VehicleId& vehicle_id,
                                                  const std::vector<ScheduleTrigger>& triggers_to_schedule,
                                                  int tick)
{
    ModificationAttempt* attempt = find_by_vehicle(vehicle_id);
    if (attempt == nullptr || attempt->status != AttemptStatus::ModifySent)
    {
        protocol_error(vehicle_id, "acknowledgement without a schedule modification in flight");
        drop_wave_membership(vehicle_id);
        return triggers_to_schedule;
    }

    m.acks_received++;
    clear_attempt_with_interrupt_id(attempt->interrupt_id);

    if (waves.is_active() && waves.is_waiting_for(vehicle_id))
    {
        waves.add_triggers_to_send_with_completion(triggers_to_schedule);
        waves.vehicle_resolved(vehicle_id);
        return std::vector<ScheduleTrigger>();
    }

    if (screen > 1)
        cout << "[t=" << tick << "] " << vehicle_id << " acknowledged outside a wave" << endl;
    return triggers_to_schedule;
}

// ------------------------------- cleanup ------------------------------------

void ScheduleMutationCoordinator::clear_all_pending_interrupts()
{
    for (const auto& kv : interrupt_id_to_attempt)
        kv.second.agent->send(Resume());
    interrupt_id_to_attempt.clear();
    vehicle_id_to_interrupt_id.clear();
    num_interrupt_replies_pending = 0;
}

int ScheduleMutationCoordinator::expire_unanswered_interrupts(int now)
{
    if (interrupt_timeout <= 0)
        return 0;

    std::vector<InterruptId> expired;
    for (const auto& kv : interrupt_id_to_attempt)
    {
        const ModificationAttempt& a = kv.second;
        if (a.status == AttemptStatus::InterruptSent && !a.interrupt_reply && now - a.tick >= interrupt_timeout)
            expired.push_back(kv.first);
    }

    for (const auto& interrupt_id : expired)
    {
        const ModificationAttempt a = interrupt_id_to_attempt.at(interrupt_id);
        std::cerr << "[WARN] no reply from " << a.vehicle_id << " to interrupt " << interrupt_id
                  << " sent @ " << a.tick << "; abandoning at " << now << std::endl;
        m.interrupts_expired++;
        a.agent->send(Resume());
        clear_attempt_with_interrupt_id(interrupt_id);
        drop_wave_membership(a.vehicle_id);
        if (a.modify_passenger_schedule.reservation_request_id && on_reservation_failed)
            on_reservation_failed(*a.modify_passenger_schedule.reservation_request_id);
    }
    return (int)expired.size();
}

void ScheduleMutationCoordinator::set_status_to_idle(const VehicleId& vehicle_id)
{
    ModificationAttempt* attempt = find_by_vehicle(vehicle_id);
    if (attempt == nullptr)
        return;
    if (!attempt->interrupt_reply)
        num_interrupt_replies_pending--;
    attempt->interrupt_reply = InterruptReply::idle(attempt->interrupt_id, vehicle_id, attempt->tick);
}

bool ScheduleMutationCoordinator::clear_attempt_for_vehicle(const VehicleId& vehicle_id)
{
    auto it = vehicle_id_to_interrupt_id.find(vehicle_id);
    if (it == vehicle_id_to_interrupt_id.end())
        return false;
    const InterruptId interrupt_id = it->second;
    if (screen > 1)
        cout << "remove interrupt " << interrupt_id << " of vehicle " << vehicle_id << endl;
    clear_attempt_with_interrupt_id(interrupt_id);
    return true;
}

void ScheduleMutationCoordinator::clear_attempt_with_interrupt_id(const InterruptId& interrupt_id)
{
    auto it = interrupt_id_to_attempt.find(interrupt_id);
    if (it == interrupt_id_to_attempt.end())
        return;
    if (!it->second.interrupt_reply)
        num_interrupt_replies_pending--;
    vehicle_id_to_interrupt_id.erase(it->second.vehicle_id);
    interrupt_id_to_attempt.erase(it);
}

// ------------------------------- queries ------------------------------------

bool ScheduleMutationCoordinator::is_pending_reservation(const VehicleId& vehicle_id) const
{
    const ModificationAttempt* a = attempt_for(vehicle_id);
    return a != nullptr && a->origin == InterruptOrigin::SingleReservation;
}

bool ScheduleMutationCoordinator::does_pending_reservation_contain_schedule(const VehicleId& vehicle_id,
                                                                           const PassengerSchedule& schedule) const
{
    const ModificationAttempt* a = attempt_for(vehicle_id);
    return a != nullptr && a->origin == InterruptOrigin::SingleReservation &&
           a->modify_passenger_schedule.updated_schedule == schedule;
}

bool ScheduleMutationCoordinator::is_vehicle_neither_repositioning_nor_processing_reservation(
    const VehicleId& vehicle_id) const
{
    return vehicle_id_to_interrupt_id.find(vehicle_id) == vehicle_id_to_interrupt_id.end();
}

const ModificationAttempt* ScheduleMutationCoordinator::attempt_for(const VehicleId& vehicle_id) const
{
    auto it = vehicle_id_to_interrupt_id.find(vehicle_id);
    if (it == vehicle_id_to_interrupt_id.end())
        return nullptr;
    return attempt_for_interrupt(it->second);
}

const ModificationAttempt* ScheduleMutationCoordinator::attempt_for_interrupt(const InterruptId& interrupt_id) const
{
    auto it = interrupt_id_to_attempt.find(interrupt_id);
    if (it == interrupt_id_to_attempt.end())
        return nullptr;
    return &it->second;
}

ModificationAttempt* ScheduleMutationCoordinator::find_by_vehicle(const VehicleId& vehicle_id)
{
    auto it = vehicle_id_to_interrupt_id.find(vehicle_id);
    if (it == vehicle_id_to_interrupt_id.end())
        return nullptr;
    auto jt = interrupt_id_to_attempt.find(it->second);
    if (jt == interrupt_id_to_attempt.end())
        return nullptr;
    return &jt->second;
}

// ------------------------------- helpers ------------------------------------

void ScheduleMutationCoordinator::save_attempt(const ModificationAttempt& attempt)
{
    interrupt_id_to_attempt[attempt.interrupt_id] = attempt;
    vehicle_id_to_interrupt_id[attempt.vehicle_id] = attempt.interrupt_id;
    num_interrupt_replies_pending++;
}

void ScheduleMutationCoordinator::send_interrupt(const ModificationAttempt& attempt)
{
    if (screen > 1)
        cout << "sendInterrupt " << attempt.interrupt_id << " -> " << attempt.vehicle_id
             << " (" << origin_name(attempt.origin) << ")" << endl;
    Interrupt interrupt;
    interrupt.interrupt_id = attempt.interrupt_id;
    interrupt.tick = attempt.tick;
    m.interrupts_sent++;
    attempt.agent->send(interrupt);
}

void ScheduleMutationCoordinator::drop_wave_membership(const VehicleId& vehicle_id)
{
    if (waves.is_active() && waves.is_waiting_for(vehicle_id))
        waves.vehicle_resolved(vehicle_id);
}

void ScheduleMutationCoordinator::protocol_error(const VehicleId& vehicle_id, const char* what)
{
    m.protocol_errors++;
    std::cerr << "[ERROR] vehicle " << vehicle_id << ": " << what << std::endl;
}

// ------------------------------- debug --------------------------------------

void ScheduleMutationCoordinator::print_state(std::ostream& os) const
{
    os << "printState START\n";
    for (const auto& kv : vehicle_id_to_interrupt_id)
        os << "vehicleIdModify: " << kv.first << " -> " << kv.second << "\n";
    for (const auto& kv : interrupt_id_to_attempt)
    {
        const ModificationAttempt& a = kv.second;
        os << "interruptId: " << kv.first << " -> vehicle=" << a.vehicle_id
           << " origin=" << origin_name(a.origin)
           << " status=" << (a.status == AttemptStatus::InterruptSent ? "InterruptSent" : "ModifySent")
           << " reply=" << (a.interrupt_reply ? reply_name(a.interrupt_reply->kind) : "none")
           << " tick=" << a.tick << "\n";
    }
    os << "printState END\n";
}

void ScheduleMutationCoordinator::metrics_print_summary() const
{
    cout << "\n=== Schedule Mutation Summary ===\n";
    cout << "interrupts_sent:         " << m.interrupts_sent       << "\n";
    cout << "replies_received:        " << m.replies_received      << "\n";
    cout << "stale_replies:           " << m.stale_replies         << "\n";
    cout << "mutations_sent:          " << m.mutations_sent        << "\n";
    cout << "stop_driving_sent:       " << m.stop_driving_sent     << "\n";
    cout << "acks_received:           " << m.acks_received         << "\n";
    cout << "repositions_abandoned:   " << m.repositions_abandoned << "\n";
    cout << "reservations_failed:     " << m.reservations_failed   << "\n";
    cout << "refused_blocked:         " << m.refused_blocked       << "\n";
    cout << "holds_released:          " << m.holds_released        << "\n";
    cout << "interrupts_expired:      " << m.interrupts_expired    << "\n";
    cout << "protocol_errors:         " << m.protocol_errors       << "\n";
    cout << "=================================\n";
}

} // namespace rhdispatch
