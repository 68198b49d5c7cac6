#pragma once
// inc/DispatchSystem.h
//
// Ride-hail dispatcher wired end to end: fleet tracker, allocation,
// schedule-mutation coordinator and wave controller driven by the tick
// scheduler, with simulated vehicles on an in-process message bus.

#include "AllocationManager.h"
#include "FleetStateTracker.h"
#include "MessageBus.h"
#include "ScheduleMutationCoordinator.h"
#include "SimulatedVehicle.h"
#include "TickScheduler.h"
#include "WaveController.h"

#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rhdispatch {

enum class AllocationMode { Buffered, Immediate };

struct CustomerRequest {
    enum class Outcome { Pending, Assigned, Unserved };

    VehicleAllocationRequest request;
    int retries = 0;
    Outcome outcome = Outcome::Pending;
};

class DispatchSystem
{
public:
    // params for the dispatcher
    int screen = 1;
    int seed = 0;
    int simulation_time = 3600;
    AllocationMode allocation_mode = AllocationMode::Buffered;
    int reposition_interval = 300;    // 0 disables repositioning
    int buffer_interval = 60;
    double search_radius = 5000;
    int interrupt_timeout = 0;        // 0 waits forever for interrupt replies
    int max_request_wait = 900;
    int max_reservation_retries = 2;

    // params for the synthetic world
    double speed = 10;                // m/s, straight line
    double area_size = 10000;
    int num_of_vehicles = 10;
    int num_of_requests = 50;
    double offline_fraction = 0;

    // I/O
    std::string outfile;
    std::string metrics_csv_path;

    DispatchSystem();
    ~DispatchSystem();

    bool load_fleet(const std::string& fname);
    bool load_requests(const std::string& fname);
    bool add_vehicle(const VehicleId& id, const Coord& location, bool offline = false);
    bool add_request(const VehicleAllocationRequest& request);

    void simulate(int simulation_time);
    void save_results() const;

    // results
    int get_num_requests() const { return (int)requests.size(); }
    int get_num_assigned() const;
    int get_num_unserved() const;
    int get_num_open() const;
    int get_num_completed_trips() const;
    int get_num_repositions() const { return m_repositions_total; }
    int get_num_reservation_failures() const { return m_reservation_failures_total; }
    long long get_num_waves() const { return wave_controller.waves_completed(); }
    // waves that resolved with coordinator attempts still cached; always 0 unless broken
    int get_num_unclean_waves() const { return m_unclean_waves_total; }
    int get_num_refused_schedules() const { return m_refused_schedules_total; }

    const FleetStateTracker& get_fleet() const { return tracker; }
    const ScheduleMutationCoordinator& get_coordinator() const { return coordinator; }
    const WaveController& get_waves() const { return wave_controller; }
    const TickScheduler& get_scheduler() const { return scheduler; }
    const SimulatedVehicle* get_vehicle(const VehicleId& id) const;
    const std::vector<CustomerRequest>& get_requests() const { return requests; }

private:
    void initialize();
    void generate_random_fleet();
    void generate_random_requests();

    // scheduler handlers
    void on_reposition_trigger(const ScheduleTrigger& trigger, long long trigger_id);
    void on_buffered_requests_trigger(const ScheduleTrigger& trigger, long long trigger_id);
    void on_request_arrival(const ScheduleTrigger& trigger, long long trigger_id);
    void on_end_leg(const ScheduleTrigger& trigger, long long trigger_id);
    bool defer_if_wave_active(const ScheduleTrigger& trigger, long long trigger_id);

    // vehicle and coordinator callbacks
    void on_interrupt_reply(const InterruptReply& reply);
    void on_modify_ack(const ModifyPassengerScheduleAck& ack);
    void on_reservation_failed(RequestId request_id);
    void on_wave_complete(WaveKind kind, int tick);

    // planning
    void maybe_plan_wave();
    void plan_reposition_wave(int tick);
    void plan_reservation_wave(int tick);
    bool is_held_and_idle(const VehicleId& vehicle_id) const;
    void try_single_reservation(size_t idx, int tick, long long trigger_id);
    void retry_or_drop(size_t idx, int tick, long long trigger_id);
    void drop_expired_requests(int tick);

    PassengerSchedule build_reservation_schedule(const Coord& from, const VehicleAllocationRequest& request,
                                                 int tick) const;
    PassengerSchedule build_reposition_schedule(const Coord& from, const Coord& to, int tick) const;
    int travel_time(const Coord& a, const Coord& b) const;

    void metrics_log_wave(WaveKind kind, int tick) const;
    void print_summary() const;

    FleetStateTracker tracker;
    AllocationManager allocator;
    WaveController wave_controller;
    ScheduleMutationCoordinator coordinator;
    TickScheduler scheduler;
    MessageBus bus;

    std::map<VehicleId, std::unique_ptr<SimulatedVehicle>> vehicles;

    std::vector<CustomerRequest> requests;
    std::unordered_map<RequestId, size_t> request_index;
    std::deque<size_t> buffered;                      // waiting for a batched wave
    std::set<size_t> in_flight;                       // schedule sent, not acknowledged
    std::map<RequestId, long long> request_triggers;  // immediate mode: arrival trigger held until resolved

    bool wave_planned = true;
    bool shutting_down = false;

    int m_repositions_total = 0;
    int m_reservation_failures_total = 0;
    int m_deferred_waves_total = 0;
    int m_unclean_waves_total = 0;
    int m_refused_schedules_total = 0;
};

} // namespace rhdispatch
