#include "DispatchSystem.h"

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include <ctime>
#include <iostream>

using std::cout;
using std::endl;
using std::string;

static void set_parameters(rhdispatch::DispatchSystem& system, const boost::program_options::variables_map& vm)
{
    system.outfile                 = vm["output"].as<std::string>();
    system.screen                  = vm["screen"].as<int>();
    system.num_of_vehicles         = vm["vehicleNum"].as<int>();
    system.num_of_requests         = vm["requestNum"].as<int>();
    system.reposition_interval     = vm["reposition_interval"].as<int>();
    system.buffer_interval         = vm["buffer_interval"].as<int>();
    system.search_radius           = vm["search_radius"].as<double>();
    system.speed                   = vm["speed"].as<double>();
    system.interrupt_timeout       = vm["interrupt_timeout"].as<int>();
    system.max_request_wait        = vm["max_request_wait"].as<int>();
    system.max_reservation_retries = vm["max_reservation_retries"].as<int>();
    system.area_size               = vm["area"].as<double>();
    system.offline_fraction        = vm["offline_fraction"].as<double>();
    system.metrics_csv_path        = vm["metrics_csv"].as<std::string>();
    if (vm.count("seed"))
        system.seed = vm["seed"].as<int>();
    else
        system.seed = (int)time(0);
}

int main(int argc, char** argv)
{
    namespace po = boost::program_options;

    // -------- CLI options --------
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "produce help message")
        ("fleet,f",    po::value<std::string>()->default_value(""), "input fleet file (random fleet if empty)")
        ("requests,r", po::value<std::string>()->default_value(""), "input request file (random requests if empty)")
        ("output,o",   po::value<std::string>()->default_value("../exp/test"), "output folder name")
        ("vehicleNum,k", po::value<int>()->default_value(10), "number of vehicles for a random fleet")
        ("requestNum,n", po::value<int>()->default_value(50), "number of requests for a random demand")
        ("seed,d",     po::value<int>(), "random seed")
        ("screen,s",   po::value<int>()->default_value(1), "screen option (0: none; 1: results; 2:all)")

        ("simulation_time", po::value<int>()->default_value(3600), "simulated seconds")
        ("allocation_mode", po::value<string>()->default_value("BUFFERED"), "allocation mode (BUFFERED, IMMEDIATE)")
        ("reposition_interval", po::value<int>()->default_value(300), "seconds between repositioning waves (0: off)")
        ("buffer_interval", po::value<int>()->default_value(60), "seconds between batched-reservation waves")
        ("search_radius",   po::value<double>()->default_value(5000), "pickup search radius (m)")
        ("speed",           po::value<double>()->default_value(10), "vehicle speed (m/s)")
        ("interrupt_timeout", po::value<int>()->default_value(0),
            "abandon interrupts unanswered for this many seconds (0: wait forever)")
        ("max_request_wait", po::value<int>()->default_value(900), "drop buffered requests older than this (s)")
        ("max_reservation_retries", po::value<int>()->default_value(2), "retries of an immediate reservation")

        ("area",             po::value<double>()->default_value(10000), "side of the square service area (m)")
        ("offline_fraction", po::value<double>()->default_value(0), "share of random vehicles starting offline")
        ("metrics_csv",      po::value<std::string>()->default_value(""), "append one row per completed wave")
    ;

    clock_t start_time = clock();
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 1;
        }
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << e.what() << endl << desc << endl;
        return -1;
    }

    if (vm["buffer_interval"].as<int>() < 1) {
        std::cerr << "buffer_interval must be at least 1 second" << endl;
        return -1;
    }
    if (vm["reposition_interval"].as<int>() < 0) {
        std::cerr << "reposition_interval cannot be negative" << endl;
        return -1;
    }
    if (vm["speed"].as<double>() <= 0) {
        std::cerr << "speed must be positive" << endl;
        return -1;
    }

    // ensure output dirs
    boost::filesystem::path dir(vm["output"].as<std::string>() + "/");
    boost::filesystem::create_directories(dir);

    rhdispatch::DispatchSystem system;
    set_parameters(system, vm);

    string mode = vm["allocation_mode"].as<string>();
    if (mode == "BUFFERED") {
        system.allocation_mode = rhdispatch::AllocationMode::Buffered;
    } else if (mode == "IMMEDIATE") {
        system.allocation_mode = rhdispatch::AllocationMode::Immediate;
    } else {
        cout << "Allocation mode " << mode << " does not exist!" << endl;
        return -1;
    }

    if (!vm["fleet"].as<std::string>().empty() && !system.load_fleet(vm["fleet"].as<std::string>()))
        return -1;
    if (!vm["requests"].as<std::string>().empty() && !system.load_requests(vm["requests"].as<std::string>()))
        return -1;

    system.simulate(vm["simulation_time"].as<int>());

    double runtime = (double)(clock() - start_time) / CLOCKS_PER_SEC;
    if (system.screen > 0) {
        cout << "Overall runtime:           " << runtime << " seconds." << endl;
        cout << "Assigned:       " << system.get_num_assigned() << " / " << system.get_num_requests() << endl;
        cout << "Unserved:       " << system.get_num_unserved() << endl;
    }
    return 0;
}
