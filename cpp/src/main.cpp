#include "types.hpp"
#include "model.hpp"
#include <iostream>
#include <string>
#include <chrono>
#include <cstring>
#include <memory>
#include <stdexcept>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --steps N                 Number of simulation steps (default: 1000)\n"
              << "  --seed N                  Random seed (default: 42)\n"
              << "  --width N                 Grid width (default: 20)\n"
              << "  --height N                Grid height (default: 20)\n"
              << "  --agents N                Requested number of agents (default: 50)\n"
              << "  --grid-energy X           Total energy distributed over the grid (default: 60000)\n"
              << "  --static-share X          Static share of each cell's energy (default: 0.8)\n"
              << "  --rate-static X           Static gather multiplier (default: 1.0)\n"
              << "  --rate-dynamic X          Dynamic gather multiplier (default: 1.0)\n"
              << "  --waste-generated X       Fraction of harvest turned into agent waste (default: 0.1)\n"
              << "  --preference X            Dynamic vs static harvest preference (default: 0.5)\n"
              << "  --waste-impact X          Waste impact rate (default: 1.0)\n"
              << "  --initial-static X        Initial agent static store (default: 50)\n"
              << "  --initial-dynamic X       Initial agent dynamic store (default: 50)\n"
              << "  --initial-waste X         Initial agent waste store (default: 0)\n"
              << "  --recycle-ratio X         Share of a dead agent returned as dynamic energy (default: 0.7)\n"
              << "  --max-dynamic X           Agent dynamic store capacity (default: 50)\n"
              << "  --needed-energy X         Agent harvest target per step (default: 10)\n"
              << "  --move-cost X             Energy spent per move (default: 1.0)\n"
              << "  --log-deaths              Print a record for every agent death\n"
              << "  --quiet                   Suppress progress output\n"
              << "  --help                    Show this help message\n";
}

int main(int argc, char* argv[]) {
    int steps = 1000;
    uint64_t seed = 42;
    bool log_deaths = false;
    bool quiet = false;

    resil::ModelConfig config = resil::default_model_config();

    try {
        for (int i = 1; i < argc; i++) {
            bool has_value = i + 1 < argc;
            if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (std::strcmp(argv[i], "--steps") == 0 && has_value) {
                steps = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--seed") == 0 && has_value) {
                seed = std::stoull(argv[++i]);
            } else if (std::strcmp(argv[i], "--width") == 0 && has_value) {
                config.width = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--height") == 0 && has_value) {
                config.height = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--agents") == 0 && has_value) {
                config.agent_count = std::stoi(argv[++i]);
            } else if (std::strcmp(argv[i], "--grid-energy") == 0 && has_value) {
                config.total_grid_energy = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--static-share") == 0 && has_value) {
                config.static_energy_share = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--rate-static") == 0 && has_value) {
                config.rate_static_gather = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--rate-dynamic") == 0 && has_value) {
                config.rate_dynamic_gather = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--waste-generated") == 0 && has_value) {
                config.percent_waste_generated = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--preference") == 0 && has_value) {
                config.dynamic_vs_static_preference = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--waste-impact") == 0 && has_value) {
                config.waste_impact_rate = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--initial-static") == 0 && has_value) {
                config.initial_static_store = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--initial-dynamic") == 0 && has_value) {
                config.initial_dynamic_store = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--initial-waste") == 0 && has_value) {
                config.initial_waste_store = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--recycle-ratio") == 0 && has_value) {
                config.death_recycle_ratio = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--max-dynamic") == 0 && has_value) {
                config.max_dynamic_store = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--needed-energy") == 0 && has_value) {
                config.needed_energy = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--move-cost") == 0 && has_value) {
                config.move_cost = std::stod(argv[++i]);
            } else if (std::strcmp(argv[i], "--log-deaths") == 0) {
                log_deaths = true;
            } else if (std::strcmp(argv[i], "--quiet") == 0 || std::strcmp(argv[i], "-q") == 0) {
                quiet = true;
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stoi and friends report malformed numbers this way
        std::cerr << "Malformed numeric option: " << e.what() << "\n";
        return 1;
    }

    if (steps < 0) {
        std::cerr << "Invalid configuration: steps must be >= 0\n";
        return 1;
    }

    std::unique_ptr<resil::ResilienceModel> model;
    try {
        model = std::make_unique<resil::ResilienceModel>(config, seed);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    if (log_deaths) {
        model->set_event_log(&std::cout);
    }

    if (!quiet) {
        std::cout << "Starting simulation:\n"
                  << "  Steps: " << steps << "\n"
                  << "  Grid: " << config.width << "x" << config.height << "\n"
                  << "  Agents: " << model->live_agent_count() << " of " << config.agent_count
                  << " requested\n"
                  << "  Seed: " << seed << "\n"
                  << "  Total energy: " << model->total_energy() << "\n";
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int step = 1; step <= steps; step++) {
        model->step();

        if (!quiet && step % 100 == 0) {
            std::cout << "Step " << step << "/" << steps
                      << " - Agents: " << model->live_agent_count()
                      << " - Waste: " << model->total_waste() << "\n";
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    resil::ModelMetrics m = model->metrics();
    std::cout << "After " << steps << " steps:\n"
              << "  Total waste in environment = " << m.total_waste << "\n"
              << "  Number of agents left      = " << m.live_agents << "\n"
              << "  Total static energy        = " << m.total_static_energy << "\n"
              << "  Total dynamic energy       = " << m.total_dynamic_energy << "\n"
              << "  Total energy               = " << m.total_energy << "\n";

    if (!quiet) {
        std::cout << "  Time: " << duration.count() << " ms\n";
    }

    return 0;
}
