#pragma once

#include <cstdint>

namespace resil {

using AgentId = uint64_t;

enum class ResourceKind : int8_t {
    STATIC = 0,
    DYNAMIC = 1,
    WASTE = 2
};

struct Position {
    int x;
    int y;

    bool operator==(const Position& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

struct ModelConfig {
    int width;
    int height;
    int agent_count;
    double rate_static_gather;
    double rate_dynamic_gather;
    double percent_waste_generated;
    double dynamic_vs_static_preference;
    double waste_impact_rate;  // Stored only, no transfer rule reads it
    double initial_static_store;
    double initial_dynamic_store;
    double initial_waste_store;
    double death_recycle_ratio;
    double max_dynamic_store;
    double needed_energy;

    // Grid budget distributed evenly over all cells at init
    double total_grid_energy;
    double static_energy_share;

    double move_cost;
    double overflow_waste_fraction;
    double emit_fraction;
    double emit_waste_fraction;
};

inline ModelConfig default_model_config() {
    return ModelConfig{
        .width = 20,
        .height = 20,
        .agent_count = 50,
        .rate_static_gather = 1.0,
        .rate_dynamic_gather = 1.0,
        .percent_waste_generated = 0.1,
        .dynamic_vs_static_preference = 0.5,
        .waste_impact_rate = 1.0,
        .initial_static_store = 50.0,
        .initial_dynamic_store = 50.0,
        .initial_waste_store = 0.0,
        .death_recycle_ratio = 0.7,
        .max_dynamic_store = 50.0,
        .needed_energy = 10.0,
        .total_grid_energy = 60000.0,
        .static_energy_share = 0.8,
        .move_cost = 1.0,
        .overflow_waste_fraction = 0.1,
        .emit_fraction = 0.1,
        .emit_waste_fraction = 0.1
    };
}

// Throws std::invalid_argument naming the first offending field.
void validate_config(const ModelConfig& config);

}  // namespace resil
