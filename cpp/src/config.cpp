#include "types.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace resil {

namespace {

void require_finite(double value, const char* name) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument(std::string(name) + " must be finite");
    }
}

void require_non_negative(double value, const char* name) {
    require_finite(value, name);
    if (value < 0.0) {
        throw std::invalid_argument(std::string(name) + " must be >= 0, got " + std::to_string(value));
    }
}

void require_positive(double value, const char* name) {
    require_finite(value, name);
    if (value <= 0.0) {
        throw std::invalid_argument(std::string(name) + " must be > 0, got " + std::to_string(value));
    }
}

void require_fraction(double value, const char* name) {
    require_finite(value, name);
    if (value < 0.0 || value > 1.0) {
        throw std::invalid_argument(std::string(name) + " must be in [0, 1], got " + std::to_string(value));
    }
}

}  // namespace

void validate_config(const ModelConfig& config) {
    if (config.width <= 0 || config.height <= 0) {
        throw std::invalid_argument("grid dimensions must be positive, got " +
                                    std::to_string(config.width) + "x" + std::to_string(config.height));
    }
    if (config.agent_count < 0) {
        throw std::invalid_argument("agent_count must be >= 0, got " + std::to_string(config.agent_count));
    }

    require_non_negative(config.rate_static_gather, "rate_static_gather");
    require_non_negative(config.rate_dynamic_gather, "rate_dynamic_gather");
    require_fraction(config.percent_waste_generated, "percent_waste_generated");
    require_fraction(config.dynamic_vs_static_preference, "dynamic_vs_static_preference");
    require_non_negative(config.waste_impact_rate, "waste_impact_rate");

    require_non_negative(config.initial_static_store, "initial_static_store");
    require_non_negative(config.initial_dynamic_store, "initial_dynamic_store");
    require_non_negative(config.initial_waste_store, "initial_waste_store");
    require_fraction(config.death_recycle_ratio, "death_recycle_ratio");
    require_positive(config.max_dynamic_store, "max_dynamic_store");
    require_positive(config.needed_energy, "needed_energy");

    if (config.initial_dynamic_store > config.max_dynamic_store) {
        throw std::invalid_argument("initial_dynamic_store exceeds max_dynamic_store");
    }

    require_non_negative(config.total_grid_energy, "total_grid_energy");
    require_fraction(config.static_energy_share, "static_energy_share");
    require_non_negative(config.move_cost, "move_cost");
    require_fraction(config.overflow_waste_fraction, "overflow_waste_fraction");
    require_fraction(config.emit_fraction, "emit_fraction");
    require_fraction(config.emit_waste_fraction, "emit_waste_fraction");
}

}  // namespace resil
