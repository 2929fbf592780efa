#pragma once

#include "types.hpp"
#include "rng.hpp"
#include "grid.hpp"
#include "agent.hpp"
#include "transfer.hpp"
#include <functional>
#include <ostream>
#include <vector>

namespace resil {

struct StepReport {
    int timestep;
    std::vector<TransferRecord> records;

    int deaths() const;
    double net_energy_change() const;
};

struct ModelMetrics {
    int timestep;
    int live_agents;
    double total_energy;
    double total_waste;
    double total_static_energy;
    double total_dynamic_energy;
};

class ResilienceModel {
public:
    using ModelUpdate = std::function<void(ResilienceModel&)>;

    ResilienceModel(const ModelConfig& config, uint64_t seed);

    Agent* try_seed_agent(int x, int y);
    int spawn_agents(int n);
    Agent& add_agent(int x, int y, double static_store, double dynamic_store, double waste_store);

    StepReport step();
    void run(int n_steps);

    void set_model_update(ModelUpdate update) { model_update_ = std::move(update); }
    void set_event_log(std::ostream* log) { event_log_ = log; }

    // Accessors
    int timestep() const { return timestep_; }
    const ModelConfig& config() const { return config_; }
    const GridEnvironment& grid() const { return grid_; }
    GridEnvironment& grid() { return grid_; }
    const std::vector<Agent>& agents() const { return agents_; }
    const Agent* find_agent(AgentId id) const;

    // Aggregates
    double total_waste() const;
    double total_energy() const;
    double total_static_energy() const;
    double total_dynamic_energy() const;
    int live_agent_count() const;
    ModelMetrics metrics() const;

private:
    ModelConfig config_;
    PCG32 rng_;
    GridEnvironment grid_;
    std::vector<Agent> agents_;
    int timestep_;
    AgentId next_agent_id_;
    ModelUpdate model_update_;
    std::ostream* event_log_;

    AgentId generate_agent_id();
    void log_death(const Agent& agent, const TransferRecord& record) const;
    void remove_dead_agents();
};

}  // namespace resil
