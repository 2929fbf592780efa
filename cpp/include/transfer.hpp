#pragma once

#include "types.hpp"
#include "rng.hpp"
#include "grid.hpp"
#include "agent.hpp"

namespace resil {

// What one agent's activation moved between itself and the grid.
struct TransferRecord {
    AgentId agent_id = 0;
    Position from{0, 0};
    Position to{0, 0};

    // Move cost leaves the system from both stores
    double dynamic_spent_on_move = 0.0;
    double static_destroyed = 0.0;

    double harvested_dynamic = 0.0;
    double harvested_static = 0.0;
    double agent_waste_created = 0.0;
    double overflow_returned = 0.0;
    double overflow_waste_created = 0.0;

    double emitted_dynamic = 0.0;
    double emitted_waste = 0.0;

    bool died = false;
    double recycled_dynamic = 0.0;
    double recycled_waste = 0.0;

    double waste_created() const { return agent_waste_created + overflow_waste_created; }
    double energy_destroyed() const { return dynamic_spent_on_move + static_destroyed; }
    // Change in total system energy caused by this activation.
    double net_energy_change() const { return waste_created() - energy_destroyed(); }
};

void move_agent(Agent& agent, GridEnvironment& grid, const ModelConfig& config, PCG32& rng,
                TransferRecord& record);
void pay_move_cost(Agent& agent, const ModelConfig& config, TransferRecord& record);
void gather_resources(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                      TransferRecord& record);
void emit_output(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                 TransferRecord& record);
bool check_death(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                 TransferRecord& record);

TransferRecord run_agent_protocol(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                                  PCG32& rng);

}  // namespace resil
