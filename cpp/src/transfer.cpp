#include "transfer.hpp"
#include <algorithm>

namespace resil {

void move_agent(Agent& agent, GridEnvironment& grid, const ModelConfig& config, PCG32& rng,
                TransferRecord& record) {
    record.from = agent.position();

    std::vector<Position> moves = grid.neighbors(agent.x, agent.y, 1);
    if (!moves.empty()) {
        agent.move_to(moves[rng.integers(0, static_cast<int>(moves.size()))]);
    }
    record.to = agent.position();

    pay_move_cost(agent, config, record);
}

void pay_move_cost(Agent& agent, const ModelConfig& config, TransferRecord& record) {
    if (agent.dynamic_store >= config.move_cost) {
        agent.dynamic_store -= config.move_cost;
        record.dynamic_spent_on_move += config.move_cost;
        return;
    }

    double shortfall = config.move_cost - agent.dynamic_store;
    record.dynamic_spent_on_move += agent.dynamic_store;
    agent.dynamic_store = 0.0;
    double before = agent.static_store;
    agent.static_store = std::max(agent.static_store - shortfall, 0.0);
    record.static_destroyed += before - agent.static_store;
}

void gather_resources(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                      TransferRecord& record) {
    int x = agent.x;
    int y = agent.y;

    double dynamic_target = agent.needed_energy * config.dynamic_vs_static_preference;
    double static_target = agent.needed_energy * (1.0 - config.dynamic_vs_static_preference);

    double d_gather = std::min(grid.at(ResourceKind::DYNAMIC, x, y),
                               dynamic_target * config.rate_dynamic_gather);
    double s_gather = std::min(grid.at(ResourceKind::STATIC, x, y),
                               static_target * config.rate_static_gather);

    grid.adjust(ResourceKind::DYNAMIC, x, y, -d_gather);
    grid.adjust(ResourceKind::STATIC, x, y, -s_gather);

    double total = d_gather + s_gather;
    agent.dynamic_store += total;

    double created = total * config.percent_waste_generated;
    agent.waste_store += created;

    record.harvested_dynamic += d_gather;
    record.harvested_static += s_gather;
    record.agent_waste_created += created;

    if (agent.dynamic_store > agent.max_dynamic_store) {
        double excess = agent.dynamic_store - agent.max_dynamic_store;
        agent.dynamic_store = agent.max_dynamic_store;

        // Excess goes back in full; the overflow waste is extra on top of it
        double overflow_waste = config.overflow_waste_fraction * excess;
        grid.adjust(ResourceKind::DYNAMIC, x, y, excess);
        grid.adjust(ResourceKind::WASTE, x, y, overflow_waste);

        record.overflow_returned += excess;
        record.overflow_waste_created += overflow_waste;
    }
}

void emit_output(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                 TransferRecord& record) {
    double output = std::min(agent.dynamic_store * config.emit_fraction, agent.dynamic_store);
    agent.dynamic_store -= output;

    double to_waste = output * config.emit_waste_fraction;
    double to_dynamic = output - to_waste;
    grid.adjust(ResourceKind::DYNAMIC, agent.x, agent.y, to_dynamic);
    grid.adjust(ResourceKind::WASTE, agent.x, agent.y, to_waste);

    record.emitted_dynamic += to_dynamic;
    record.emitted_waste += to_waste;
}

bool check_death(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                 TransferRecord& record) {
    if (!(agent.waste_store > agent.static_store)) return false;

    double total = agent.holdings();
    double portion_dynamic = config.death_recycle_ratio * total;
    double portion_waste = (1.0 - config.death_recycle_ratio) * total;

    grid.adjust(ResourceKind::DYNAMIC, agent.x, agent.y, portion_dynamic);
    grid.adjust(ResourceKind::WASTE, agent.x, agent.y, portion_waste);

    agent.alive = false;
    record.died = true;
    record.recycled_dynamic = portion_dynamic;
    record.recycled_waste = portion_waste;
    return true;
}

TransferRecord run_agent_protocol(Agent& agent, GridEnvironment& grid, const ModelConfig& config,
                                  PCG32& rng) {
    TransferRecord record;
    record.agent_id = agent.id;

    move_agent(agent, grid, config, rng, record);
    gather_resources(agent, grid, config, record);
    emit_output(agent, grid, config, record);
    check_death(agent, grid, config, record);
    return record;
}

}  // namespace resil
