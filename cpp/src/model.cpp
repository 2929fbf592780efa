#include "model.hpp"
#include <algorithm>
#include <numeric>

namespace resil {

int StepReport::deaths() const {
    return static_cast<int>(std::count_if(records.begin(), records.end(),
                                          [](const TransferRecord& r) { return r.died; }));
}

double StepReport::net_energy_change() const {
    double change = 0.0;
    for (const auto& record : records) {
        change += record.net_energy_change();
    }
    return change;
}

namespace {

const ModelConfig& checked(const ModelConfig& config) {
    validate_config(config);
    return config;
}

}  // namespace

ResilienceModel::ResilienceModel(const ModelConfig& config, uint64_t seed)
    : config_(checked(config)),
      rng_(seed),
      grid_(config.width, config.height),
      timestep_(0),
      next_agent_id_(1),
      event_log_(nullptr) {
    grid_.fill_uniform(config_.total_grid_energy, config_.static_energy_share);
    spawn_agents(config_.agent_count);
}

AgentId ResilienceModel::generate_agent_id() {
    return next_agent_id_++;
}

Agent* ResilienceModel::try_seed_agent(int x, int y) {
    Position pos = grid_.wrap(x, y);
    x = pos.x;
    y = pos.y;

    double available_dynamic = std::min(grid_.at(ResourceKind::DYNAMIC, x, y),
                                        config_.initial_dynamic_store);
    // Dynamic energy the cell lacks has to come out of its static pool
    double dynamic_shortfall = config_.initial_dynamic_store - available_dynamic;
    double static_needed = config_.initial_static_store + dynamic_shortfall;

    if (grid_.at(ResourceKind::STATIC, x, y) < static_needed) {
        return nullptr;
    }

    grid_.adjust(ResourceKind::DYNAMIC, x, y, -available_dynamic);
    grid_.adjust(ResourceKind::STATIC, x, y, -static_needed);

    agents_.emplace_back(generate_agent_id(), x, y,
                         config_.initial_static_store,
                         config_.initial_dynamic_store,
                         config_.initial_waste_store,
                         config_.max_dynamic_store,
                         config_.needed_energy);
    return &agents_.back();
}

int ResilienceModel::spawn_agents(int n) {
    int seeded = 0;
    for (int i = 0; i < n; i++) {
        int x = rng_.integers(0, config_.width);
        int y = rng_.integers(0, config_.height);
        if (try_seed_agent(x, y)) {
            seeded++;
        }
    }
    return seeded;
}

Agent& ResilienceModel::add_agent(int x, int y, double static_store, double dynamic_store,
                                  double waste_store) {
    Position pos = grid_.wrap(x, y);
    agents_.emplace_back(generate_agent_id(), pos.x, pos.y,
                         std::max(static_store, 0.0),
                         std::clamp(dynamic_store, 0.0, config_.max_dynamic_store),
                         std::max(waste_store, 0.0),
                         config_.max_dynamic_store,
                         config_.needed_energy);
    return agents_.back();
}

const Agent* ResilienceModel::find_agent(AgentId id) const {
    for (const auto& agent : agents_) {
        if (agent.id == id && agent.alive) return &agent;
    }
    return nullptr;
}

void ResilienceModel::log_death(const Agent& agent, const TransferRecord& record) const {
    if (!event_log_) return;
    *event_log_ << "Agent " << agent.id << " died at (" << record.to.x << ", " << record.to.y << "):\n"
                << "  static_store  = " << agent.static_store << "\n"
                << "  dynamic_store = " << agent.dynamic_store << "\n"
                << "  waste_store   = " << agent.waste_store << "\n"
                << "  Total resources = " << agent.holdings() << "\n";
}

void ResilienceModel::remove_dead_agents() {
    agents_.erase(
        std::remove_if(agents_.begin(), agents_.end(),
                      [](const Agent& a) { return !a.alive; }),
        agents_.end()
    );
}

StepReport ResilienceModel::step() {
    StepReport report;
    report.timestep = timestep_;

    std::vector<size_t> order(agents_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    rng_.shuffle(order);

    report.records.reserve(order.size());
    for (size_t idx : order) {
        Agent& agent = agents_[idx];
        TransferRecord record = run_agent_protocol(agent, grid_, config_, rng_);
        if (record.died) {
            log_death(agent, record);
        }
        report.records.push_back(record);
    }

    remove_dead_agents();

    if (model_update_) {
        model_update_(*this);
    }

    timestep_++;
    return report;
}

void ResilienceModel::run(int n_steps) {
    for (int i = 0; i < n_steps; i++) {
        step();
    }
}

double ResilienceModel::total_waste() const {
    return grid_.sum(ResourceKind::WASTE);
}

double ResilienceModel::total_static_energy() const {
    return grid_.sum(ResourceKind::STATIC);
}

double ResilienceModel::total_dynamic_energy() const {
    return grid_.sum(ResourceKind::DYNAMIC);
}

double ResilienceModel::total_energy() const {
    double env_energy = total_static_energy() + total_dynamic_energy() + total_waste();

    double agent_energy = 0.0;
    for (const auto& agent : agents_) {
        if (agent.alive) {
            agent_energy += agent.holdings();
        }
    }
    return env_energy + agent_energy;
}

int ResilienceModel::live_agent_count() const {
    return static_cast<int>(std::count_if(agents_.begin(), agents_.end(),
                                          [](const Agent& a) { return a.alive; }));
}

ModelMetrics ResilienceModel::metrics() const {
    return ModelMetrics{
        .timestep = timestep_,
        .live_agents = live_agent_count(),
        .total_energy = total_energy(),
        .total_waste = total_waste(),
        .total_static_energy = total_static_energy(),
        .total_dynamic_energy = total_dynamic_energy()
    };
}

}  // namespace resil
