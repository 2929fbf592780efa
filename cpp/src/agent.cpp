#include "agent.hpp"

namespace resil {

Agent::Agent(
    AgentId id_,
    int x_,
    int y_,
    double static_store_,
    double dynamic_store_,
    double waste_store_,
    double max_dynamic_store_,
    double needed_energy_
) : id(id_),
    x(x_),
    y(y_),
    static_store(static_store_),
    dynamic_store(dynamic_store_),
    waste_store(waste_store_),
    max_dynamic_store(max_dynamic_store_),
    needed_energy(needed_energy_),
    alive(true) {}

void Agent::move_to(Position pos) {
    x = pos.x;
    y = pos.y;
}

Position Agent::position() const {
    return Position{x, y};
}

double Agent::holdings() const {
    return static_store + dynamic_store + waste_store;
}

}  // namespace resil
