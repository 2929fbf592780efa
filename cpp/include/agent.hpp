#pragma once

#include "types.hpp"

namespace resil {

struct Agent {
    AgentId id;
    int x;
    int y;
    double static_store;
    double dynamic_store;
    double waste_store;
    double max_dynamic_store;
    double needed_energy;
    bool alive;

    Agent(
        AgentId id_,
        int x_,
        int y_,
        double static_store_,
        double dynamic_store_,
        double waste_store_,
        double max_dynamic_store_,
        double needed_energy_
    );

    void move_to(Position pos);
    Position position() const;
    double holdings() const;
};

}  // namespace resil
