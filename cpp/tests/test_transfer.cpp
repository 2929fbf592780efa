#include <gtest/gtest.h>

#include <algorithm>

#include "agent.hpp"
#include "grid.hpp"
#include "rng.hpp"
#include "transfer.hpp"
#include "types.hpp"

using namespace resil;

class TransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = default_model_config();
        config.width = 5;
        config.height = 5;
        config.needed_energy = 10.0;
        config.dynamic_vs_static_preference = 0.5;
        config.rate_dynamic_gather = 1.0;
        config.rate_static_gather = 0.8;
        config.percent_waste_generated = 0.1;
        config.max_dynamic_store = 50.0;

        for (int y = 0; y < 5; y++) {
            for (int x = 0; x < 5; x++) {
                grid.set(ResourceKind::STATIC, x, y, 100.0);
                grid.set(ResourceKind::DYNAMIC, x, y, 100.0);
            }
        }
    }

    Agent make_agent(int x, int y, double static_store, double dynamic_store, double waste_store) {
        return Agent(1, x, y, static_store, dynamic_store, waste_store,
                     config.max_dynamic_store, config.needed_energy);
    }

    double system_energy(const Agent& agent) const {
        double total = grid.sum(ResourceKind::STATIC) + grid.sum(ResourceKind::DYNAMIC) +
                       grid.sum(ResourceKind::WASTE);
        return agent.alive ? total + agent.holdings() : total;
    }

    ModelConfig config;
    GridEnvironment grid{5, 5};
};

TEST_F(TransferTest, MoveCostComesFromDynamicFirst) {
    Agent agent = make_agent(2, 2, 10.0, 5.0, 0.0);
    TransferRecord record;
    pay_move_cost(agent, config, record);

    EXPECT_DOUBLE_EQ(agent.dynamic_store, 4.0);
    EXPECT_DOUBLE_EQ(agent.static_store, 10.0);
    EXPECT_DOUBLE_EQ(record.dynamic_spent_on_move, 1.0);
    EXPECT_DOUBLE_EQ(record.static_destroyed, 0.0);
    EXPECT_DOUBLE_EQ(record.energy_destroyed(), 1.0);
}

TEST_F(TransferTest, MoveShortfallIsDrawnFromStaticAndLost) {
    Agent agent = make_agent(2, 2, 10.0, 0.4, 0.0);
    double before = system_energy(agent);
    TransferRecord record;
    pay_move_cost(agent, config, record);

    EXPECT_DOUBLE_EQ(agent.dynamic_store, 0.0);
    EXPECT_NEAR(agent.static_store, 9.4, 1e-12);
    EXPECT_NEAR(record.dynamic_spent_on_move, 0.4, 1e-12);
    EXPECT_NEAR(record.static_destroyed, 0.6, 1e-12);
    EXPECT_NEAR(record.energy_destroyed(), 1.0, 1e-12);
    EXPECT_NEAR(before - system_energy(agent), record.energy_destroyed(), 1e-9);
}

TEST_F(TransferTest, MoveShortfallFloorsStaticAtZero) {
    Agent agent = make_agent(2, 2, 0.3, 0.0, 0.0);
    TransferRecord record;
    pay_move_cost(agent, config, record);

    EXPECT_DOUBLE_EQ(agent.static_store, 0.0);
    EXPECT_DOUBLE_EQ(agent.dynamic_store, 0.0);
    EXPECT_DOUBLE_EQ(record.dynamic_spent_on_move, 0.0);
    EXPECT_NEAR(record.static_destroyed, 0.3, 1e-12);
}

TEST_F(TransferTest, MoveLandsOnMooreNeighbor) {
    PCG32 rng(11);
    for (int i = 0; i < 50; i++) {
        Agent agent = make_agent(2, 2, 10.0, 5.0, 0.0);
        TransferRecord record;
        move_agent(agent, grid, config, rng, record);

        auto ring = grid.neighbors(2, 2);
        EXPECT_NE(std::find(ring.begin(), ring.end(), agent.position()), ring.end());
        EXPECT_EQ(record.from, (Position{2, 2}));
        EXPECT_EQ(record.to, agent.position());
        EXPECT_DOUBLE_EQ(agent.dynamic_store, 4.0);
    }
}

TEST_F(TransferTest, MoveFromLastColumnWrapsToFirst) {
    PCG32 rng(23);
    bool reached_east_wrap = false;
    for (int i = 0; i < 200; i++) {
        Agent agent = make_agent(4, 2, 10.0, 5.0, 0.0);
        TransferRecord record;
        move_agent(agent, grid, config, rng, record);

        EXPECT_GE(agent.x, 0);
        EXPECT_LT(agent.x, 5);
        EXPECT_TRUE(agent.x == 3 || agent.x == 4 || agent.x == 0);
        if (agent.position() == Position{0, 2}) reached_east_wrap = true;
    }
    EXPECT_TRUE(reached_east_wrap);
}

TEST_F(TransferTest, GatherSplitsNeedByPreferenceAndRates) {
    Agent agent = make_agent(1, 1, 50.0, 20.0, 0.0);
    TransferRecord record;
    gather_resources(agent, grid, config, record);

    // Dynamic: min(5 * 1.0, 100); static: min(5 * 0.8, 100)
    EXPECT_DOUBLE_EQ(record.harvested_dynamic, 5.0);
    EXPECT_DOUBLE_EQ(record.harvested_static, 4.0);
    EXPECT_DOUBLE_EQ(agent.dynamic_store, 29.0);
    EXPECT_NEAR(agent.waste_store, 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(agent.static_store, 50.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::DYNAMIC, 1, 1), 95.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::STATIC, 1, 1), 96.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::WASTE, 1, 1), 0.0);
}

TEST_F(TransferTest, GatherIsCappedByCellContents) {
    grid.set(ResourceKind::DYNAMIC, 1, 1, 2.0);
    grid.set(ResourceKind::STATIC, 1, 1, 0.0);
    Agent agent = make_agent(1, 1, 50.0, 20.0, 0.0);
    TransferRecord record;
    gather_resources(agent, grid, config, record);

    EXPECT_DOUBLE_EQ(record.harvested_dynamic, 2.0);
    EXPECT_DOUBLE_EQ(record.harvested_static, 0.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::DYNAMIC, 1, 1), 0.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::STATIC, 1, 1), 0.0);
    EXPECT_DOUBLE_EQ(agent.dynamic_store, 22.0);
}

TEST_F(TransferTest, GatherOverflowReturnsExcessAndCreatesWaste) {
    Agent agent = make_agent(1, 1, 50.0, 48.0, 0.0);
    double before = system_energy(agent);
    TransferRecord record;
    gather_resources(agent, grid, config, record);

    // 48 + 9 = 57, clipped to 50
    EXPECT_DOUBLE_EQ(agent.dynamic_store, 50.0);
    EXPECT_DOUBLE_EQ(record.overflow_returned, 7.0);
    EXPECT_NEAR(record.overflow_waste_created, 0.7, 1e-12);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::DYNAMIC, 1, 1), 102.0);
    EXPECT_NEAR(grid.at(ResourceKind::WASTE, 1, 1), 0.7, 1e-12);

    EXPECT_NEAR(system_energy(agent) - before, record.waste_created(), 1e-9);
    EXPECT_NEAR(record.waste_created(), 0.9 + 0.7, 1e-12);
}

TEST_F(TransferTest, EmitSplitsOutputBetweenDynamicAndWaste) {
    Agent agent = make_agent(3, 0, 50.0, 40.0, 0.0);
    double before = system_energy(agent);
    TransferRecord record;
    emit_output(agent, grid, config, record);

    EXPECT_NEAR(agent.dynamic_store, 36.0, 1e-12);
    EXPECT_NEAR(grid.at(ResourceKind::DYNAMIC, 3, 0), 103.6, 1e-12);
    EXPECT_NEAR(grid.at(ResourceKind::WASTE, 3, 0), 0.4, 1e-12);
    EXPECT_NEAR(record.emitted_dynamic, 3.6, 1e-12);
    EXPECT_NEAR(record.emitted_waste, 0.4, 1e-12);
    EXPECT_NEAR(system_energy(agent), before, 1e-9);
}

TEST_F(TransferTest, EmitFromEmptyStoreIsNoop) {
    Agent agent = make_agent(3, 0, 50.0, 0.0, 0.0);
    TransferRecord record;
    emit_output(agent, grid, config, record);

    EXPECT_DOUBLE_EQ(agent.dynamic_store, 0.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::DYNAMIC, 3, 0), 100.0);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::WASTE, 3, 0), 0.0);
}

TEST_F(TransferTest, DeathRecyclesHoldingsByRatio) {
    config.death_recycle_ratio = 0.7;
    Agent agent = make_agent(0, 4, 1.0, 2.0, 1.5);
    TransferRecord record;

    EXPECT_TRUE(check_death(agent, grid, config, record));
    EXPECT_FALSE(agent.alive);
    EXPECT_TRUE(record.died);
    EXPECT_NEAR(record.recycled_dynamic, 0.7 * 4.5, 1e-12);
    EXPECT_NEAR(record.recycled_waste, 0.3 * 4.5, 1e-12);
    EXPECT_NEAR(grid.at(ResourceKind::DYNAMIC, 0, 4), 100.0 + 3.15, 1e-12);
    EXPECT_NEAR(grid.at(ResourceKind::WASTE, 0, 4), 1.35, 1e-12);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::STATIC, 0, 4), 100.0);
}

TEST_F(TransferTest, WasteEqualToStaticDoesNotKill) {
    Agent agent = make_agent(0, 4, 2.0, 2.0, 2.0);
    TransferRecord record;

    EXPECT_FALSE(check_death(agent, grid, config, record));
    EXPECT_TRUE(agent.alive);
    EXPECT_FALSE(record.died);
    EXPECT_DOUBLE_EQ(grid.at(ResourceKind::DYNAMIC, 0, 4), 100.0);
}

TEST_F(TransferTest, ProtocolBalanceMatchesRecord) {
    PCG32 rng(8);
    Agent agent = make_agent(2, 2, 3.0, 0.5, 0.0);
    config.needed_energy = 120.0;
    agent.needed_energy = 120.0;

    for (int i = 0; i < 10 && agent.alive; i++) {
        double before = system_energy(agent);
        TransferRecord record = run_agent_protocol(agent, grid, config, rng);
        EXPECT_EQ(record.agent_id, agent.id);
        EXPECT_NEAR(system_energy(agent) - before, record.net_energy_change(), 1e-9);
        EXPECT_LE(agent.dynamic_store, agent.max_dynamic_store);
    }
}
