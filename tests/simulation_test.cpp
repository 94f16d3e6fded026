#include <gtest/gtest.h>

#include <iostream>
#include <variant>
#include <vector>

#include "simulation.hpp"

namespace {

Conf small_conf() {
    Conf conf;
    conf.seed = 3;
    conf.env.dimension = Dimension(20, 20);
    conf.nest.location = Location(10, 10);
    conf.ants.count = 20;
    conf.morsels.count = 5;
    conf.morsels.storage = 10;
    return conf;
}

std::uint64_t remaining_supply(const Environment& env) {
    std::uint64_t supply = 0;
    for (const Tile& tile : env.all_tiles()) {
        for (const Entity& e : tile.entities) {
            if (const MorselState* morsel = std::get_if<MorselState>(&e.state))
                supply += morsel->supply.length();
        }
    }
    return supply;
}

std::size_t count_entities(const Environment& env, EntityKind kind) {
    std::size_t count = 0;
    for (const Tile& tile : env.all_tiles()) {
        for (const Entity& e : tile.entities) {
            if (e.kind() == kind)
                count++;
        }
    }
    return count;
}

}  // namespace

TEST(AntSimulationTest, InitializePopulatesTheEnvironment) {
    const Conf conf = small_conf();
    AntSimulation sim(conf);
    const Environment& env = sim.environment();

    EXPECT_EQ(env.generation(), 0u);
    EXPECT_EQ(count_entities(env, EntityKind::NEST), 1u);
    EXPECT_TRUE(env.tile(conf.nest.location).contains(EntityKind::NEST));
    EXPECT_EQ(count_entities(env, EntityKind::MORSEL), conf.morsels.count);
    EXPECT_EQ(remaining_supply(env), sim.total_storage());
    EXPECT_EQ(env.count_markers(), 0u);

    ASSERT_EQ(env.ants().size(), conf.ants.count);
    for (const Ant& ant : env.ants()) {
        EXPECT_EQ(ant.location(), conf.nest.location);
        EXPECT_EQ(ant.activity(), Activity::FORAGING);
    }
    EXPECT_EQ(sim.storage(), 0u);
    EXPECT_FALSE(sim.is_simulation_over());
}

TEST(AntSimulationTest, RejectsInvalidConfiguration) {
    Conf conf = small_conf();
    conf.nest.location = Location(25, 3);
    EXPECT_THROW({ AntSimulation sim(conf); }, std::invalid_argument);
}

TEST(AntSimulationTest, FoodIsConserved) {
    AntSimulation sim(small_conf());
    const Environment& env = sim.environment();
    std::uint64_t previous = 0;

    for (int gen = 0; gen < 2000 && !sim.is_simulation_over(); gen++) {
        sim.tick();

        const std::uint64_t stored = sim.storage();
        const std::uint64_t carried = sim.get_stats().carrying_ants;
        ASSERT_EQ(remaining_supply(env) + carried + stored, sim.total_storage()) << "generation " << gen;
        ASSERT_GE(stored, previous);
        ASSERT_LE(stored, sim.total_storage());
        previous = stored;
    }
}

TEST(AntSimulationTest, OverOnlyWhenAllFoodIsStored) {
    AntSimulation sim(small_conf());
    Entity* entity = sim.environment().find_first(EntityKind::NEST);
    ASSERT_NE(entity, nullptr);
    NestState* nest = std::get_if<NestState>(&entity->state);
    ASSERT_NE(nest, nullptr);

    for (std::uint64_t i = 0; i < sim.total_storage(); i++) {
        EXPECT_FALSE(sim.is_simulation_over());
        nest->store();
    }
    EXPECT_TRUE(sim.is_simulation_over());

    nest->store();
    EXPECT_THROW(sim.storage(), InvariantViolation);
}

TEST(AntSimulationTest, SameSeedSameHistory) {
    AntSimulation first(small_conf());
    AntSimulation second(small_conf());

    for (int gen = 0; gen < 300; gen++) {
        first.tick();
        second.tick();
    }

    EXPECT_EQ(first.storage(), second.storage());
    EXPECT_EQ(first.environment().count_markers(), second.environment().count_markers());
    const std::vector<Ant>& a = first.environment().ants();
    const std::vector<Ant>& b = second.environment().ants();
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); i++) {
        EXPECT_EQ(a[i].location(), b[i].location());
        EXPECT_EQ(a[i].activity(), b[i].activity());
    }
}

TEST(AntSimulationTest, ResetRestartsFromScratch) {
    AntSimulation sim(small_conf());
    for (int gen = 0; gen < 50; gen++)
        sim.tick();

    sim.initialize();

    EXPECT_EQ(sim.environment().generation(), 0u);
    EXPECT_EQ(sim.storage(), 0u);
    EXPECT_EQ(remaining_supply(sim.environment()), sim.total_storage());
}

TEST(AntSimulationTest, SmallColonyCollectsAllTheFood) {
    Conf conf;
    conf.seed = 11;
    conf.env.dimension = Dimension(10, 10);
    conf.nest.location = Location(5, 5);
    conf.ants.count = 20;
    conf.morsels.count = 1;
    conf.morsels.storage = 5;

    AntSimulation sim(conf);
    const SimStats stats = sim.run(100000, 0);

    EXPECT_TRUE(sim.is_simulation_over());
    EXPECT_EQ(stats.total_food_collected, 5u);
    EXPECT_EQ(stats.total_food_available, 5u);
    EXPECT_LT(stats.generations, 100000u);
}

TEST(AntSimulationTest, HighIncreaseRatioKeepsRunning) {
    Conf conf = small_conf();
    conf.ants.phero_increase_ratio = 1.0;
    AntSimulation sim(conf);

    for (int gen = 0; gen < 3000 && !sim.is_simulation_over(); gen++) {
        ASSERT_NO_THROW(sim.tick()) << "generation " << gen;
        ASSERT_LE(sim.storage(), sim.total_storage());
    }
}

// Colonies of different sizes share the same world
TEST(AntSimulationTest, ColonySizeSweep) {
    const Conf base = parse_conf(FORMICARIUM_TEST_CONF);
    const std::size_t counts[] = {1, 5, 20, 40};

    for (std::size_t count : counts) {
        Conf conf = base;
        conf.ants.count = count;
        AntSimulation sim(conf);

        std::uint64_t previous = 0;
        for (int gen = 0; gen < 5000 && !sim.is_simulation_over(); gen++) {
            ASSERT_NO_THROW(sim.tick()) << count << " ants, generation " << gen;
            const std::uint64_t stored = sim.storage();
            ASSERT_GE(stored, previous);
            ASSERT_LE(stored, sim.total_storage());
            previous = stored;
        }
        std::cout << count << " ants: " << sim.environment().generation() << " generations, " << sim.storage()
                  << "/" << sim.total_storage() << " food" << std::endl;
    }
}
