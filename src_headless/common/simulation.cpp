#include "simulation.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <variant>

AntSimulation::AntSimulation(const Conf& conf)
    : config(conf), env(conf.env.dimension), rng(conf.seed), simulation_time_ms(0) {
    validate_conf(config);
    initialize();
}

void AntSimulation::initialize() {
    env = Environment(config.env.dimension);
    rng = RNG(config.seed);
    simulation_time_ms = 0;

    const Location nest_location = config.nest.location;
    env.insert(Entity::nest(nest_location));

    for (std::size_t i = 0; i < config.ants.count; i++) {
        env.spawn(nest_location, config.ants);
    }

    const Dimension& dim = config.env.dimension;
    for (std::size_t i = 0; i < config.morsels.count; i++) {
        Location loc(rng.random_int(0, dim.x - 1), rng.random_int(0, dim.y - 1));
        env.insert(Entity::morsel(loc, config.morsels.storage));
    }
}

std::uint64_t AntSimulation::tick() {
    auto start = std::chrono::high_resolution_clock::now();

    const std::uint64_t generation = env.nextgen(rng);

    auto end = std::chrono::high_resolution_clock::now();
    simulation_time_ms += std::chrono::duration<double, std::milli>(end - start).count();
    return generation;
}

std::uint64_t AntSimulation::storage() const {
    const Entity* entity = env.find_first(EntityKind::NEST);
    const NestState* nest = entity ? std::get_if<NestState>(&entity->state) : nullptr;
    if (!nest)
        throw InvariantViolation("the environment has no nest");
    if (nest->storage > total_storage())
        throw InvariantViolation("the nest stores more food than was available");
    return nest->storage;
}

SimStats AntSimulation::get_stats() const {
    SimStats stats;
    stats.total_food_collected = storage();
    stats.total_food_available = total_storage();
    stats.generations = env.generation();
    stats.carrying_ants = static_cast<std::size_t>(std::count_if(
        env.ants().begin(), env.ants().end(), [](const Ant& ant) { return ant.activity() == Activity::CARRYING; }));
    stats.live_markers = env.count_markers();
    stats.elapsed_ms = simulation_time_ms;
    return stats;
}

SimStats AntSimulation::run(std::uint64_t max_generations, std::uint64_t report_every) {
    while (!is_simulation_over() && env.generation() < max_generations) {
        tick();

        if (report_every > 0 && env.generation() % report_every == 0) {
            std::cout << "Tick " << env.generation() << ": Collected " << storage() << "/" << total_storage()
                      << " food" << std::endl;
        }
    }

    SimStats stats = get_stats();
    if (report_every > 0) {
        std::cout << "\n=== Simulation " << (is_simulation_over() ? "Complete" : "Timeout") << " ===" << std::endl;
        std::cout << "Total ticks: " << stats.generations << std::endl;
        std::cout << "Food collected: " << stats.total_food_collected << "/" << stats.total_food_available
                  << std::endl;
        std::cout << "Execution time: " << stats.elapsed_ms << " ms" << std::endl;
        if (stats.generations > 0)
            std::cout << "Time per tick: " << stats.elapsed_ms / stats.generations << " ms" << std::endl;
    }
    return stats;
}
