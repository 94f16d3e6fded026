#pragma once

#include <cstdint>
#include "conf.hpp"
#include "environment.hpp"
#include "types.hpp"

class AntSimulation {
   public:
    explicit AntSimulation(const Conf& conf);

    // Populates the environment: the nest, the Ants born in it and the
    // morsels scattered at random locations
    void initialize();

    // Moves the simulation forward by a single generation
    std::uint64_t tick();

    // True only when all the food has been moved from the morsels to the nest
    bool is_simulation_over() const { return storage() == total_storage(); }

    // Amount of food currently stored in the nest
    std::uint64_t storage() const;
    std::uint64_t total_storage() const { return config.total_storage(); }

    SimStats get_stats() const;

    // Runs until the simulation is over or `max_generations` is reached,
    // reporting progress every `report_every` generations (0 is silent)
    SimStats run(std::uint64_t max_generations, std::uint64_t report_every);

    const Conf& conf() const { return config; }
    Environment& environment() { return env; }
    const Environment& environment() const { return env; }

   private:
    Conf config;
    Environment env;
    RNG rng;
    double simulation_time_ms;
};
