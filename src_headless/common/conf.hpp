#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "config.hpp"
#include "types.hpp"

struct Color3 {
    int r, g, b;
};

struct EnvConf {
    Dimension dimension = Dimension(DEFAULT_GRID_WIDTH, DEFAULT_GRID_HEIGHT);
    float tile_side = DEFAULT_TILE_SIDE;
    Color3 background = {25, 75, 75};
    bool grid_visible = false;
};

struct NestConf {
    bool visible = true;
    Location location = Location(DEFAULT_NEST_X, DEFAULT_NEST_Y);
};

struct AntsConf {
    bool visible = true;
    std::size_t count = DEFAULT_NUM_ANTS;
    std::size_t memory_span = DEFAULT_MEMORY_SPAN;
    std::uint16_t max_phero_concentration = DEFAULT_MAX_PHERO_CONCENTRATION;
    std::uint16_t phero_decrease = DEFAULT_PHERO_DECREASE;
    double phero_increase_ratio = DEFAULT_PHERO_INCREASE_RATIO;
};

struct MorselsConf {
    bool visible = true;
    std::size_t count = DEFAULT_NUM_MORSELS;
    std::uint64_t storage = DEFAULT_MORSEL_STORAGE;
};

struct PheromonesConf {
    bool colony_visible = false;
    bool food_visible = false;
};

// The simulation configuration. A default constructed Conf holds the
// documented defaults.
struct Conf {
    int fps = DEFAULT_FPS;  // 0 runs a single generation per frame
    unsigned seed = DEFAULT_SEED;
    EnvConf env;
    NestConf nest;
    AntsConf ants;
    MorselsConf morsels;
    PheromonesConf pheromones;

    // Total food initially located in the environment
    std::uint64_t total_storage() const { return morsels.storage * morsels.count; }

    bool is_visible(EntityKind kind) const {
        switch (kind) {
            case EntityKind::NEST:
                return nest.visible;
            case EntityKind::MORSEL:
                return morsels.visible;
            case EntityKind::PHERO:
                return pheromones.colony_visible || pheromones.food_visible;
        }
        return false;
    }

    bool is_visible(Scent scent) const {
        return scent == Scent::COLONY ? pheromones.colony_visible : pheromones.food_visible;
    }
};

// Throws std::invalid_argument if the configuration cannot drive a simulation
void validate_conf(const Conf& conf);

// Parses a JSON document; throws on malformed JSON, wrong types or invalid values
Conf conf_from_string(const std::string& text);

// Parses the JSON file at `path`; throws on any failure
Conf parse_conf(const std::string& path);

// Like parse_conf, but falls back to the defaults with a warning on failure
Conf load_conf(const std::string& path);
