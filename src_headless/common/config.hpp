#pragma once

// Environment defaults - 30x30 torus of 25px tiles
#define DEFAULT_GRID_WIDTH 30
#define DEFAULT_GRID_HEIGHT 30
#define DEFAULT_TILE_SIDE 25.0f
#define DEFAULT_FPS 24
#define DEFAULT_SEED 0

// Nest defaults
#define DEFAULT_NEST_X 25
#define DEFAULT_NEST_Y 25

// Ant defaults
#define DEFAULT_NUM_ANTS 10
#define DEFAULT_MEMORY_SPAN 30
#define DEFAULT_MAX_PHERO_CONCENTRATION 200  // Strength of a fresh deposit
#define DEFAULT_PHERO_DECREASE 2             // Concentration lost per tick
#define DEFAULT_PHERO_INCREASE_RATIO 0.1     // Colony trail positive feedback

// Morsel defaults
#define DEFAULT_NUM_MORSELS 20
#define DEFAULT_MORSEL_STORAGE 30  // Amount of food at each morsel

#define MAX_GENERATIONS 150000  // Default cap for headless runs
#define REPORT_EVERY 1000

#define DEFAULT_CONF_PATH "conf.json"

// Entity kinds stored in tiles
enum class EntityKind : int {
    NEST = 0,
    MORSEL = 1,
    PHERO = 2
};

// Pheromone scents
enum class Scent : int {
    COLONY = 0,  // Leads back to the nest
    FOOD = 1     // Leads to a morsel
};

// Ant activities
enum class Activity : int {
    FORAGING = 0,  // Looking for food
    CARRYING = 1   // Returning to nest with food
};

// Ant roles, recomputed every tick
enum class Role : int {
    FOLLOWER = 0,
    LEADER = 1
};
