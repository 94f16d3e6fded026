#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include "config.hpp"

using EntityId = std::uint64_t;

// Raised when an internal invariant of the simulation is broken
class InvariantViolation : public std::logic_error {
   public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

// Grid coordinates
struct Location {
    int x, y;

    Location() : x(0), y(0) {}
    Location(int x, int y) : x(x), y(y) {}

    bool operator==(const Location& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Location& other) const { return !(*this == other); }
};

// Relative displacement between two locations
struct Offset {
    int x, y;

    Offset() : x(0), y(0) {}
    Offset(int x, int y) : x(x), y(y) {}
};

// Number of tiles along each axis
struct Dimension {
    int x, y;

    Dimension() : x(0), y(0) {}
    Dimension(int x, int y) : x(x), y(y) {}

    int len() const { return x * y; }
    bool contains(const Location& loc) const { return loc.x >= 0 && loc.x < x && loc.y >= 0 && loc.y < y; }
};

// Utility functions
inline int wrap(int value, int size) {
    int r = value % size;
    return r < 0 ? r + size : r;
}

inline Location wrap(const Location& loc, const Dimension& dim) {
    return Location(wrap(loc.x, dim.x), wrap(loc.y, dim.y));
}

inline int to_index(const Location& loc, const Dimension& dim) {
    return loc.y * dim.x + loc.x;
}

inline int sign(int value) {
    return (value > 0) - (value < 0);
}

inline Location translate(const Location& from, const Offset& offset, const Dimension& dim) {
    return wrap(Location(from.x + offset.x, from.y + offset.y), dim);
}

// Single step (at most one unit per axis) from `from` towards `dest`
inline Location translate_towards(const Location& from, const Location& dest, const Dimension& dim) {
    return translate(from, Offset(sign(dest.x - from.x), sign(dest.y - from.y)), dim);
}

inline int manhattan_distance(const Location& a, const Location& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// All the offsets at Chebyshev distance `radius`, row by row.
// The border of radius 0 is the origin itself.
inline std::vector<Offset> border(int radius) {
    std::vector<Offset> offsets;
    if (radius <= 0) {
        offsets.emplace_back(0, 0);
        return offsets;
    }
    for (int dy = -radius; dy <= radius; dy++) {
        for (int dx = -radius; dx <= radius; dx++) {
            if (std::abs(dx) != radius && std::abs(dy) != radius)
                continue;
            offsets.emplace_back(dx, dy);
        }
    }
    return offsets;
}

// Remaining lifetime, shared by pheromone strength and morsel supply
class Lifespan {
   public:
    Lifespan() : span(0) {}
    explicit Lifespan(std::uint64_t length) : span(length) {}

    std::uint64_t length() const { return span; }
    bool is_alive() const { return span > 0; }

    void shorten() {
        if (span > 0)
            span--;
    }

    void lengthen_by(std::uint64_t amount) {
        const std::uint64_t room = std::numeric_limits<std::uint64_t>::max() - span;
        span += std::min(amount, room);
    }

    void clear() { span = 0; }

   private:
    std::uint64_t span;
};

// Amount of pheromone an Ant is able to release
class Concentration {
   public:
    Concentration() : amount(0) {}
    explicit Concentration(std::uint16_t amount) : amount(amount) {}

    // Saturates at zero
    std::uint16_t decrease_by(std::uint16_t value) {
        amount = value >= amount ? 0 : static_cast<std::uint16_t>(amount - value);
        return amount;
    }

    std::uint16_t value() const { return amount; }

   private:
    std::uint16_t amount;
};

// Food store of the colony
struct NestState {
    std::uint64_t storage = 0;

    EntityKind kind() const { return EntityKind::NEST; }
    bool is_alive() const { return true; }

    // Increments the food storage by a single unit
    void store() {
        if (storage < std::numeric_limits<std::uint64_t>::max())
            storage++;
    }
};

// Food source, shrinking by one unit per pick up
struct MorselState {
    Lifespan supply;

    EntityKind kind() const { return EntityKind::MORSEL; }
    bool is_alive() const { return supply.is_alive(); }
};

// Trail marker, its strength is its remaining lifetime
struct PheroState {
    Scent scent = Scent::COLONY;
    Lifespan strength;

    EntityKind kind() const { return EntityKind::PHERO; }
    bool is_alive() const { return strength.is_alive(); }
};

using EntityState = std::variant<NestState, MorselState, PheroState>;

// Entity stored in a tile: identity and location plus the payload of its kind
struct Entity {
    EntityId id = 0;  // 0 until inserted in the environment
    Location location;
    EntityState state;

    static Entity nest(const Location& loc) {
        Entity e;
        e.location = loc;
        e.state = NestState();
        return e;
    }

    static Entity morsel(const Location& loc, std::uint64_t supply) {
        Entity e;
        e.location = loc;
        MorselState morsel;
        morsel.supply = Lifespan(supply);
        e.state = morsel;
        return e;
    }

    static Entity phero(Scent scent, const Location& loc, std::uint64_t strength) {
        Entity e;
        e.location = loc;
        PheroState phero;
        phero.scent = scent;
        phero.strength = Lifespan(strength);
        e.state = phero;
        return e;
    }

    EntityKind kind() const {
        return std::visit([](const auto& s) { return s.kind(); }, state);
    }

    // A nest lives forever, morsels and pheromones until their lifespan ends
    bool is_alive() const {
        return std::visit([](const auto& s) { return s.is_alive(); }, state);
    }

    bool is_phero(Scent s) const {
        const PheroState* phero = std::get_if<PheroState>(&state);
        return phero && phero->scent == s;
    }
};

// A single cell of the environment and the entities located in it
struct Tile {
    Location location;
    std::vector<Entity> entities;

    Entity* find(EntityKind kind) {
        for (auto& e : entities) {
            if (e.kind() == kind)
                return &e;
        }
        return nullptr;
    }

    const Entity* find(EntityKind kind) const {
        for (const auto& e : entities) {
            if (e.kind() == kind)
                return &e;
        }
        return nullptr;
    }

    // Payload of the first entity holding a T
    template <typename T>
    T* find_state() {
        for (auto& e : entities) {
            if (T* s = std::get_if<T>(&e.state))
                return s;
        }
        return nullptr;
    }

    template <typename T>
    const T* find_state() const {
        for (const auto& e : entities) {
            if (const T* s = std::get_if<T>(&e.state))
                return s;
        }
        return nullptr;
    }

    PheroState* find_phero(Scent scent) {
        for (auto& e : entities) {
            PheroState* phero = std::get_if<PheroState>(&e.state);
            if (phero && phero->scent == scent)
                return phero;
        }
        return nullptr;
    }

    const PheroState* find_phero(Scent scent) const {
        for (const auto& e : entities) {
            const PheroState* phero = std::get_if<PheroState>(&e.state);
            if (phero && phero->scent == scent)
                return phero;
        }
        return nullptr;
    }

    bool contains(EntityKind kind) const { return find(kind) != nullptr; }

    std::size_t count_phero(Scent scent) const {
        return static_cast<std::size_t>(std::count_if(entities.begin(), entities.end(),
                                                      [scent](const Entity& e) { return e.is_phero(scent); }));
    }

    // Strength of the pheromone with the given scent, 0 if there is none
    std::uint64_t phero_strength(Scent scent) const {
        const PheroState* phero = find_phero(scent);
        return phero ? phero->strength.length() : 0;
    }
};

// Pheromone scent used to seek the given kind
inline Scent scent_of(EntityKind kind) {
    switch (kind) {
        case EntityKind::NEST:
            return Scent::COLONY;
        case EntityKind::MORSEL:
            return Scent::FOOD;
        default:
            throw InvariantViolation("no scent leads to a pheromone");
    }
}

// Simulation statistics
struct SimStats {
    std::uint64_t total_food_collected = 0;
    std::uint64_t total_food_available = 0;
    std::uint64_t generations = 0;
    std::size_t carrying_ants = 0;
    std::size_t live_markers = 0;
    double elapsed_ms = 0.0;
};

// Random number generator wrapper
class RNG {
   public:
    RNG(unsigned seed = DEFAULT_SEED) : gen(seed) {}

    int random_int(int min, int max) {
        std::uniform_int_distribution<int> d(min, max);
        return d(gen);
    }

    template <typename T>
    void shuffle(std::vector<T>& items) {
        std::shuffle(items.begin(), items.end(), gen);
    }

   private:
    std::mt19937 gen;
};
