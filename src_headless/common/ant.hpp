#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "conf.hpp"
#include "memory.hpp"
#include "neighborhood.hpp"
#include "types.hpp"

// Scent an Ant leaves on its trail according to its activity
inline Scent scent_left_by(Activity activity) {
    return activity == Activity::CARRYING ? Scent::FOOD : Scent::COLONY;
}

// Kind an Ant is looking for according to its activity
inline EntityKind target_kind(Activity activity) {
    return activity == Activity::CARRYING ? EntityKind::NEST : EntityKind::MORSEL;
}

// Scent that leads to the target of the activity
inline Scent target_scent(Activity activity) {
    return scent_of(target_kind(activity));
}

class Ant {
   public:
    // A newborn Ant is located in its nest, foraging, with full concentration
    Ant(EntityId id, const Location& nest_location, const AntsConf& params, const Dimension& dimension);
    Ant(EntityId id, const Location& location, const Location& nest_location, const AntsConf& params,
        const Dimension& dimension);

    // Runs the per-generation decision cycle: assess targets, enhance the
    // trail, suppress misleading pheromone and move. Throws InvariantViolation
    // if the neighborhood is missing or malformed.
    void react(Neighborhood* neighborhood, RNG& rng);

    // Drains the pheromone released during the last reaction (0 or 1 entity)
    std::vector<Entity> offspring();

    // Marks this Ant as the one that releases the pheromone on its tile
    void lead() { current_role = Role::LEADER; }

    EntityId id() const { return ant_id; }
    Location location() const { return position; }
    Location nest_location() const { return home; }
    Activity activity() const { return current_activity; }
    Role role() const { return current_role; }
    std::uint16_t concentration() const { return phero_concentration.value(); }
    const LocationAwareness& memory() const { return awareness; }
    std::size_t pending_offspring() const { return pending.size(); }

   private:
    void assess_location_for_targets(Neighborhood& neighborhood);
    void enhance_trail_pheromone(Neighborhood& neighborhood);
    void suppress_trail_pheromone(Neighborhood& neighborhood);
    std::uint64_t colony_bonus(std::uint64_t length) const;
    void move_towards(EntityKind kind, const Neighborhood& neighborhood, RNG& rng);

    bool find_ring_with_kind(EntityKind kind, const Neighborhood& neighborhood, std::size_t& index) const;
    bool find_ring_with_best_concentration_of(Scent scent, const Neighborhood& neighborhood, std::size_t& index) const;
    bool is_lost(const Neighborhood& neighborhood) const;
    void move_towards_nest(RNG& rng);
    void move_randomly(const Neighborhood& neighborhood, RNG& rng);

    void switch_activity();
    void release(const Entity& phero);

    EntityId ant_id;
    Location position;
    Location home;
    Activity current_activity;
    Role current_role;
    Concentration phero_concentration;
    LocationAwareness awareness;
    std::vector<Entity> pending;
    AntsConf params;
    Dimension dimension;
};
