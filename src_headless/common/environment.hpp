#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "ant.hpp"
#include "conf.hpp"
#include "neighborhood.hpp"
#include "types.hpp"

// Toroidal grid of tiles where the simulation takes place. The environment
// owns every entity and every Ant and moves them forward one generation at a
// time.
class Environment {
   public:
    explicit Environment(const Dimension& dimension);

    EntityId unique_id() { return next_id++; }

    // Places the entity on its tile, assigning it an id if it has none.
    // Throws InvariantViolation on a second pheromone of one scent in a tile.
    EntityId insert(Entity entity);

    // Adds a newborn Ant located in the given nest
    EntityId spawn(const Location& nest_location, const AntsConf& params);

    // Moves to the next generation and returns its number:
    //   1. snapshot of the committed tiles (ring views read from it)
    //   2. every Ant reacts once, in id order
    //   3. pheromones age, dead pheromones and empty morsels are removed
    //   4. released pheromones are resolved, one per (tile, scent)
    //   5. invariants are verified
    std::uint64_t nextgen(RNG& rng);

    std::uint64_t generation() const { return gen; }
    const Dimension& dimension() const { return dim; }

    Tile& tile(const Location& loc) { return tiles[to_index(wrap(loc, dim), dim)]; }
    const Tile& tile(const Location& loc) const { return tiles[to_index(wrap(loc, dim), dim)]; }
    const std::vector<Tile>& all_tiles() const { return tiles; }

    std::vector<Ant>& ants() { return colony; }
    const std::vector<Ant>& ants() const { return colony; }

    Entity* find_first(EntityKind kind);
    const Entity* find_first(EntityKind kind) const;

    std::size_t count_markers(const Location& loc, Scent scent) const { return tile(loc).count_phero(scent); }
    std::size_t count_markers() const;
    std::size_t count_ants_at(const Location& loc) const;

    // Throws InvariantViolation if a tile holds two pheromones of one scent
    void check_invariants() const;

   private:
    // Pheromone released by the Ant at index `ant` of the colony
    struct Claim {
        std::size_t ant;
        Entity phero;
    };

    void take_snapshot();
    Neighborhood neighborhood_of(const Location& loc);
    void age_markers();
    void remove_dead_entities();
    void resolve_claims(std::vector<Claim>& claims);

    Dimension dim;
    std::vector<Tile> tiles;
    std::vector<Tile> snapshot;
    std::vector<Offset> ring_offsets;
    std::vector<Ant> colony;
    EntityId next_id;
    std::uint64_t gen;
};
