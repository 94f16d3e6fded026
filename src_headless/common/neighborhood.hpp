#pragma once

#include <cstddef>
#include <utility>
#include <vector>
#include "types.hpp"

// View of the surroundings of an Ant: its own tile (read/write) and the ring
// of tiles at its sensing radius (read-only, taken from the committed state of
// the previous generation).
class Neighborhood {
   public:
    Neighborhood(Tile& center, std::vector<const Tile*> ring, std::vector<Offset> offsets)
        : center_tile(&center), ring_tiles(std::move(ring)), ring_offsets(std::move(offsets)) {
        if (ring_tiles.size() != ring_offsets.size())
            throw InvariantViolation("neighborhood ring and offsets differ in size");
    }

    Tile& center() { return *center_tile; }
    const Tile& center() const { return *center_tile; }

    std::size_t ring_size() const { return ring_tiles.size(); }
    const Tile& ring(std::size_t i) const { return *ring_tiles[i]; }
    const Offset& offset(std::size_t i) const { return ring_offsets[i]; }

    // True if an entity of the given kind is in the center or in the ring
    bool contains_kind(EntityKind kind) const {
        if (center_tile->contains(kind))
            return true;
        for (const Tile* tile : ring_tiles) {
            if (tile->contains(kind))
                return true;
        }
        return false;
    }

   private:
    Tile* center_tile;
    std::vector<const Tile*> ring_tiles;
    std::vector<Offset> ring_offsets;
};
