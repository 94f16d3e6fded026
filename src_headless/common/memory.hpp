#pragma once

#include <cstddef>
#include <vector>
#include "types.hpp"

// Memory of Locations of fixed maximum space. Once full, each new Location
// takes the place of the oldest one.
class LocationAwareness {
   public:
    explicit LocationAwareness(std::size_t capacity)
        : capacity(capacity), next(0), locations(capacity), used(capacity, false) {}

    void insert(const Location& loc) {
        if (capacity == 0)
            return;
        locations[next] = loc;
        used[next] = true;
        next = (next + 1) % capacity;
    }

    bool contains(const Location& loc) const {
        for (std::size_t i = 0; i < capacity; i++) {
            if (used[i] && locations[i] == loc)
                return true;
        }
        return false;
    }

    // Forgets all the locations
    void clear() {
        std::fill(used.begin(), used.end(), false);
        next = 0;
    }

    std::size_t size() const { return static_cast<std::size_t>(std::count(used.begin(), used.end(), true)); }
    std::size_t max_size() const { return capacity; }

   private:
    std::size_t capacity;
    std::size_t next;
    std::vector<Location> locations;
    std::vector<bool> used;
};
