#include "ant.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

Ant::Ant(EntityId id, const Location& nest_location, const AntsConf& params, const Dimension& dimension)
    : Ant(id, nest_location, nest_location, params, dimension) {}

Ant::Ant(EntityId id, const Location& location, const Location& nest_location, const AntsConf& params,
         const Dimension& dimension)
    : ant_id(id),
      position(location),
      home(nest_location),
      current_activity(Activity::FORAGING),
      current_role(Role::FOLLOWER),
      phero_concentration(params.max_phero_concentration),
      awareness(params.memory_span),
      params(params),
      dimension(dimension) {}

void Ant::react(Neighborhood* neighborhood, RNG& rng) {
    if (neighborhood == nullptr)
        throw InvariantViolation("ant " + std::to_string(ant_id) + " reacted without a neighborhood");
    if (neighborhood->center().location != position)
        throw InvariantViolation("ant " + std::to_string(ant_id) + " received the neighborhood of another tile");

    // all the Ants are followers at each step, until decided otherwise
    current_role = Role::FOLLOWER;
    awareness.insert(position);

    assess_location_for_targets(*neighborhood);
    enhance_trail_pheromone(*neighborhood);
    suppress_trail_pheromone(*neighborhood);
    move_towards(target_kind(current_activity), *neighborhood, rng);
}

std::vector<Entity> Ant::offspring() {
    if (pending.size() > 1)
        throw InvariantViolation("ant " + std::to_string(ant_id) + " released more than one pheromone");
    std::vector<Entity> drained;
    drained.swap(pending);
    return drained;
}

void Ant::assess_location_for_targets(Neighborhood& neighborhood) {
    Tile& center = neighborhood.center();

    NestState* nest = center.find_state<NestState>();
    if (nest) {
        // drop the food into the nest
        if (current_activity == Activity::CARRYING) {
            nest->store();
            switch_activity();
        }
        phero_concentration = Concentration(params.max_phero_concentration);
    }

    MorselState* morsel = center.find_state<MorselState>();
    if (morsel) {
        // other Ants in this tile may have emptied the morsel already
        if (current_activity == Activity::FORAGING && morsel->supply.is_alive()) {
            morsel->supply.shorten();
            switch_activity();
        }
        phero_concentration = Concentration(params.max_phero_concentration);
    }
}

void Ant::enhance_trail_pheromone(Neighborhood& neighborhood) {
    phero_concentration.decrease_by(params.phero_decrease);

    const Scent scent = scent_left_by(current_activity);
    Tile& center = neighborhood.center();
    if (center.count_phero(scent) > 1)
        throw InvariantViolation("more than one pheromone with the same scent in a single tile");

    PheroState* phero = center.find_phero(scent);
    if (phero) {
        // the trail is already marked here: strengthen it instead of
        // releasing a new entity
        if (scent == Scent::COLONY)
            phero->strength.lengthen_by(colony_bonus(phero->strength.length()));
        phero->strength.lengthen_by(phero_concentration.value());
    } else if (phero_concentration.value() > 0) {
        // the environment keeps only the claim of this tile's leader
        release(Entity::phero(scent, position, phero_concentration.value()));
    }
}

// floor(length * ratio), saturated to the range of a lifespan
std::uint64_t Ant::colony_bonus(std::uint64_t length) const {
    const double bonus = std::floor(static_cast<double>(length) * params.phero_increase_ratio);
    if (!(bonus >= 0.0))
        return 0;
    if (bonus >= 18446744073709551616.0)  // 2^64
        return std::numeric_limits<std::uint64_t>::max();
    return static_cast<std::uint64_t>(bonus);
}

void Ant::suppress_trail_pheromone(Neighborhood& neighborhood) {
    const EntityKind target = target_kind(current_activity);
    if (neighborhood.contains_kind(target))
        return;

    const Scent scent = target_scent(current_activity);
    std::uint64_t neighbor_strength = 0;
    for (std::size_t i = 0; i < neighborhood.ring_size(); i++)
        neighbor_strength = std::max(neighbor_strength, neighborhood.ring(i).phero_strength(scent));

    Tile& center = neighborhood.center();
    if (center.count_phero(scent) > 1)
        throw InvariantViolation("more than one pheromone with the same scent in a single tile");

    // the strongest pheromone of a trail far from its target is misleading
    PheroState* phero = center.find_phero(scent);
    if (phero && phero->strength.length() > neighbor_strength)
        phero->strength.clear();
}

void Ant::move_towards(EntityKind kind, const Neighborhood& neighborhood, RNG& rng) {
    std::size_t index = 0;
    if (find_ring_with_kind(kind, neighborhood, index) ||
        find_ring_with_best_concentration_of(scent_of(kind), neighborhood, index)) {
        position = translate(position, neighborhood.offset(index), dimension);
    } else if (current_activity == Activity::CARRYING || is_lost(neighborhood)) {
        move_towards_nest(rng);
    } else {
        move_randomly(neighborhood, rng);
    }
}

bool Ant::find_ring_with_kind(EntityKind kind, const Neighborhood& neighborhood, std::size_t& index) const {
    for (std::size_t i = 0; i < neighborhood.ring_size(); i++) {
        if (neighborhood.ring(i).contains(kind)) {
            index = i;
            return true;
        }
    }
    return false;
}

// Tile of the ring with the strongest pheromone of the given scent, skipping
// the tiles the Ant remembers to avoid getting stuck in local maxima. Ties go
// to the last tile in ring order.
bool Ant::find_ring_with_best_concentration_of(Scent scent, const Neighborhood& neighborhood,
                                               std::size_t& index) const {
    bool found = false;
    std::uint64_t best = 0;
    for (std::size_t i = 0; i < neighborhood.ring_size(); i++) {
        const Tile& tile = neighborhood.ring(i);
        if (awareness.contains(tile.location))
            continue;
        const PheroState* phero = tile.find_phero(scent);
        if (!phero)
            continue;
        const std::uint64_t strength = phero->strength.length();
        if (!found || strength >= best) {
            best = strength;
            index = i;
            found = true;
        }
    }
    return found;
}

bool Ant::is_lost(const Neighborhood& neighborhood) const {
    return phero_concentration.value() == 0 && !neighborhood.center().contains(EntityKind::PHERO);
}

// The accuracy of the heading grows as the Ant gets closer to the nest
void Ant::move_towards_nest(RNG& rng) {
    const int dist = manhattan_distance(position, home);
    const int radius = dist > 0 ? rng.random_int(0, dist - 1) : 0;
    const std::vector<Offset> offsets = border(radius);
    const Offset& offset = offsets[static_cast<std::size_t>(rng.random_int(0, static_cast<int>(offsets.size()) - 1))];

    const Location dest = translate(home, offset, dimension);
    position = translate_towards(position, dest, dimension);
}

void Ant::move_randomly(const Neighborhood& neighborhood, RNG& rng) {
    std::vector<std::size_t> order(neighborhood.ring_size());
    std::iota(order.begin(), order.end(), 0);
    rng.shuffle(order);

    for (std::size_t i : order) {
        if (!awareness.contains(neighborhood.ring(i).location)) {
            position = translate(position, neighborhood.offset(i), dimension);
            return;
        }
    }

    // every surrounding tile is remembered
    position = translate(position, Offset(rng.random_int(-1, 1), rng.random_int(-1, 1)), dimension);
}

void Ant::switch_activity() {
    current_activity = current_activity == Activity::FORAGING ? Activity::CARRYING : Activity::FORAGING;
    awareness.clear();
}

void Ant::release(const Entity& phero) {
    if (!pending.empty())
        throw InvariantViolation("ant " + std::to_string(ant_id) + " released more than one pheromone");
    pending.push_back(phero);
}
