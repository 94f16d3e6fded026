#include "environment.hpp"

#include <omp.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <variant>

Environment::Environment(const Dimension& dimension)
    : dim(dimension), ring_offsets(border(1)), next_id(1), gen(0) {
    if (dim.x <= 0 || dim.y <= 0)
        throw InvariantViolation("environment dimension must be positive");

    tiles.resize(static_cast<std::size_t>(dim.len()));
    for (int y = 0; y < dim.y; y++) {
        for (int x = 0; x < dim.x; x++) {
            Location loc(x, y);
            tiles[to_index(loc, dim)].location = loc;
        }
    }
    snapshot = tiles;
}

EntityId Environment::insert(Entity entity) {
    entity.location = wrap(entity.location, dim);
    if (entity.id == 0)
        entity.id = unique_id();

    Tile& target = tile(entity.location);
    const PheroState* phero = std::get_if<PheroState>(&entity.state);
    if (phero && target.find_phero(phero->scent))
        throw InvariantViolation("tile (" + std::to_string(entity.location.x) + ", " +
                                 std::to_string(entity.location.y) + ") already holds a pheromone of that scent");

    target.entities.push_back(entity);
    return entity.id;
}

EntityId Environment::spawn(const Location& nest_location, const AntsConf& params) {
    const EntityId id = unique_id();
    colony.emplace_back(id, wrap(nest_location, dim), params, dim);
    return id;
}

std::uint64_t Environment::nextgen(RNG& rng) {
    take_snapshot();

    // Sequential update: Ants sharing a tile see each other's writes to it
    for (Ant& ant : colony) {
        Neighborhood neighborhood = neighborhood_of(ant.location());
        ant.react(&neighborhood, rng);
    }

    age_markers();
    remove_dead_entities();

    std::vector<Claim> claims;
    for (std::size_t i = 0; i < colony.size(); i++) {
        for (const Entity& phero : colony[i].offspring())
            claims.push_back({i, phero});
    }
    resolve_claims(claims);

    gen++;
    check_invariants();
    return gen;
}

Entity* Environment::find_first(EntityKind kind) {
    for (Tile& t : tiles) {
        Entity* entity = t.find(kind);
        if (entity)
            return entity;
    }
    return nullptr;
}

const Entity* Environment::find_first(EntityKind kind) const {
    for (const Tile& t : tiles) {
        const Entity* entity = t.find(kind);
        if (entity)
            return entity;
    }
    return nullptr;
}

std::size_t Environment::count_markers() const {
    const int n = static_cast<int>(tiles.size());
    long total = 0;

#pragma omp parallel for schedule(static) reduction(+ : total)
    for (int i = 0; i < n; i++) {
        total += static_cast<long>(tiles[i].count_phero(Scent::COLONY) + tiles[i].count_phero(Scent::FOOD));
    }
    return static_cast<std::size_t>(total);
}

std::size_t Environment::count_ants_at(const Location& loc) const {
    const Location wrapped = wrap(loc, dim);
    return static_cast<std::size_t>(
        std::count_if(colony.begin(), colony.end(), [&wrapped](const Ant& ant) { return ant.location() == wrapped; }));
}

void Environment::check_invariants() const {
    for (const Tile& t : tiles) {
        if (t.count_phero(Scent::COLONY) > 1 || t.count_phero(Scent::FOOD) > 1) {
            throw InvariantViolation("tile (" + std::to_string(t.location.x) + ", " + std::to_string(t.location.y) +
                                     ") holds more than one pheromone of the same scent");
        }
    }
}

void Environment::take_snapshot() {
    const int n = static_cast<int>(tiles.size());

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; i++) {
        snapshot[i] = tiles[i];
    }
}

Neighborhood Environment::neighborhood_of(const Location& loc) {
    std::vector<const Tile*> ring;
    ring.reserve(ring_offsets.size());
    for (const Offset& offset : ring_offsets) {
        ring.push_back(&snapshot[to_index(translate(loc, offset, dim), dim)]);
    }
    return Neighborhood(tile(loc), std::move(ring), ring_offsets);
}

// Every pheromone loses a single unit of strength per generation
void Environment::age_markers() {
    const int n = static_cast<int>(tiles.size());

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; i++) {
        for (Entity& e : tiles[i].entities) {
            if (PheroState* phero = std::get_if<PheroState>(&e.state))
                phero->strength.shorten();
        }
    }
}

void Environment::remove_dead_entities() {
    const int n = static_cast<int>(tiles.size());

#pragma omp parallel for schedule(static)
    for (int i = 0; i < n; i++) {
        std::vector<Entity>& entities = tiles[i].entities;
        entities.erase(std::remove_if(entities.begin(), entities.end(),
                                      [](const Entity& e) { return !e.is_alive(); }),
                       entities.end());
    }
}

// Among the Ants that released a pheromone of the same scent on the same tile
// the one with the lowest id becomes the leader and only its pheromone is kept
void Environment::resolve_claims(std::vector<Claim>& claims) {
    std::map<std::pair<int, int>, std::size_t> leaders;  // (tile, scent) -> claim
    for (std::size_t c = 0; c < claims.size(); c++) {
        const Entity& phero = claims[c].phero;
        const PheroState* state = std::get_if<PheroState>(&phero.state);
        if (!state)
            throw InvariantViolation("ant " + std::to_string(colony[claims[c].ant].id()) +
                                     " released an entity that is not a pheromone");
        const std::pair<int, int> key(to_index(wrap(phero.location, dim), dim), static_cast<int>(state->scent));
        auto it = leaders.find(key);
        if (it == leaders.end()) {
            leaders.insert(std::make_pair(key, c));
        } else if (colony[claims[c].ant].id() < colony[claims[it->second].ant].id()) {
            it->second = c;
        }
    }

    for (const auto& leader : leaders) {
        Claim& claim = claims[leader.second];
        colony[claim.ant].lead();
        insert(claim.phero);
    }
}
