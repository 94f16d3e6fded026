#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <variant>

#include "types.hpp"

TEST(ConcentrationTest, DecreaseSaturatesAtZero) {
    Concentration concentration(10);
    EXPECT_EQ(concentration.decrease_by(15), 0);
    EXPECT_EQ(concentration.value(), 0);
}

TEST(ConcentrationTest, RepeatedDecreaseNeverUnderflows) {
    Concentration concentration(200);
    for (int i = 0; i < 500; i++) {
        concentration.decrease_by(3);
        EXPECT_LE(concentration.value(), 200);
    }
    EXPECT_EQ(concentration.value(), 0);
    EXPECT_EQ(concentration.decrease_by(std::numeric_limits<std::uint16_t>::max()), 0);
}

TEST(LifespanTest, ShortenStopsAtZero) {
    Lifespan lifespan(1);
    EXPECT_TRUE(lifespan.is_alive());
    lifespan.shorten();
    EXPECT_FALSE(lifespan.is_alive());
    lifespan.shorten();
    EXPECT_EQ(lifespan.length(), 0u);
}

TEST(LifespanTest, LengthenSaturates) {
    Lifespan lifespan(std::numeric_limits<std::uint64_t>::max() - 1);
    lifespan.lengthen_by(10);
    EXPECT_EQ(lifespan.length(), std::numeric_limits<std::uint64_t>::max());
}

TEST(LifespanTest, ClearKillsIt) {
    Lifespan lifespan(42);
    lifespan.clear();
    EXPECT_FALSE(lifespan.is_alive());
}

TEST(GeometryTest, TranslateWrapsAroundTheTorus) {
    const Dimension dim(10, 8);
    EXPECT_EQ(translate(Location(0, 0), Offset(-1, -1), dim), Location(9, 7));
    EXPECT_EQ(translate(Location(9, 7), Offset(1, 1), dim), Location(0, 0));
    EXPECT_EQ(wrap(Location(-21, 17), dim), Location(9, 1));
}

TEST(GeometryTest, TranslateTowardsMovesASingleStep) {
    const Dimension dim(30, 30);
    EXPECT_EQ(translate_towards(Location(5, 5), Location(20, 1), dim), Location(6, 4));
    EXPECT_EQ(translate_towards(Location(5, 5), Location(5, 9), dim), Location(5, 6));
    EXPECT_EQ(translate_towards(Location(5, 5), Location(5, 5), dim), Location(5, 5));
}

TEST(GeometryTest, ManhattanDistance) {
    EXPECT_EQ(manhattan_distance(Location(1, 2), Location(4, 0)), 5);
    EXPECT_EQ(manhattan_distance(Location(3, 3), Location(3, 3)), 0);
}

TEST(GeometryTest, BorderHoldsTheRingOfOffsets) {
    ASSERT_EQ(border(0).size(), 1u);
    EXPECT_EQ(border(0)[0].x, 0);
    EXPECT_EQ(border(0)[0].y, 0);

    // row by row, top left first
    const int dx[] = {-1, 0, 1, -1, 1, -1, 0, 1};
    const int dy[] = {-1, -1, -1, 0, 0, 1, 1, 1};
    const std::vector<Offset> ring = border(1);
    ASSERT_EQ(ring.size(), 8u);
    for (std::size_t i = 0; i < ring.size(); i++) {
        EXPECT_EQ(ring[i].x, dx[i]);
        EXPECT_EQ(ring[i].y, dy[i]);
    }

    EXPECT_EQ(border(2).size(), 16u);
}

TEST(TileTest, FindsPheromonesByScent) {
    Tile tile;
    tile.location = Location(2, 3);
    tile.entities.push_back(Entity::phero(Scent::FOOD, tile.location, 12));
    tile.entities.push_back(Entity::morsel(tile.location, 4));

    EXPECT_EQ(tile.phero_strength(Scent::FOOD), 12u);
    EXPECT_EQ(tile.phero_strength(Scent::COLONY), 0u);
    EXPECT_EQ(tile.count_phero(Scent::FOOD), 1u);
    EXPECT_TRUE(tile.contains(EntityKind::MORSEL));
    EXPECT_FALSE(tile.contains(EntityKind::NEST));
}

TEST(EntityTest, EachKindCarriesItsOwnPayload) {
    const Entity nest = Entity::nest(Location(1, 1));
    const Entity morsel = Entity::morsel(Location(1, 1), 3);
    const Entity phero = Entity::phero(Scent::FOOD, Location(1, 1), 9);

    EXPECT_EQ(nest.kind(), EntityKind::NEST);
    EXPECT_EQ(morsel.kind(), EntityKind::MORSEL);
    EXPECT_EQ(phero.kind(), EntityKind::PHERO);

    EXPECT_EQ(std::get_if<NestState>(&morsel.state), nullptr);
    EXPECT_EQ(std::get_if<MorselState>(&phero.state), nullptr);
    EXPECT_EQ(std::get<MorselState>(morsel.state).supply.length(), 3u);
    EXPECT_EQ(std::get<PheroState>(phero.state).strength.length(), 9u);
    EXPECT_TRUE(phero.is_phero(Scent::FOOD));
    EXPECT_FALSE(phero.is_phero(Scent::COLONY));
    EXPECT_FALSE(morsel.is_phero(Scent::FOOD));
}

TEST(EntityTest, NestStorageSaturates) {
    NestState nest;
    nest.store();
    nest.store();
    EXPECT_EQ(nest.storage, 2u);

    nest.storage = std::numeric_limits<std::uint64_t>::max();
    nest.store();
    EXPECT_EQ(nest.storage, std::numeric_limits<std::uint64_t>::max());
}

TEST(EntityTest, NestNeverDies) {
    EXPECT_TRUE(Entity::nest(Location(0, 0)).is_alive());
    EXPECT_FALSE(Entity::morsel(Location(0, 0), 0).is_alive());
    EXPECT_FALSE(Entity::phero(Scent::COLONY, Location(0, 0), 0).is_alive());
}

TEST(EntityTest, ScentOfTargets) {
    EXPECT_EQ(scent_of(EntityKind::NEST), Scent::COLONY);
    EXPECT_EQ(scent_of(EntityKind::MORSEL), Scent::FOOD);
    EXPECT_THROW(scent_of(EntityKind::PHERO), InvariantViolation);
}
