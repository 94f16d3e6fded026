#include <gtest/gtest.h>

#include "memory.hpp"

TEST(LocationAwarenessTest, OverwritesOldestLocation) {
    LocationAwareness memory(3);
    const Location a(0, 0), b(1, 0), c(2, 0), d(3, 0);

    memory.insert(a);
    memory.insert(b);
    memory.insert(c);
    memory.insert(d);

    EXPECT_FALSE(memory.contains(a));
    EXPECT_TRUE(memory.contains(b));
    EXPECT_TRUE(memory.contains(c));
    EXPECT_TRUE(memory.contains(d));
    EXPECT_EQ(memory.size(), 3u);
}

TEST(LocationAwarenessTest, KeepsExactlyTheLastCapacityLocations) {
    const std::size_t capacity = 7;
    LocationAwareness memory(capacity);
    for (int i = 0; i <= static_cast<int>(capacity); i++)
        memory.insert(Location(i, i));

    EXPECT_FALSE(memory.contains(Location(0, 0)));
    for (int i = 1; i <= static_cast<int>(capacity); i++)
        EXPECT_TRUE(memory.contains(Location(i, i))) << "location " << i;
}

TEST(LocationAwarenessTest, ZeroCapacityStoresNothing) {
    LocationAwareness memory(0);
    memory.insert(Location(4, 2));
    memory.insert(Location(0, 0));

    EXPECT_FALSE(memory.contains(Location(4, 2)));
    EXPECT_FALSE(memory.contains(Location(0, 0)));
    EXPECT_EQ(memory.size(), 0u);
}

TEST(LocationAwarenessTest, EmptyMemoryDoesNotContainDefaultLocation) {
    LocationAwareness memory(4);
    EXPECT_FALSE(memory.contains(Location()));
}

TEST(LocationAwarenessTest, ClearForgetsEverything) {
    LocationAwareness memory(2);
    memory.insert(Location(1, 1));
    memory.insert(Location(2, 2));
    memory.clear();

    EXPECT_FALSE(memory.contains(Location(1, 1)));
    EXPECT_FALSE(memory.contains(Location(2, 2)));
    EXPECT_EQ(memory.size(), 0u);

    memory.insert(Location(3, 3));
    EXPECT_TRUE(memory.contains(Location(3, 3)));
}
