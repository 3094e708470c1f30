// tests/test_inmemorystorage.cpp
#include <chrono> // For std::chrono::seconds
#include <string>
#include <thread> // For std::this_thread::sleep_for
#include <vector>

#include "gtest/gtest.h"

#include "../src/storage/InMemoryRateLimitStorage.hpp"

TEST(InMemoryRateLimitStorageTest, SetAndGet) {
    InMemoryRateLimitStorage storage;
    std::string key = "rl:/api:anonymous:10.0.0.1";
    std::string value = R"({"tokens":4.0,"last":100.0})";

    EXPECT_TRUE(storage.set(key, value, 60));
    auto retrievedData = storage.get(key);
    ASSERT_TRUE(retrievedData.has_value());
    EXPECT_EQ(*retrievedData, value);
}

TEST(InMemoryRateLimitStorageTest, GetNonExistent) {
    InMemoryRateLimitStorage storage;
    auto retrievedData = storage.get("rl:/missing:anonymous:anonymous");
    EXPECT_FALSE(retrievedData.has_value());
}

TEST(InMemoryRateLimitStorageTest, GetExpired) {
    InMemoryRateLimitStorage storage;
    std::string key = "rl:/api:anonymous:expired";

    EXPECT_TRUE(storage.set(key, "[100.0]", 1)); // 1 second TTL

    // Wait for longer than the TTL
    std::this_thread::sleep_for(std::chrono::seconds(2));

    EXPECT_FALSE(storage.get(key).has_value());
    EXPECT_EQ(storage.size(), 0u);
}

TEST(InMemoryRateLimitStorageTest, GetNotExpired) {
    InMemoryRateLimitStorage storage;
    std::string key = "rl:/api:authenticated:u1";

    EXPECT_TRUE(storage.set(key, "[100.0]", 3600)); // 1 hour TTL
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto retrievedData = storage.get(key);
    ASSERT_TRUE(retrievedData.has_value());
    EXPECT_EQ(*retrievedData, "[100.0]");
}

TEST(InMemoryRateLimitStorageTest, OverwriteEntry) {
    InMemoryRateLimitStorage storage;
    std::string key = "rl:/api:anonymous:anonymous";

    EXPECT_TRUE(storage.set(key, "[1.0]", 60));
    EXPECT_TRUE(storage.set(key, "[1.0,2.0]", 60)); // Overwrite
    auto retrieved = storage.get(key);
    ASSERT_TRUE(retrieved.has_value());
    EXPECT_EQ(*retrieved, "[1.0,2.0]");
    EXPECT_EQ(storage.size(), 1u);
}

TEST(InMemoryRateLimitStorageTest, EvictsLeastRecentlyUsedAtCapacity) {
    InMemoryRateLimitStorage storage(2);
    EXPECT_TRUE(storage.set("a", "1", 60));
    EXPECT_TRUE(storage.set("b", "2", 60));

    // Touch "a" so "b" becomes the eviction candidate.
    EXPECT_TRUE(storage.get("a").has_value());
    EXPECT_TRUE(storage.set("c", "3", 60));

    EXPECT_EQ(storage.size(), 2u);
    EXPECT_TRUE(storage.get("a").has_value());
    EXPECT_FALSE(storage.get("b").has_value());
    EXPECT_TRUE(storage.get("c").has_value());
}

TEST(InMemoryRateLimitStorageTest, ConcurrentWritersOnDistinctKeys) {
    InMemoryRateLimitStorage storage;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&storage, t]() {
            for (int i = 0; i < 250; ++i) {
                storage.set("key:" + std::to_string(t) + ":" + std::to_string(i), "v", 60);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(storage.size(), 1000u);
    EXPECT_TRUE(storage.get("key:3:249").has_value());
}
