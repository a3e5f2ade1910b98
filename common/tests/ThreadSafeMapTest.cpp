#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

struct Breaker {
    explicit Breaker(std::string n) : name(std::move(n)) {}

    std::string name;
    std::atomic<int> failures{0};
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Breaker> registry;
};

// ============================================================================
// Базовые операции
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    registry.insert("api", std::make_shared<Breaker>("api"));

    auto found = registry.find("api");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name, "api");
    EXPECT_EQ(registry.find("panel"), nullptr);
    EXPECT_TRUE(registry.contains("api"));
    EXPECT_FALSE(registry.contains("panel"));
}

TEST_F(ThreadSafeMapTest, GetOrCreate_CreatesOnce) {
    int created = 0;
    auto factory = [&created]() {
        ++created;
        return std::make_shared<Breaker>("cache-backend");
    };

    auto first = registry.getOrCreate("cache-backend", factory);
    auto second = registry.getOrCreate("cache-backend", factory);

    EXPECT_EQ(created, 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(ThreadSafeMapTest, Erase_FoundObjectStaysAlive) {
    auto breaker = registry.getOrCreate("api", [] { return std::make_shared<Breaker>("api"); });
    breaker->failures = 3;

    EXPECT_TRUE(registry.erase("api"));
    EXPECT_FALSE(registry.erase("api"));

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(breaker->failures.load(), 3);
}

TEST_F(ThreadSafeMapTest, Snapshot_CopiesAllEntries) {
    for (const char* name : {"api", "panel", "cache-backend"}) {
        registry.insert(name, std::make_shared<Breaker>(name));
    }

    auto entries = registry.snapshot();
    registry.erase("panel");

    ASSERT_EQ(entries.size(), 3u);
    std::vector<std::string> names;
    for (const auto& [key, value] : entries) {
        EXPECT_EQ(key, value->name);
        names.push_back(key);
    }
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"api", "cache-backend", "panel"}));
}

// ============================================================================
// Многопоточность
// ============================================================================

TEST_F(ThreadSafeMapTest, ConcurrentGetOrCreate_SingleInstancePerKey) {
    const int NUM_THREADS = 8;
    const int KEYS = 4;
    std::atomic<int> created{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([this, &created]() {
            for (int k = 0; k < KEYS; ++k) {
                auto key = "upstream-" + std::to_string(k);
                auto breaker = registry.getOrCreate(key, [&created, key]() {
                    ++created;
                    return std::make_shared<Breaker>(key);
                });
                ++breaker->failures;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(created.load(), KEYS);
    EXPECT_EQ(registry.size(), static_cast<size_t>(KEYS));
    for (const auto& [key, breaker] : registry.snapshot()) {
        EXPECT_EQ(breaker->failures.load(), NUM_THREADS) << key;
    }
}

TEST_F(ThreadSafeMapTest, ReadersDuringWrites) {
    std::atomic<bool> done{false};
    std::atomic<int> hits{0};

    std::thread writer([this, &done]() {
        for (int i = 0; i < 200; ++i) {
            auto key = "k" + std::to_string(i % 10);
            registry.insert(key, std::make_shared<Breaker>(key));
            if (i % 3 == 0) {
                registry.erase(key);
            }
        }
        done = true;
    });

    std::thread reader([this, &done, &hits]() {
        while (!done) {
            if (auto found = registry.find("k1")) {
                EXPECT_EQ(found->name, "k1");
                ++hits;
            }
            registry.snapshot();
        }
    });

    writer.join();
    reader.join();

    EXPECT_LE(registry.size(), 10u);
}
