#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>
#include <algorithm>

struct BalanceEntry {
    std::string accountId;
    long long cents;

    BalanceEntry(const std::string& id = "", long long c = 0) : accountId(id), cents(c) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, BalanceEntry> map;
};

// Базовые тесты
TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("acc-1", std::make_shared<BalanceEntry>("acc-1", 1500));

    auto found = map.find("acc-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->accountId, "acc-1");
    EXPECT_EQ(found->cents, 1500);
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("nonexistent"), nullptr);
    EXPECT_FALSE(map.contains("nonexistent"));
}

TEST_F(ThreadSafeMapTest, RemoveDeletesOnlyGivenKey) {
    map.insert("a", std::make_shared<BalanceEntry>("a", 1));
    map.insert("b", std::make_shared<BalanceEntry>("b", 2));

    EXPECT_TRUE(map.remove("a"));
    EXPECT_FALSE(map.remove("a"));
    EXPECT_FALSE(map.contains("a"));
    EXPECT_TRUE(map.contains("b"));
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, UpdateReplacesValueAndKeepsOldSnapshot) {
    map.insert("acc", std::make_shared<BalanceEntry>("acc", 100));
    auto before = map.find("acc");

    bool updated = map.update("acc", [](const BalanceEntry& e) {
        return BalanceEntry(e.accountId, e.cents + 50);
    });

    EXPECT_TRUE(updated);
    EXPECT_EQ(map.find("acc")->cents, 150);
    // Ранее выданный снимок не меняется
    EXPECT_EQ(before->cents, 100);
}

TEST_F(ThreadSafeMapTest, UpdateMissingKeyReturnsFalse) {
    bool updated = map.update("missing", [](const BalanceEntry& e) { return e; });
    EXPECT_FALSE(updated);
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, ValuesAppliesPredicate) {
    map.insert("a", std::make_shared<BalanceEntry>("a", -10));
    map.insert("b", std::make_shared<BalanceEntry>("b", 20));
    map.insert("c", std::make_shared<BalanceEntry>("c", 30));

    auto positive = map.values([](const BalanceEntry& e) { return e.cents > 0; });
    EXPECT_EQ(positive.size(), 2u);
    EXPECT_EQ(map.values().size(), 3u);
}

TEST_F(ThreadSafeMapTest, InsertAllIsVisibleAsWhole) {
    map.insertAll({
        {"debit", std::make_shared<BalanceEntry>("debit", -500)},
        {"credit", std::make_shared<BalanceEntry>("credit", 500)}
    });

    EXPECT_TRUE(map.contains("debit"));
    EXPECT_TRUE(map.contains("credit"));
}

// Многопоточные тесты
TEST_F(ThreadSafeMapTest, ConcurrentUpdatesAreNotLost) {
    map.insert("shared", std::make_shared<BalanceEntry>("shared", 0));

    const int THREADS = 8;
    const int INCREMENTS = 250;
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < INCREMENTS; ++i) {
                map.update("shared", [](const BalanceEntry& e) {
                    return BalanceEntry(e.accountId, e.cents + 1);
                });
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.find("shared")->cents, THREADS * INCREMENTS);
}

TEST_F(ThreadSafeMapTest, ConcurrentReadersAlwaysSeeValidObject) {
    const std::string key = "shared_key";
    map.insert(key, std::make_shared<BalanceEntry>(key, 0));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, &key, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(key, std::make_shared<BalanceEntry>(key, writer * 100 + i));
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &key, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(key);
                ASSERT_NE(found, nullptr);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 400);
}
