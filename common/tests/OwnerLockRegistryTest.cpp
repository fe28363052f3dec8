#include <gtest/gtest.h>
#include <OwnerLockRegistry.hpp>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

TEST(OwnerLockRegistryTest, ExclusiveLockSerializesWritersOfSameOwner) {
    OwnerLockRegistry registry;
    std::atomic<int> inside(0);
    std::atomic<int> maxInside(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                auto lock = registry.lockExclusive("family-1");
                int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(50));
                --inside;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
}

TEST(OwnerLockRegistryTest, SharedLocksCoexist) {
    OwnerLockRegistry registry;

    auto first = registry.lockShared("family-1");
    std::atomic<bool> acquired(false);
    std::thread reader([&]() {
        auto second = registry.lockShared("family-1");
        acquired = true;
    });
    reader.join();

    EXPECT_TRUE(acquired.load());
}

TEST(OwnerLockRegistryTest, OwnersDoNotBlockEachOther) {
    OwnerLockRegistry registry;

    auto lockA = registry.lockExclusive("family-a");
    std::atomic<bool> acquired(false);
    std::thread other([&]() {
        auto lockB = registry.lockExclusive("family-b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(registry.size(), 2u);
}
