#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "opens3/storage/lock_table.hpp"

using namespace opens3::storage;

TEST_CASE("PathLockTable - Guards", "[lock]") {
    PathLockTable table;

    SECTION("Entry lives while the guard is held") {
        {
            auto guard = table.Acquire("/root/b/key");
            REQUIRE(guard.owns());
            REQUIRE(table.Size() == 1);
        }
        REQUIRE(table.Size() == 0);
    }

    SECTION("Different paths do not block each other") {
        auto first = table.Acquire("/root/b/one");
        auto second = table.Acquire("/root/b/two");
        REQUIRE(table.Size() == 2);
    }

    SECTION("Moving a guard transfers ownership") {
        auto guard = table.Acquire("/p");
        PathLockTable::Guard moved(std::move(guard));
        REQUIRE(moved.owns());
        REQUIRE_FALSE(guard.owns());
        REQUIRE(table.Size() == 1);
    }

    SECTION("Default guard owns nothing") {
        PathLockTable::Guard guard;
        REQUIRE_FALSE(guard.owns());
    }
}

TEST_CASE("PathLockTable - Serializes the same path", "[lock][concurrency]") {
    PathLockTable table;
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    int counter = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto guard = table.Acquire("/shared");
                int now = ++inside;
                int prev = maxInside.load();
                while (now > prev && !maxInside.compare_exchange_weak(prev, now)) {
                }
                ++counter;
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(counter == 8 * 200);
    REQUIRE(maxInside.load() == 1);
    REQUIRE(table.Size() == 0);
}
