// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <algorithm>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace draftops::util;

// ============================================================================
// ThreadSafeMap Tests
// ============================================================================

TEST_CASE("ThreadSafeMap: Basic operations", "[util][threadsafe][map]") {
    ThreadSafeMap<std::string, std::string> map;

    SECTION("Insert and Read") {
        REQUIRE(map.Insert("4046", "QB"));
        std::string result;
        REQUIRE(map.Read("4046", [&](const std::string& value) { result = value; }));
        REQUIRE(result == "QB");
    }

    SECTION("Insert duplicate returns false and updates") {
        REQUIRE(map.Insert("4046", "BENCH"));
        REQUIRE(!map.Insert("4046", "QB"));  // Returns false (updated, not inserted)
        REQUIRE(map.Get("4046") == std::optional<std::string>("QB"));
    }

    SECTION("Read and Get non-existent key") {
        bool called = false;
        REQUIRE(!map.Read("missing", [&](const std::string&) { called = true; }));
        REQUIRE(!called);
        REQUIRE(!map.Get("missing").has_value());
    }

    SECTION("Contains, Size and Clear") {
        map.Insert("a", "RB");
        map.Insert("b", "WR");
        REQUIRE(map.Contains("a"));
        REQUIRE(!map.Contains("c"));
        REQUIRE(map.Size() == 2);

        map.Clear();
        REQUIRE(map.Size() == 0);
        REQUIRE(!map.Contains("a"));
    }

    SECTION("GetAll returns a detached copy") {
        map.Insert("a", "RB");
        map.Insert("b", "WR");
        auto all = map.GetAll();
        std::sort(all.begin(), all.end());
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].first == "a");
        REQUIRE(all[1].second == "WR");

        map.Clear();
        REQUIRE(all.size() == 2);
    }
}

TEST_CASE("ThreadSafeMap: Complex value types", "[util][threadsafe][map]") {
    struct ComplexValue {
        int id;
        std::string name;
        std::vector<int> data;

        bool operator==(const ComplexValue& other) const {
            return id == other.id && name == other.name && data == other.data;
        }
    };

    ThreadSafeMap<int, ComplexValue> map;

    ComplexValue val1{1, "test", {1, 2, 3}};
    map.Insert(1, val1);

    ComplexValue retrieved;
    REQUIRE(map.Read(1, [&](const ComplexValue& value) { retrieved = value; }));
    REQUIRE(retrieved == val1);

    // Read() can extract a single field without copying the value
    size_t data_size = 0;
    REQUIRE(map.Read(1, [&](const ComplexValue& value) { data_size = value.data.size(); }));
    REQUIRE(data_size == 3);
}

TEST_CASE("ThreadSafeMap: Concurrent access", "[util][threadsafe][map][concurrent]") {
    ThreadSafeMap<int, int> map;
    constexpr int num_threads = 10;
    constexpr int ops_per_thread = 100;

    SECTION("Concurrent inserts") {
        std::vector<std::thread> threads;

        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&map, t]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    int key = t * ops_per_thread + i;
                    map.Insert(key, key * 10);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(map.Size() == num_threads * ops_per_thread);
        REQUIRE(map.Get(50) == std::optional<int>(500));
        REQUIRE(map.Get(999) == std::optional<int>(9990));
    }

    SECTION("Concurrent reads and writes") {
        for (int i = 0; i < 100; ++i) {
            map.Insert(i, i);
        }

        std::atomic<int> reads{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < num_threads / 2; ++t) {
            threads.emplace_back([&map, &reads]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    if (map.Read(i % 100, [](int) {})) {
                        reads++;
                    }
                }
            });
        }

        for (int t = 0; t < num_threads / 2; ++t) {
            threads.emplace_back([&map]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    map.Insert(i % 100, i);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        // Keys are only overwritten, never removed
        REQUIRE(reads == (num_threads / 2) * ops_per_thread);
        REQUIRE(map.Size() == 100);
    }
}

// ============================================================================
// ThreadSafeSet Tests
// ============================================================================

TEST_CASE("ThreadSafeSet: Basic operations", "[util][threadsafe][set]") {
    ThreadSafeSet<std::string> set;

    SECTION("Insert and Contains") {
        REQUIRE(set.Insert("p1"));
        REQUIRE(set.Contains("p1"));
        REQUIRE(!set.Contains("p2"));
    }

    SECTION("Insert duplicate") {
        REQUIRE(set.Insert("p1"));
        REQUIRE(!set.Insert("p1"));
        REQUIRE(set.Size() == 1);
    }

    SECTION("Erase") {
        set.Insert("p1");
        REQUIRE(set.Erase("p1"));
        REQUIRE(!set.Erase("p1"));
        REQUIRE(set.Size() == 0);
    }

    SECTION("Clear") {
        set.Insert("p1");
        set.Insert("p2");
        set.Clear();
        REQUIRE(set.Size() == 0);
    }
}

TEST_CASE("ThreadSafeSet: Concurrent access", "[util][threadsafe][set][concurrent]") {
    ThreadSafeSet<int> set;
    constexpr int num_threads = 8;
    constexpr int ops_per_thread = 200;

    SECTION("Only one thread wins each insert") {
        std::atomic<int> inserted{0};
        std::vector<std::thread> threads;

        // Every thread races on the same keys
        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&set, &inserted]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    if (set.Insert(i)) {
                        inserted++;
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(inserted == ops_per_thread);
        REQUIRE(set.Size() == ops_per_thread);
    }

    SECTION("Concurrent erases") {
        for (int i = 0; i < num_threads * ops_per_thread; ++i) {
            set.Insert(i);
        }

        std::atomic<int> erase_count{0};
        std::vector<std::thread> threads;

        for (int t = 0; t < num_threads; ++t) {
            threads.emplace_back([&set, &erase_count, t]() {
                for (int i = 0; i < ops_per_thread; ++i) {
                    if (set.Erase(t * ops_per_thread + i)) {
                        erase_count++;
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(erase_count == num_threads * ops_per_thread);
        REQUIRE(set.Size() == 0);
    }
}
