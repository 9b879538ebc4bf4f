// forge_core IdGenerator and change stamp tests

#include <catch2/catch_test_macros.hpp>
#include <forge/core/id.hpp>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace forge_core;

// =============================================================================
// IdGenerator Tests
// =============================================================================

TEST_CASE("IdGenerator never hands out zero", "[core][id]") {
    IdGenerator gen;
    REQUIRE(gen.current() == 1);
    REQUIRE(gen.next() == 1);
    REQUIRE(gen.next() == 2);
    REQUIRE(gen.current() == 3);
}

TEST_CASE("IdGenerator is unique across threads", "[core][id]") {
    IdGenerator gen;
    constexpr int per_thread = 1000;
    std::vector<std::vector<std::uint64_t>> results(4);

    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&gen, &results, t]() {
            for (int i = 0; i < per_thread; ++i) {
                results[t].push_back(gen.next());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::unordered_set<std::uint64_t> seen;
    for (const auto& ids : results) {
        for (std::uint64_t id : ids) {
            REQUIRE(id != 0);
            seen.insert(id);
        }
    }
    REQUIRE(seen.size() == results.size() * per_thread);
}

// =============================================================================
// Change Stamp Tests
// =============================================================================

TEST_CASE("Change stamps strictly increase", "[core][id]") {
    std::uint64_t previous = next_change_stamp();
    for (int i = 0; i < 100; ++i) {
        std::uint64_t stamp = next_change_stamp();
        REQUIRE(stamp > previous);
        previous = stamp;
    }
}
