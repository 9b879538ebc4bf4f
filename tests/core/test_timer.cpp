// forge_core TimerQueue tests

#include <catch2/catch_test_macros.hpp>
#include <forge/core/timer.hpp>
#include <string>
#include <vector>

using namespace forge_core;
using namespace std::chrono_literals;

TEST_CASE("TimerQueue fires callbacks at their deadline", "[core][timer]") {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(100ms, [&fired]() { ++fired; });

    REQUIRE(timers.advance(99ms) == 0);
    REQUIRE(fired == 0);
    REQUIRE(timers.advance(1ms) == 1);
    REQUIRE(fired == 1);
    REQUIRE(timers.now() == 100ms);
    REQUIRE(timers.pending_count() == 0);
}

TEST_CASE("TimerQueue orders by deadline then by schedule order", "[core][timer]") {
    TimerQueue timers;
    std::vector<std::string> order;
    timers.schedule(20ms, [&order]() { order.push_back("late"); });
    timers.schedule(10ms, [&order]() { order.push_back("first"); });
    timers.schedule(10ms, [&order]() { order.push_back("second"); });

    timers.advance(50ms);
    REQUIRE(order == std::vector<std::string>{"first", "second", "late"});
}

TEST_CASE("TimerQueue cancel", "[core][timer]") {
    TimerQueue timers;
    int fired = 0;
    TimerHandle handle = timers.schedule(10ms, [&fired]() { ++fired; });

    REQUIRE(timers.is_pending(handle));
    REQUIRE(timers.cancel(handle));
    REQUIRE_FALSE(timers.is_pending(handle));
    REQUIRE_FALSE(timers.cancel(handle));
    REQUIRE_FALSE(timers.cancel(TimerHandle::invalid()));

    timers.advance(100ms);
    REQUIRE(fired == 0);
}

TEST_CASE("TimerQueue runs timers scheduled from callbacks", "[core][timer]") {
    TimerQueue timers;
    std::vector<int> ticks;
    timers.schedule(10ms, [&]() {
        ticks.push_back(1);
        timers.schedule(0ms, [&ticks]() { ticks.push_back(2); });
        timers.schedule(50ms, [&ticks]() { ticks.push_back(3); });
    });

    timers.advance(10ms);
    REQUIRE(ticks == std::vector<int>{1, 2});
    REQUIRE(timers.next_deadline() == 60ms);

    timers.advance(50ms);
    REQUIRE(ticks == std::vector<int>{1, 2, 3});
    REQUIRE_FALSE(timers.next_deadline().has_value());
}

TEST_CASE("TimerQueue clamps negative delays", "[core][timer]") {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(-5ms, [&fired]() { ++fired; });
    REQUIRE(timers.run_due() == 1);
    REQUIRE(fired == 1);
}

TEST_CASE("TimerQueue clear drops everything", "[core][timer]") {
    TimerQueue timers;
    int fired = 0;
    TimerHandle handle = timers.schedule(5ms, [&fired]() { ++fired; });
    timers.schedule(6ms, [&fired]() { ++fired; });

    timers.clear();
    REQUIRE(timers.pending_count() == 0);
    REQUIRE_FALSE(timers.is_pending(handle));
    timers.advance(10ms);
    REQUIRE(fired == 0);
}
