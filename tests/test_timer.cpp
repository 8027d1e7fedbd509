#include <catch2/catch.hpp>
#include <vector>
#include "timer.hpp"

TEST_CASE("Tasks run once their delay has elapsed", "[timer]") {
    uint64_t now = 100;
    Timer timer([&now]() { return now; });
    int runs = 0;

    timer.postDelayed(10, [&runs]() { ++runs; });
    REQUIRE(timer.hasPending());
    REQUIRE(timer.msUntilNext() == 10);

    now = 105;
    REQUIRE(timer.runDue() == 0);
    REQUIRE(timer.msUntilNext() == 5);

    now = 110;
    REQUIRE(timer.runDue() == 1);
    REQUIRE(runs == 1);
    REQUIRE_FALSE(timer.hasPending());
}

TEST_CASE("Due tasks run in deadline order", "[timer]") {
    uint64_t now = 0;
    Timer timer([&now]() { return now; });
    std::vector<int> order;

    timer.postDelayed(30, [&order]() { order.push_back(3); });
    timer.postDelayed(10, [&order]() { order.push_back(1); });
    timer.postDelayed(20, [&order]() { order.push_back(2); });

    now = 50;
    REQUIRE(timer.runDue() == 3);
    const std::vector<int> expected{1, 2, 3};
    REQUIRE(order == expected);
}

TEST_CASE("Cancelled tasks never run", "[timer]") {
    uint64_t now = 0;
    Timer timer([&now]() { return now; });
    bool ran = false;

    Timer::TaskId id = timer.postDelayed(1, [&ran]() { ran = true; });
    REQUIRE(timer.cancel(id));
    REQUIRE_FALSE(timer.cancel(id));

    now = 10;
    REQUIRE(timer.runDue() == 0);
    REQUIRE_FALSE(ran);
}

TEST_CASE("Tasks posted while running wait for the next pass", "[timer]") {
    uint64_t now = 0;
    Timer timer([&now]() { return now; });
    int runs = 0;

    std::function<void()> repost = [&]() {
        ++runs;
        timer.postDelayed(0, repost);
    };
    timer.postDelayed(0, repost);

    REQUIRE(timer.runDue() == 1);
    REQUIRE(runs == 1);
    REQUIRE(timer.hasPending());
    REQUIRE(timer.runDue() == 1);
    REQUIRE(runs == 2);
}

TEST_CASE("A task may cancel a later one in the same pass", "[timer]") {
    uint64_t now = 0;
    Timer timer([&now]() { return now; });
    bool secondRan = false;
    Timer::TaskId second = 0;

    timer.postDelayed(1, [&]() { timer.cancel(second); });
    second = timer.postDelayed(2, [&secondRan]() { secondRan = true; });

    now = 5;
    REQUIRE(timer.runDue() == 1);
    REQUIRE_FALSE(secondRan);
}

TEST_CASE("Default clock is monotonic", "[timer]") {
    Timer timer;
    uint64_t a = timer.now();
    uint64_t b = timer.now();
    REQUIRE(b >= a);
    REQUIRE(timer.msUntilNext() == 0);
}
