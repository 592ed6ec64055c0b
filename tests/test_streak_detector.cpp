#include <catch2/catch.hpp>
#include "streak_detector.hpp"
#include "test_fakes.hpp"

#include <stdexcept>

using namespace strategy_engine;
using test_support::FakeHistory;
using test_support::makeHistory;

TEST_CASE("Five rising closes in a row make a short candidate", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history;
    history.next = makeHistory({{"AAA", {10, 11, 12, 13, 14, 15}}});

    auto candidates = detector.getStreakingSymbols({"AAA"}, history);
    REQUIRE(candidates.shorts == std::vector<core::Symbol>{"AAA"});
    REQUIRE(candidates.longs.empty());
    REQUIRE(history.last_bar_count == 6);
}

TEST_CASE("Five falling closes in a row make a long candidate", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history;
    history.next = makeHistory({{"BBB", {15, 14, 13, 12, 11, 10}}});

    auto candidates = detector.getStreakingSymbols({"BBB"}, history);
    REQUIRE(candidates.longs == std::vector<core::Symbol>{"BBB"});
    REQUIRE(candidates.shorts.empty());
}

TEST_CASE("A flat day breaks the streak", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history;
    history.next = makeHistory({{"CCC", {10, 11, 12, 12, 13, 14}},
                                {"DDD", {10, 11, 10, 11, 10, 11}}});

    auto candidates = detector.getStreakingSymbols({"CCC", "DDD"}, history);
    REQUIRE(candidates.shorts.empty());
    REQUIRE(candidates.longs.empty());
}

TEST_CASE("Mixed universe splits into disjoint lists", "[streak]") {
    StreakDetector detector(3);
    FakeHistory history;
    history.next = makeHistory({{"UP", {1, 2, 3, 4}},
                                {"DOWN", {9, 8, 7, 6}},
                                {"CHOP", {5, 6, 5, 6}}});

    auto candidates = detector.getStreakingSymbols({"UP", "DOWN", "CHOP"}, history);
    REQUIRE(candidates.shorts == std::vector<core::Symbol>{"UP"});
    REQUIRE(candidates.longs == std::vector<core::Symbol>{"DOWN"});
}

TEST_CASE("A symbol missing the first day is zero-filled and cannot streak", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history;
    history.next = makeHistory({{"FULL", {10, 11, 12, 13, 14, 15}}});
    // LATE has bars for days 1..5 only, rising throughout
    auto late = makeHistory({{"LATE", {20, 21, 22, 23, 24}}}, 1);
    history.next.bars["LATE"] = late.bars["LATE"];

    auto aligned = StreakDetector::alignCloses(history.next);
    REQUIRE(aligned["LATE"] == std::vector<double>{0.0, 20, 21, 22, 23, 24});

    auto candidates = detector.getStreakingSymbols({"FULL", "LATE"}, history);
    REQUIRE(candidates.shorts == std::vector<core::Symbol>{"FULL"});
}

TEST_CASE("Interior gaps are forward-filled", "[streak]") {
    auto history = makeHistory({{"A", {1, 2, 3}}});
    history.bars["B"].push_back(test_support::candleAt(0, 7.0));
    history.bars["B"].push_back(test_support::candleAt(2, 9.0));

    auto aligned = StreakDetector::alignCloses(history);
    REQUIRE(aligned["B"] == std::vector<double>{7.0, 7.0, 9.0});
    REQUIRE(StreakDetector::signSum(aligned["B"]) == 1);
}

TEST_CASE("Missing close field yields empty candidate lists", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history; // empty result: no fields at all

    auto candidates = detector.getStreakingSymbols({"AAA"}, history);
    REQUIRE(candidates.shorts.empty());
    REQUIRE(candidates.longs.empty());
    REQUIRE(history.calls == 1);
}

TEST_CASE("Empty universe skips the history request", "[streak]") {
    StreakDetector detector(5);
    FakeHistory history;
    auto candidates = detector.getStreakingSymbols({}, history);
    REQUIRE(candidates.shorts.empty());
    REQUIRE(candidates.longs.empty());
    REQUIRE(history.calls == 0);
}

TEST_CASE("Streak window must be positive", "[streak]") {
    REQUIRE_THROWS_AS(StreakDetector(0), std::invalid_argument);
}
