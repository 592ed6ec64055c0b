#include <catch2/catch.hpp>
#include "streak_fade_strategy.hpp"
#include "exceptions.hpp"
#include "test_fakes.hpp"

using namespace strategy_engine;
using test_support::FakeHistory;
using test_support::RecordingExecution;
using test_support::RecordingMetrics;
using test_support::day;
using test_support::makeHistory;

namespace {

    core::CoarseFundamental liquid(const std::string& symbol, double dollar_volume) {
        core::CoarseFundamental r;
        r.symbol = symbol;
        r.adjusted_price = 50.0;
        r.volume = 1;
        r.dollar_volume = dollar_volume;
        r.has_fundamental_data = true;
        return r;
    }

    struct Harness {
        FakeHistory history;
        RecordingExecution execution;
        RecordingMetrics metrics;
        StreakFadeStrategy strategy;

        explicit Harness(StreakFadeConfig config = {})
            : strategy(config, history, execution, metrics) {
            strategy.initialize();
        }
    };

} // namespace

TEST_CASE("Streaks are faded with the configured allocation", "[strategy]") {
    StreakFadeConfig config;
    config.allocation_pct = 0.02;
    Harness h(config);
    h.strategy.selectUniverse({liquid("UP", 3e6), liquid("DOWN", 2e6), liquid("CHOP", 1e6)});
    h.history.next = makeHistory({{"UP", {1, 2, 3, 4, 5, 6}},
                                  {"DOWN", {6, 5, 4, 3, 2, 1}},
                                  {"CHOP", {1, 2, 1, 2, 1, 2}}});

    auto summary = h.strategy.rebalance(day(10));

    REQUIRE(summary.shorted == std::vector<core::Symbol>{"UP"});
    REQUIRE(summary.bought == std::vector<core::Symbol>{"DOWN"});
    REQUIRE(summary.liquidated.empty());
    REQUIRE(h.execution.targets.size() == 2);
    REQUIRE(h.execution.targets[0].first == "UP");
    REQUIRE(h.execution.targets[0].second == Approx(-0.02));
    REQUIRE(h.execution.targets[1].first == "DOWN");
    REQUIRE(h.execution.targets[1].second == Approx(0.02));
    REQUIRE(h.strategy.getState().holdings.getAge("UP") == 0);
    REQUIRE(h.history.last_symbols == std::vector<core::Symbol>{"UP", "DOWN", "CHOP"});
}

TEST_CASE("Held symbols are not re-entered and are liquidated after the holding period", "[strategy]") {
    Harness h; // window 5, max holding 5
    h.strategy.selectUniverse({liquid("UP", 1e6)});
    h.history.next = makeHistory({{"UP", {1, 2, 3, 4, 5, 6}}});

    h.strategy.onSchedule(day(0));
    REQUIRE(h.execution.targets.size() == 1);

    // Signal persists but the symbol is held
    for (int d = 1; d <= 4; ++d) {
        h.strategy.onSchedule(day(d));
    }
    REQUIRE(h.execution.targets.size() == 1);
    REQUIRE(h.execution.liquidations.empty());

    // Age reaches 5: liquidated, and not re-entered the same cycle
    auto summary = h.strategy.rebalance(day(5));
    REQUIRE(summary.liquidated == std::vector<core::Symbol>{"UP"});
    REQUIRE(summary.shorted.empty());
    REQUIRE(h.execution.liquidations == std::vector<core::Symbol>{"UP"});
    REQUIRE(h.execution.targets.size() == 1);

    h.strategy.onSchedule(day(6));
    REQUIRE(h.execution.targets.size() == 2);
    REQUIRE(h.execution.liquidations.size() == 1);
}

TEST_CASE("Holdings count is sampled once every max_holding_period + 1 cycles", "[strategy]") {
    Harness h;
    // No universe: nothing trades, but the sample cadence still runs
    for (int d = 0; d < 5; ++d) {
        h.strategy.onSchedule(day(d));
    }
    REQUIRE(h.metrics.samples.empty());

    h.strategy.onSchedule(day(5));
    REQUIRE(h.metrics.samples.size() == 1);
    REQUIRE(h.metrics.samples[0].first == "NumHoldings");
    REQUIRE(h.metrics.samples[0].second == 0.0);

    for (int d = 6; d < 12; ++d) {
        h.strategy.onSchedule(day(d));
    }
    REQUIRE(h.metrics.samples.size() == 2);
}

TEST_CASE("Removed symbols leave the universe", "[strategy]") {
    Harness h;
    h.strategy.selectUniverse({liquid("A", 3e6), liquid("B", 2e6), liquid("C", 1e6)});
    h.strategy.onUniverseChanged(UniverseChanges{{}, {"B", "ZZZ"}});
    REQUIRE(h.strategy.getState().universe == std::vector<core::Symbol>{"A", "C"});
}

TEST_CASE("A history without closes trades nothing", "[strategy]") {
    Harness h;
    h.strategy.selectUniverse({liquid("A", 1e6)});
    auto summary = h.strategy.rebalance(day(0));
    REQUIRE(summary.shorted.empty());
    REQUIRE(summary.bought.empty());
    REQUIRE(h.execution.targets.empty());
}

TEST_CASE("Externally closed positions can be re-entered", "[strategy]") {
    Harness h;
    h.strategy.selectUniverse({liquid("UP", 1e6)});
    h.history.next = makeHistory({{"UP", {1, 2, 3, 4, 5, 6}}});
    h.strategy.onSchedule(day(0));
    h.strategy.onPositionClosed("UP");
    h.strategy.onSchedule(day(1));
    REQUIRE(h.execution.targets.size() == 2);
}

TEST_CASE("An invalid configuration is refused", "[strategy]") {
    FakeHistory history;
    RecordingExecution execution;
    RecordingMetrics metrics;
    StreakFadeConfig config;
    config.allocation_pct = 1.5;
    REQUIRE_THROWS_AS(StreakFadeStrategy(config, history, execution, metrics), core::ConfigException);
}
