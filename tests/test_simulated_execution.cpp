#include <catch2/catch.hpp>
#include "simulated_execution.hpp"
#include "metrics_recorder.hpp"
#include "test_fakes.hpp"

using backtester::Portfolio;
using backtester::SimulatedExecution;
using test_support::day;

TEST_CASE("Target allocation sizes by equity and truncates toward zero", "[execution]") {
    Portfolio portfolio(100000.0);
    std::map<core::Symbol, double> marks{{"AAA", 30.0}, {"BBB", 30.0}};
    SimulatedExecution execution(portfolio, marks, 0.005);
    execution.beginDay(day(0), marks);

    execution.setTargetAllocation("AAA", 0.01);  // 1000 / 30 = 33.3
    execution.setTargetAllocation("BBB", -0.01);
    REQUIRE(portfolio.getPositionQuantity("AAA") == 33);
    REQUIRE(portfolio.getPositionQuantity("BBB") == -33);
    REQUIRE(portfolio.getCash() == Approx(100000.0 - 66 * 0.005));
}

TEST_CASE("Changing sign reverses through flat", "[execution]") {
    Portfolio portfolio(100000.0);
    std::map<core::Symbol, double> marks{{"AAA", 50.0}};
    SimulatedExecution execution(portfolio, marks, 0.0);
    execution.beginDay(day(0), marks);

    execution.setTargetAllocation("AAA", 0.01);
    REQUIRE(portfolio.getPositionQuantity("AAA") == 20);

    execution.setTargetAllocation("AAA", -0.01);
    REQUIRE(portfolio.getPositionQuantity("AAA") == -20);
    REQUIRE(portfolio.getTradeLog().size() == 1);
    REQUIRE(portfolio.getTotalExecutions() == 3);

    execution.setTargetAllocation("AAA", -0.01); // already on target
    REQUIRE(portfolio.getTotalExecutions() == 3);
}

TEST_CASE("Orders for unpriced symbols are skipped", "[execution]") {
    Portfolio portfolio(100000.0);
    std::map<core::Symbol, double> marks;
    SimulatedExecution execution(portfolio, marks, 0.0);
    execution.beginDay(day(0), {});

    execution.setTargetAllocation("GHOST", 0.01);
    REQUIRE(portfolio.getPositionQuantity("GHOST") == 0);
    REQUIRE(portfolio.getTotalExecutions() == 0);
}

TEST_CASE("Liquidation closes the whole position and ignores flat symbols", "[execution]") {
    Portfolio portfolio(100000.0);
    std::map<core::Symbol, double> marks{{"AAA", 50.0}};
    SimulatedExecution execution(portfolio, marks, 0.0);
    execution.beginDay(day(0), marks);

    execution.liquidate("AAA");
    REQUIRE(portfolio.getTotalExecutions() == 0);

    execution.setTargetAllocation("AAA", -0.02);
    execution.beginDay(day(1), {{"AAA", 45.0}});
    execution.liquidate("AAA");
    REQUIRE(portfolio.getPositionQuantity("AAA") == 0);
    REQUIRE(portfolio.getTradeLog().at(0).pnl == Approx(40 * 5.0));
}

TEST_CASE("Liquidation without a price waits for the next priced day", "[execution]") {
    Portfolio portfolio(100000.0);
    std::map<core::Symbol, double> marks{{"AAA", 50.0}};
    SimulatedExecution execution(portfolio, marks, 0.0);
    execution.beginDay(day(0), marks);
    execution.setTargetAllocation("AAA", 0.01);

    execution.beginDay(day(1), {});
    execution.liquidate("AAA");
    REQUIRE(portfolio.getPositionQuantity("AAA") == 20);
    REQUIRE(execution.getPendingLiquidations().count("AAA") == 1);

    execution.beginDay(day(2), {{"AAA", 55.0}});
    REQUIRE(portfolio.getPositionQuantity("AAA") == 0);
    REQUIRE(execution.getPendingLiquidations().empty());
}

TEST_CASE("Metric samples are stamped with the simulation clock", "[execution]") {
    backtester::MetricsRecorder recorder;
    recorder.setCurrentTime(day(3));
    recorder.emitMetric("NumHoldings", 4.0);
    recorder.setCurrentTime(day(9));
    recorder.emitMetric("NumHoldings", 2.0);

    const auto& series = recorder.getSeries("NumHoldings");
    REQUIRE(series.size() == 2);
    REQUIRE(series[1].timestamp == day(9));
    REQUIRE(recorder.average("NumHoldings") == Approx(3.0));
    REQUIRE(recorder.getSeries("Other").empty());
    REQUIRE(recorder.average("Other") == 0.0);
    REQUIRE(recorder.getSeriesNames() == std::vector<std::string>{"NumHoldings"});
}
