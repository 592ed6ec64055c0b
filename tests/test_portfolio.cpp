#include <catch2/catch.hpp>
#include "portfolio.hpp"
#include "test_fakes.hpp"

#include <stdexcept>

using backtester::Portfolio;
using core::SignalAction;
using test_support::day;

TEST_CASE("A long round trip books PnL net of commission", "[portfolio]") {
    Portfolio portfolio(10000.0);
    REQUIRE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterLong, 10, 100.0, 1.0));
    REQUIRE(portfolio.getCash() == Approx(8999.0));
    REQUIRE(portfolio.getPositionQuantity("AAA") == 10);
    REQUIRE(portfolio.getCurrentEquity({{"AAA", 110.0}}) == Approx(10099.0));

    REQUIRE(portfolio.recordTrade(day(3), "AAA", SignalAction::ExitLong, 10, 110.0, 1.0));
    REQUIRE(portfolio.getPositionQuantity("AAA") == 0);
    REQUIRE(portfolio.getPositions().empty());
    REQUIRE(portfolio.getCash() == Approx(10098.0));

    const auto& trades = portfolio.getTradeLog();
    REQUIRE(trades.size() == 1);
    REQUIRE(trades[0].entry_action == SignalAction::EnterLong);
    REQUIRE(trades[0].quantity == 10);
    REQUIRE(trades[0].pnl == Approx(98.0));
    REQUIRE(trades[0].commission == Approx(2.0));
    REQUIRE(portfolio.getTotalExecutions() == 2);
}

TEST_CASE("A short round trip profits when price falls", "[portfolio]") {
    Portfolio portfolio(10000.0);
    REQUIRE(portfolio.recordTrade(day(0), "BBB", SignalAction::EnterShort, 20, 50.0));
    REQUIRE(portfolio.getPositionQuantity("BBB") == -20);
    REQUIRE(portfolio.getCash() == Approx(11000.0));
    REQUIRE(portfolio.getCurrentEquity({{"BBB", 40.0}}) == Approx(10200.0));

    REQUIRE(portfolio.recordTrade(day(1), "BBB", SignalAction::ExitShort, 50, 40.0)); // clamped to 20
    REQUIRE(portfolio.getPositionQuantity("BBB") == 0);
    REQUIRE(portfolio.getTradeLog().at(0).quantity == -20);
    REQUIRE(portfolio.getTradeLog().at(0).pnl == Approx(200.0));
}

TEST_CASE("Partial exits book the closed part and keep the rest open", "[portfolio]") {
    Portfolio portfolio(10000.0);
    REQUIRE(portfolio.recordTrade(day(0), "CCC", SignalAction::EnterLong, 10, 10.0, 2.0));
    REQUIRE(portfolio.recordTrade(day(1), "CCC", SignalAction::ExitLong, 4, 12.0));
    REQUIRE(portfolio.getPositionQuantity("CCC") == 6);
    REQUIRE(portfolio.getTradeLog().size() == 1);
    REQUIRE(portfolio.getTradeLog()[0].pnl == Approx(8.0 - 0.8));
}

TEST_CASE("Rejected trades leave the books untouched", "[portfolio]") {
    Portfolio portfolio(1000.0);
    REQUIRE_FALSE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterLong, 100, 20.0)); // needs 2000
    REQUIRE_FALSE(portfolio.recordTrade(day(0), "AAA", SignalAction::ExitLong, 1, 20.0));    // not long
    REQUIRE_FALSE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterLong, 0, 20.0));
    REQUIRE_FALSE(portfolio.recordTrade(day(0), "AAA", SignalAction::None, 1, 20.0));

    REQUIRE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterShort, 1, 20.0));
    REQUIRE_FALSE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterLong, 1, 20.0)); // short already

    REQUIRE(portfolio.getCash() == Approx(1020.0));
    REQUIRE(portfolio.getTotalExecutions() == 1);
}

TEST_CASE("The equity curve keeps one point per timestamp", "[portfolio]") {
    Portfolio portfolio(5000.0);
    REQUIRE(portfolio.recordTrade(day(0), "AAA", SignalAction::EnterLong, 10, 100.0));
    portfolio.recordTimestampValue(day(0), {{"AAA", 100.0}});
    portfolio.recordTimestampValue(day(0), {{"AAA", 200.0}});
    portfolio.recordTimestampValue(day(1), {{"AAA", 90.0}});

    const auto& curve = portfolio.getEquityCurve();
    REQUIRE(curve.size() == 2);
    REQUIRE(curve[0].total_equity == Approx(5000.0));
    REQUIRE(curve[1].total_equity == Approx(4900.0));
    REQUIRE(curve[1].open_positions == 1);
}

TEST_CASE("Initial capital must be positive", "[portfolio]") {
    REQUIRE_THROWS_AS(Portfolio(0.0), std::invalid_argument);
}
