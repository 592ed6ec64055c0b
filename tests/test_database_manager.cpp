#include <catch2/catch.hpp>
#include "database_manager.hpp"
#include "database_history_service.hpp"
#include "test_fakes.hpp"

using data::DatabaseManager;
using test_support::candleAt;
using test_support::day;

namespace {

    // Fresh in-memory store with schema
    struct MemoryStore {
        DatabaseManager db{":memory:"};
        MemoryStore() {
            REQUIRE(db.connect());
            REQUIRE(db.initializeSchema());
        }
    };

    core::TimeSeries<core::Candle> closesFrom(int first_day, const std::vector<double>& closes) {
        core::TimeSeries<core::Candle> candles;
        for (size_t i = 0; i < closes.size(); ++i) {
            candles.push_back(candleAt(first_day + static_cast<int>(i), closes[i]));
        }
        return candles;
    }

} // namespace

TEST_CASE("Candles round-trip through the store and duplicates are ignored", "[database]") {
    MemoryStore store;
    auto candles = closesFrom(0, {10, 11, 12, 13});
    REQUIRE(store.db.saveCandles(candles, "AAA", "day"));
    REQUIRE(store.db.saveCandles(candles, "AAA", "day"));

    auto loaded = store.db.queryCandles("AAA", "day", day(1), day(2));
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded[0].timestamp == day(1));
    REQUIRE(loaded[0].close == 11.0);
    REQUIRE(loaded[1].volume == 1000);

    REQUIRE(store.db.queryCandles("AAA", "day", day(0), day(10)).size() == 4);
    REQUIRE(store.db.queryCandles("AAA", "minute", day(0), day(10)).empty());
    REQUIRE(store.db.queryCandles("BBB", "day", day(0), day(10)).empty());
}

TEST_CASE("Trading days are the union of bar dates", "[database]") {
    MemoryStore store;
    REQUIRE(store.db.saveCandles(closesFrom(0, {1, 2, 3}), "AAA", "day"));
    REQUIRE(store.db.saveCandles(closesFrom(2, {5, 6, 7}), "BBB", "day"));

    auto days = store.db.queryTradingDays("day", day(1), day(3));
    REQUIRE(days == std::vector<core::Timestamp>{day(1), day(2), day(3)});

    auto before = store.db.queryTradingDaysBefore("day", day(4), 2);
    REQUIRE(before == std::vector<core::Timestamp>{day(2), day(3)});
    REQUIRE(store.db.queryTradingDaysBefore("day", day(0), 5).empty());

    auto at_two = store.db.queryCandlesAt("day", day(2));
    REQUIRE(at_two.size() == 2);
    REQUIRE(at_two.at("AAA").close == 3.0);
    REQUIRE(at_two.at("BBB").close == 5.0);
}

TEST_CASE("Coarse snapshots keep optional dollar volume", "[database]") {
    MemoryStore store;
    core::CoarseFundamental with_dv;
    with_dv.symbol = "AAA";
    with_dv.adjusted_price = 10.0;
    with_dv.volume = 100;
    with_dv.dollar_volume = 5000.0;
    with_dv.has_fundamental_data = true;
    core::CoarseFundamental without_dv;
    without_dv.symbol = "BBB";
    without_dv.adjusted_price = 20.0;
    without_dv.volume = 50;

    REQUIRE(store.db.saveCoarseFundamentals({without_dv, with_dv}, day(3)));
    auto rows = store.db.queryCoarseSnapshot(day(3));
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].symbol == "AAA");
    REQUIRE(rows[0].dollar_volume.has_value());
    REQUIRE(rows[0].getDollarVolume() == 5000.0);
    REQUIRE_FALSE(rows[1].dollar_volume.has_value());
    REQUIRE_FALSE(rows[1].has_fundamental_data);
    REQUIRE(rows[1].getDollarVolume() == 1000.0);

    REQUIRE(store.db.queryCoarseSnapshot(day(4)).empty());
}

TEST_CASE("Queries on a closed store fail softly", "[database]") {
    DatabaseManager db(":memory:");
    REQUIRE_FALSE(db.isConnected());
    REQUIRE_FALSE(db.saveCandles(closesFrom(0, {1}), "AAA", "day"));
    REQUIRE(db.queryTradingDays("day", day(0), day(1)).empty());
}

TEST_CASE("History only covers days before the current time", "[database][history]") {
    MemoryStore store;
    REQUIRE(store.db.saveCandles(closesFrom(0, {1, 2, 3, 4, 5, 6}), "AAA", "day"));
    REQUIRE(store.db.saveCandles(closesFrom(3, {9, 8, 7}), "BBB", "day"));

    data::DatabaseHistoryService history(store.db, "day");
    history.setCurrentTime(day(5));

    auto result = history.getHistory({"AAA", "BBB", "ZZZ"}, 3, strategy_engine::Resolution::Daily);
    REQUIRE(result.hasField("close"));
    REQUIRE(result.bars.size() == 2);
    REQUIRE(result.bars.count("ZZZ") == 0);

    const auto& aaa = result.bars.at("AAA");
    REQUIRE(aaa.size() == 3);
    REQUIRE(aaa.front().timestamp == day(2));
    REQUIRE(aaa.back().timestamp == day(4));
    REQUIRE(result.bars.at("BBB").size() == 2);
}

TEST_CASE("History with no rows has no fields", "[database][history]") {
    MemoryStore store;
    REQUIRE(store.db.saveCandles(closesFrom(5, {1, 2}), "AAA", "day"));

    data::DatabaseHistoryService history(store.db, "day");
    history.setCurrentTime(day(5));
    auto before_data = history.getHistory({"AAA"}, 6, strategy_engine::Resolution::Daily);
    REQUIRE(before_data.fields.empty());
    REQUIRE_FALSE(before_data.hasField("close"));

    history.setCurrentTime(day(7));
    auto other_symbol = history.getHistory({"ZZZ"}, 6, strategy_engine::Resolution::Daily);
    REQUIRE(other_symbol.fields.empty());
    REQUIRE(other_symbol.bars.empty());
}
