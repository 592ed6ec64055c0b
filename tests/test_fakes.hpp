#pragma once

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "interfaces.hpp"
#include "utils.hpp"

namespace test_support {

    inline core::Timestamp day(int n) {
        return core::utils::dateToTimestamp("2020-01-01") + std::chrono::hours(24 * n);
    }

    inline core::Candle candleAt(int n, double close) {
        core::Candle candle;
        candle.timestamp = day(n);
        candle.open = close;
        candle.high = close;
        candle.low = close;
        candle.close = close;
        candle.volume = 1000;
        return candle;
    }

    // History from per-symbol close lists; index i of a list is day(i + offset)
    inline strategy_engine::PriceHistory makeHistory(const std::map<core::Symbol, std::vector<double>>& closes,
                                                     int offset = 0) {
        strategy_engine::PriceHistory history;
        history.fields = {"open", "high", "low", "close", "volume"};
        for (const auto& [symbol, values] : closes) {
            auto& bars = history.bars[symbol];
            for (size_t i = 0; i < values.size(); ++i) {
                bars.push_back(candleAt(static_cast<int>(i) + offset, values[i]));
            }
        }
        return history;
    }

    class FakeHistory : public strategy_engine::IHistoryService {
    public:
        strategy_engine::PriceHistory next;
        std::vector<core::Symbol> last_symbols;
        int last_bar_count = -1;
        int calls = 0;

        strategy_engine::PriceHistory getHistory(const std::vector<core::Symbol>& symbols,
                                                 int bar_count,
                                                 strategy_engine::Resolution) override {
            ++calls;
            last_symbols = symbols;
            last_bar_count = bar_count;
            return next;
        }
    };

    class RecordingExecution : public strategy_engine::IExecutionService {
    public:
        std::vector<std::pair<core::Symbol, double>> targets;
        std::vector<core::Symbol> liquidations;

        void setTargetAllocation(const core::Symbol& symbol, double fraction_of_equity) override {
            targets.emplace_back(symbol, fraction_of_equity);
        }
        void liquidate(const core::Symbol& symbol) override {
            liquidations.push_back(symbol);
        }
    };

    class RecordingMetrics : public strategy_engine::IMetricsSink {
    public:
        std::vector<std::pair<std::string, double>> samples;

        void emitMetric(const std::string& series_name, double value) override {
            samples.emplace_back(series_name, value);
        }
    };

} // namespace test_support
