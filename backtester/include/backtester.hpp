#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"
#include "database_manager.hpp"
#include "database_history_service.hpp"
#include "interfaces.hpp"
#include "metrics_recorder.hpp"
#include "portfolio.hpp"
#include "simulated_execution.hpp"

namespace backtester {

    using json = nlohmann::json;

    // The "backtest" section of a run configuration
    struct BacktestSettings {
        std::string database = "market_data.db";
        std::string interval = "day";
        std::string start_date; // YYYY-MM-DD, inclusive
        std::string end_date;   // YYYY-MM-DD, inclusive
        double initial_capital = 250000.0;
        double commission_per_share = 0.005;

        // Throws core::ConfigException on missing dates, wrong types or out-of-range values
        static BacktestSettings fromJson(const json& config);
    };

    // Daily event loop driving one strategy over the stored market data
    class Backtester {
    public:
        explicit Backtester(data::DatabaseManager& db_manager);

        // Runs the strategy described by `config` (strategy fields plus a "backtest" section).
        // Returns false if the run could not complete; the reason is logged.
        bool run(const json& config);

        // Valid after run(); throws core::BacktestException before the first run
        const Portfolio& getPortfolio() const;
        const BacktestMetrics& getMetrics() const { return metrics_; }
        const MetricsRecorder& getMetricsRecorder() const;
        const BacktestSettings& getSettings() const { return settings_; }

    private:
        data::DatabaseManager& db_manager_; // Use reference, doesn't own it
        BacktestSettings settings_;
        std::string holdings_series_;

        // Declaration order matters: the strategy holds references into the services below it
        std::map<core::Symbol, double> last_closes_;
        std::unique_ptr<Portfolio> portfolio_;
        std::unique_ptr<MetricsRecorder> recorder_;
        std::unique_ptr<data::DatabaseHistoryService> history_;
        std::unique_ptr<SimulatedExecution> execution_;
        std::unique_ptr<strategy_engine::IStrategy> strategy_;
        BacktestMetrics metrics_;

        void runEventLoop(const std::vector<core::Timestamp>& trading_days);
        void updateUniverse(core::Timestamp day, std::vector<core::Symbol>& current_universe);
        void calculateMetrics(int trading_days);
    };

} // namespace backtester
