// backtester/include/portfolio.hpp
#pragma once

#include <string>
#include <vector>
#include <map>

#include "datatypes.hpp" // Provides core::Timestamp, core::SignalAction, core::Trade
#include "logging.hpp"   // core::logging::getLogger needed by BacktestMetrics::logMetrics

namespace backtester {

    // --- Backtest Metrics Struct ---
    struct BacktestMetrics {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_return_pct = 0.0;
        double max_drawdown_pct = 0.0;
        double total_pnl = 0.0;
        int total_executions = 0;
        int round_trip_trades = 0;
        double win_rate = 0.0;        // Based on round trips
        double profit_factor = 0.0;   // Gross Profit / Gross Loss
        double avg_win_pnl = 0.0;
        double avg_loss_pnl = 0.0;
        int trading_days = 0;
        double avg_num_holdings = 0.0; // Mean of the holdings-count samples

        void logMetrics() const {
            auto logger = core::logging::getLogger();
            logger->info("--- Backtest Metrics ---");
            logger->info("Trading Days: {}", trading_days);
            logger->info("Initial Capital: {:.2f}", initial_capital);
            logger->info("Final Equity: {:.2f}", final_equity);
            logger->info("Total Return: {:.2f}%", total_return_pct * 100.0);
            logger->info("Total PnL: {:.2f}", total_pnl);
            logger->info("Max Drawdown: {:.2f}%", max_drawdown_pct * 100.0);
            logger->info("Total Executions: {}", total_executions);
            logger->info("Round-Trip Trades: {}", round_trip_trades);
            logger->info("Win Rate: {:.2f}%", win_rate * 100.0);
            logger->info("Profit Factor: {:.2f}", profit_factor);
            logger->info("Avg Win PnL: {:.2f}", avg_win_pnl);
            logger->info("Avg Loss PnL: {:.2f}", avg_loss_pnl);
            logger->info("Avg Holdings: {:.2f}", avg_num_holdings);
            logger->info("------------------------");
        }
    };

    // --- Portfolio State Struct (for equity curve) ---
    struct PortfolioState {
        core::Timestamp timestamp;
        double cash = 0.0;
        double positions_value = 0.0; // Signed market value of all holdings
        double total_equity = 0.0;    // cash + positions_value
        int open_positions = 0;
    };

    // Entry details of an open position, consumed as it is closed out
    struct OpenPositionInfo {
        core::Timestamp entry_time;
        double entry_price = 0.0;      // Volume-weighted average entry price
        long long entry_quantity = 0;  // Signed quantity (+long, -short) still open
        double entry_commission = 0.0; // Entry commission not yet attributed to a trade
    };

    // Cash and signed positions across any number of symbols
    class Portfolio {
    public:
        explicit Portfolio(double initial_capital);

        double getInitialCapital() const { return initial_capital_; }
        double getCash() const;
        long long getPositionQuantity(const core::Symbol& symbol) const;
        const std::map<core::Symbol, long long>& getPositions() const { return positions_; }

        // Cash plus signed market value of every position. Positions without a mark count as zero.
        double getCurrentEquity(const std::map<core::Symbol, double>& current_prices) const;
        const std::vector<PortfolioState>& getEquityCurve() const;
        int getTotalExecutions() const { return execution_count_; }
        const std::vector<core::Trade>& getTradeLog() const;

        // Applies one execution leg. `quantity` is always positive; the action gives the side.
        // Returns false when the leg is rejected (wrong side, insufficient cash, bad input).
        bool recordTrade(core::Timestamp timestamp,
                         const core::Symbol& symbol,
                         core::SignalAction action,
                         long long quantity,
                         double execution_price,
                         double commission = 0.0);

        // Appends one equity-curve point; a repeated timestamp is ignored
        void recordTimestampValue(core::Timestamp timestamp, const std::map<core::Symbol, double>& current_prices);

    private:
        double positionsValue(const std::map<core::Symbol, double>& current_prices) const;
        void openOrAdd(core::Timestamp timestamp, const core::Symbol& symbol, long long signed_quantity,
                       double price, double commission);
        void closeOut(core::Timestamp timestamp, const core::Symbol& symbol, long long closed_quantity,
                      double price, double commission);

        double initial_capital_;
        double cash_;
        std::map<core::Symbol, long long> positions_;
        std::map<core::Symbol, OpenPositionInfo> open_positions_info_;
        std::vector<PortfolioState> equity_curve_;
        int execution_count_ = 0;
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
