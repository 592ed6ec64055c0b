#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include "strategy_config.hpp"
#include "universe_selector.hpp"
#include "streak_detector.hpp"
#include "holdings_manager.hpp"
#include <string>
#include <vector>

namespace strategy_engine {

    // Everything the engine mutates across cycles
    struct StreakFadeState {
        std::vector<core::Symbol> universe;
        HoldingsManager holdings;
        int plot_count = 0; // cycles since the last NumHoldings sample

        explicit StreakFadeState(int max_holding_period) : holdings(max_holding_period) {}
    };

    // --- StreakFadeStrategy ---
    // Bets against N-day streaks: shorts symbols that closed up every day of the window,
    // buys symbols that closed down every day, and liquidates each position after a fixed
    // number of cycles.
    class StreakFadeStrategy : public IStrategy {
    public:
        // Collaborators are not owned and must outlive the strategy
        StreakFadeStrategy(StreakFadeConfig config,
                           IHistoryService& history,
                           IExecutionService& execution,
                           IMetricsSink& metrics);

        virtual ~StreakFadeStrategy() override = default;

        // IStrategy interface implementation
        std::string getName() const override;
        void initialize() override;
        std::vector<core::Symbol> selectUniverse(const std::vector<core::CoarseFundamental>& snapshot) override;
        void onUniverseChanged(const UniverseChanges& changes) override;
        void onSchedule(core::Timestamp now) override;

        // One full daily cycle: age, detect, dedup, liquidate, enter, sample
        RebalanceSummary rebalance(core::Timestamp now);

        // Forget a holding whose position was closed outside the holding-period logic
        void onPositionClosed(const core::Symbol& symbol);

        const StreakFadeConfig& getConfig() const { return config_; }
        const StreakFadeState& getState() const { return state_; }

    private:
        void emitHoldingsSample();

        StreakFadeConfig config_;
        IHistoryService& history_;
        IExecutionService& execution_;
        IMetricsSink& metrics_;

        UniverseSelector selector_;
        StreakDetector detector_;
        StreakFadeState state_;
    };

} // namespace strategy_engine
