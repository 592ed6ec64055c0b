#pragma once

#include <map>
#include <set>
#include <string>

#include "datatypes.hpp"
#include "interfaces.hpp"
#include "portfolio.hpp"

namespace backtester {

    // Fills strategy orders against a Portfolio at the current day's close
    class SimulatedExecution : public strategy_engine::IExecutionService {
    public:
        // `marks` holds the last known close per symbol and is used for equity; it must outlive this object
        SimulatedExecution(Portfolio& portfolio,
                           const std::map<core::Symbol, double>& marks,
                           double commission_per_share);

        // Sets the fill time and the closes tradable today, then retries deferred liquidations
        void beginDay(core::Timestamp now, std::map<core::Symbol, double> todays_closes);

        void setTargetAllocation(const core::Symbol& symbol, double fraction_of_equity) override;
        void liquidate(const core::Symbol& symbol) override;

        // Liquidations waiting for a tradable price
        const std::set<core::Symbol>& getPendingLiquidations() const { return pending_liquidations_; }

    private:
        bool execute(const core::Symbol& symbol, core::SignalAction action, long long quantity, double price);
        bool closePosition(const core::Symbol& symbol, double price);
        const double* todaysPrice(const core::Symbol& symbol) const;

        Portfolio& portfolio_;
        const std::map<core::Symbol, double>& marks_;
        double commission_per_share_;
        core::Timestamp now_{};
        std::map<core::Symbol, double> todays_closes_;
        std::set<core::Symbol> pending_liquidations_;
    };

} // namespace backtester
