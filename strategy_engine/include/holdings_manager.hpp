#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <vector>

namespace strategy_engine {

    // Holding-period bookkeeping. A symbol in the map is assumed to have an open position;
    // its value is the number of cycles it has been held.
    class HoldingsManager {
    public:
        explicit HoldingsManager(int max_holding_period);

        // Held(age) -> Held(age + 1) for every held symbol
        void incrementHoldingPeriod();

        // Drops every already-held symbol from both candidate lists. Idempotent.
        void removeDuplicateSymbols(StreakCandidates& candidates) const;

        // Liquidates and forgets every holding with age >= max holding period.
        // Returns the liquidated symbols in map order.
        std::vector<core::Symbol> liquidateStaleHoldings(IExecutionService& execution);

        // NotHeld -> Held(0)
        void openPosition(const core::Symbol& symbol);

        // Position closed by another route; no liquidation instruction is issued
        bool onPositionClosed(const core::Symbol& symbol);

        bool isHeld(const core::Symbol& symbol) const;
        int getAge(const core::Symbol& symbol) const; // -1 when not held
        size_t size() const { return holdings_.size(); }
        int getMaxHoldingPeriod() const { return max_holding_period_; }
        const Holdings& getHoldings() const { return holdings_; }
        void clear() { holdings_.clear(); }

    private:
        int max_holding_period_;
        Holdings holdings_;
    };

} // namespace strategy_engine
