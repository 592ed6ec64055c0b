#include "holdings_manager.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

HoldingsManager::HoldingsManager(int max_holding_period) : max_holding_period_(max_holding_period) {
    if (max_holding_period_ <= 0) {
        throw std::invalid_argument("Max holding period must be positive.");
    }
}

void HoldingsManager::incrementHoldingPeriod() {
    for (auto& [symbol, age] : holdings_) {
        ++age;
    }
}

void HoldingsManager::removeDuplicateSymbols(StreakCandidates& candidates) const {
    auto held = [this](const core::Symbol& symbol) { return isHeld(symbol); };
    candidates.shorts.erase(std::remove_if(candidates.shorts.begin(), candidates.shorts.end(), held),
                            candidates.shorts.end());
    candidates.longs.erase(std::remove_if(candidates.longs.begin(), candidates.longs.end(), held),
                           candidates.longs.end());
}

std::vector<core::Symbol> HoldingsManager::liquidateStaleHoldings(IExecutionService& execution) {
    auto logger = core::logging::getLogger();
    std::vector<core::Symbol> liquidated;

    for (auto it = holdings_.begin(); it != holdings_.end();) {
        if (it->second >= max_holding_period_) {
            execution.liquidate(it->first);
            logger->debug("{} max holding period reached ({} >= {}), liquidating", it->first, it->second, max_holding_period_);
            liquidated.push_back(it->first);
            it = holdings_.erase(it);
        } else {
            ++it;
        }
    }
    return liquidated;
}

void HoldingsManager::openPosition(const core::Symbol& symbol) {
    holdings_[symbol] = 0;
}

bool HoldingsManager::onPositionClosed(const core::Symbol& symbol) {
    return holdings_.erase(symbol) > 0;
}

bool HoldingsManager::isHeld(const core::Symbol& symbol) const {
    return holdings_.count(symbol) > 0;
}

int HoldingsManager::getAge(const core::Symbol& symbol) const {
    auto it = holdings_.find(symbol);
    return (it != holdings_.end()) ? it->second : -1;
}

} // namespace strategy_engine
