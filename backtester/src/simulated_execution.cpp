#include "simulated_execution.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace backtester {

    SimulatedExecution::SimulatedExecution(Portfolio& portfolio,
                                           const std::map<core::Symbol, double>& marks,
                                           double commission_per_share)
        : portfolio_(portfolio), marks_(marks), commission_per_share_(commission_per_share)
    {
        if (commission_per_share_ < 0) {
            throw std::invalid_argument("Commission per share must not be negative.");
        }
    }

    void SimulatedExecution::beginDay(core::Timestamp now, std::map<core::Symbol, double> todays_closes) {
        now_ = now;
        todays_closes_ = std::move(todays_closes);

        for (auto it = pending_liquidations_.begin(); it != pending_liquidations_.end();) {
            const double* price = todaysPrice(*it);
            if (!price) {
                ++it;
                continue;
            }
            core::logging::getLogger()->debug("Filling deferred liquidation of {} at {:.2f}", *it, *price);
            closePosition(*it, *price);
            it = pending_liquidations_.erase(it);
        }
    }

    const double* SimulatedExecution::todaysPrice(const core::Symbol& symbol) const {
        auto it = todays_closes_.find(symbol);
        if (it == todays_closes_.end() || !(it->second > 0)) {
            return nullptr;
        }
        return &it->second;
    }

    bool SimulatedExecution::execute(const core::Symbol& symbol, core::SignalAction action, long long quantity,
                                     double price) {
        if (quantity <= 0) {
            return true;
        }
        double commission = commission_per_share_ * static_cast<double>(quantity);
        return portfolio_.recordTrade(now_, symbol, action, quantity, price, commission);
    }

    bool SimulatedExecution::closePosition(const core::Symbol& symbol, double price) {
        long long current = portfolio_.getPositionQuantity(symbol);
        if (current > 0) {
            return execute(symbol, core::SignalAction::ExitLong, current, price);
        }
        if (current < 0) {
            return execute(symbol, core::SignalAction::ExitShort, -current, price);
        }
        return true;
    }

    void SimulatedExecution::setTargetAllocation(const core::Symbol& symbol, double fraction_of_equity) {
        auto logger = core::logging::getLogger();
        const double* price = todaysPrice(symbol);
        if (!price) {
            logger->warn("No price for {} on {}, skipping target allocation {:.4f}",
                         symbol, core::utils::timestampToDateString(now_), fraction_of_equity);
            return;
        }

        const double equity = portfolio_.getCurrentEquity(marks_);
        // Truncation toward zero keeps the position within the requested fraction
        const long long target = static_cast<long long>(fraction_of_equity * equity / *price);
        const long long current = portfolio_.getPositionQuantity(symbol);
        logger->debug("Target {} for {}: fraction {:.4f}, equity {:.2f}, price {:.2f}, current {}",
                      target, symbol, fraction_of_equity, equity, *price, current);

        if (target == current) {
            return;
        }

        if (target < current) {
            // Sell: first reduce any long, then open or extend a short
            if (current > 0) {
                long long sell = current - std::max(target, 0LL);
                if (!execute(symbol, core::SignalAction::ExitLong, sell, *price)) {
                    return;
                }
            }
            long long short_qty = std::min(current, 0LL) - target;
            if (target < 0 && short_qty > 0) {
                execute(symbol, core::SignalAction::EnterShort, short_qty, *price);
            }
        } else {
            // Buy: first cover any short, then open or extend a long
            if (current < 0) {
                long long cover = std::min(target, 0LL) - current;
                if (!execute(symbol, core::SignalAction::ExitShort, cover, *price)) {
                    return;
                }
            }
            long long long_qty = target - std::max(current, 0LL);
            if (target > 0 && long_qty > 0) {
                execute(symbol, core::SignalAction::EnterLong, long_qty, *price);
            }
        }
    }

    void SimulatedExecution::liquidate(const core::Symbol& symbol) {
        auto logger = core::logging::getLogger();
        if (portfolio_.getPositionQuantity(symbol) == 0) {
            logger->trace("Liquidate {}: no open position", symbol);
            return;
        }
        const double* price = todaysPrice(symbol);
        if (!price) {
            logger->warn("No price for {} on {}, liquidation deferred to the next priced day",
                         symbol, core::utils::timestampToDateString(now_));
            pending_liquidations_.insert(symbol);
            return;
        }
        pending_liquidations_.erase(symbol);
        if (!closePosition(symbol, *price)) {
            logger->error("Liquidation of {} was rejected by the portfolio", symbol);
        }
    }

} // namespace backtester
