#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace backtester {

    Portfolio::Portfolio(double initial_capital)
        : initial_capital_(initial_capital), cash_(initial_capital) {
        if (!(initial_capital > 0)) {
            throw std::invalid_argument("Initial capital must be positive.");
        }
    }

    double Portfolio::getCash() const {
        return cash_;
    }

    long long Portfolio::getPositionQuantity(const core::Symbol& symbol) const {
        auto it = positions_.find(symbol);
        return (it != positions_.end()) ? it->second : 0;
    }

    double Portfolio::positionsValue(const std::map<core::Symbol, double>& current_prices) const {
        double value = 0.0;
        for (const auto& [symbol, quantity] : positions_) {
            auto price_it = current_prices.find(symbol);
            if (price_it != current_prices.end()) {
                value += static_cast<double>(quantity) * price_it->second;
            }
        }
        return value;
    }

    double Portfolio::getCurrentEquity(const std::map<core::Symbol, double>& current_prices) const {
        return cash_ + positionsValue(current_prices);
    }

    const std::vector<PortfolioState>& Portfolio::getEquityCurve() const {
        return equity_curve_;
    }

    const std::vector<core::Trade>& Portfolio::getTradeLog() const {
        return trade_log_;
    }

    void Portfolio::recordTimestampValue(core::Timestamp timestamp, const std::map<core::Symbol, double>& current_prices) {
        if (!equity_curve_.empty() && equity_curve_.back().timestamp == timestamp) {
            return;
        }
        PortfolioState state;
        state.timestamp = timestamp;
        state.cash = cash_;
        state.positions_value = positionsValue(current_prices);
        state.total_equity = state.cash + state.positions_value;
        state.open_positions = static_cast<int>(positions_.size());
        equity_curve_.push_back(state);
    }

    bool Portfolio::recordTrade(core::Timestamp timestamp,
                                const core::Symbol& symbol,
                                core::SignalAction action,
                                long long quantity,
                                double execution_price,
                                double commission)
    {
        auto logger = core::logging::getLogger();
        if (quantity <= 0) {
            logger->warn("Attempted to record trade with zero or negative quantity: {}", quantity);
            return false;
        }
        if (!(execution_price > 0)) {
            logger->warn("Attempted to record trade in {} at non-positive price {}", symbol, execution_price);
            return false;
        }

        const long long current_qty = getPositionQuantity(symbol);
        long long position_change = 0;
        double cost = 0.0; // Net change in cash

        switch (action) {
            case core::SignalAction::EnterLong: {
                if (current_qty < 0) { logger->warn("Cannot EnterLong while Short in {}. Ignoring.", symbol); return false; }
                position_change = quantity;
                break;
            }
            case core::SignalAction::ExitLong: {
                if (current_qty <= 0) { logger->warn("Cannot ExitLong if not Long in {}. Ignoring.", symbol); return false; }
                if (quantity > current_qty) { quantity = current_qty; }
                position_change = -quantity;
                break;
            }
            case core::SignalAction::EnterShort: {
                if (current_qty > 0) { logger->warn("Cannot EnterShort while Long in {}. Ignoring.", symbol); return false; }
                position_change = -quantity;
                break;
            }
            case core::SignalAction::ExitShort: {
                if (current_qty >= 0) { logger->warn("Cannot ExitShort if not Short in {}. Ignoring.", symbol); return false; }
                if (quantity > -current_qty) { quantity = -current_qty; }
                position_change = quantity;
                break;
            }
            case core::SignalAction::None:
            default: {
                logger->warn("recordTrade called with invalid action: {}", core::utils::signalActionToString(action));
                return false;
            }
        }

        // Buying spends cash, selling raises it
        cost = -(static_cast<double>(position_change) * execution_price) - commission;

        if (cost < 0 && cash_ + cost < 0) {
            logger->error("Insufficient cash for trade in {}! Have: {:.2f}, Need: {:.2f}. Trade ignored.",
                          symbol, cash_, -cost);
            return false;
        }

        cash_ += cost;
        positions_[symbol] += position_change;
        execution_count_++;

        logger->debug("Trade Executed: Time={}, Sym={}, Action={}, Qty={}, Price={:.2f}, Comm={:.2f}, NewCash={:.2f}, NewPosQty={}",
                      core::utils::timestampToString(timestamp),
                      symbol,
                      core::utils::signalActionToString(action),
                      position_change,
                      execution_price,
                      commission,
                      cash_,
                      getPositionQuantity(symbol));

        if (action == core::SignalAction::EnterLong || action == core::SignalAction::EnterShort) {
            openOrAdd(timestamp, symbol, position_change, execution_price, commission);
        } else {
            closeOut(timestamp, symbol, quantity, execution_price, commission);
        }

        if (positions_[symbol] == 0) {
            positions_.erase(symbol);
            open_positions_info_.erase(symbol);
        }
        return true;
    }

    void Portfolio::openOrAdd(core::Timestamp timestamp, const core::Symbol& symbol, long long signed_quantity,
                              double price, double commission) {
        auto it = open_positions_info_.find(symbol);
        if (it == open_positions_info_.end()) {
            OpenPositionInfo entry_info;
            entry_info.entry_time = timestamp;
            entry_info.entry_price = price;
            entry_info.entry_quantity = signed_quantity;
            entry_info.entry_commission = commission;
            open_positions_info_[symbol] = entry_info;
            core::logging::getLogger()->trace("Entry info recorded for {}. Qty: {}, Price: {:.2f}",
                                              symbol, signed_quantity, price);
            return;
        }

        // Adding to an open position averages the entry price
        auto& info = it->second;
        const double old_abs = static_cast<double>(std::llabs(info.entry_quantity));
        const double add_abs = static_cast<double>(std::llabs(signed_quantity));
        info.entry_price = (info.entry_price * old_abs + price * add_abs) / (old_abs + add_abs);
        info.entry_quantity += signed_quantity;
        info.entry_commission += commission;
    }

    void Portfolio::closeOut(core::Timestamp timestamp, const core::Symbol& symbol, long long closed_quantity,
                             double price, double commission) {
        auto logger = core::logging::getLogger();
        auto it = open_positions_info_.find(symbol);
        if (it == open_positions_info_.end()) {
            logger->warn("Exited position for {} but no entry info found.", symbol);
            return;
        }
        auto& info = it->second;
        const long long open_abs = std::llabs(info.entry_quantity);
        const double fraction = static_cast<double>(closed_quantity) / static_cast<double>(open_abs);
        const double entry_commission = info.entry_commission * fraction;
        const bool was_long = info.entry_quantity > 0;

        core::Trade trade;
        trade.symbol = symbol;
        trade.entry_action = was_long ? core::SignalAction::EnterLong : core::SignalAction::EnterShort;
        trade.entry_time = info.entry_time;
        trade.exit_time = timestamp;
        trade.quantity = was_long ? closed_quantity : -closed_quantity;
        trade.entry_price = info.entry_price;
        trade.exit_price = price;
        trade.commission = entry_commission + commission;

        const double entry_value = static_cast<double>(closed_quantity) * info.entry_price;
        const double exit_value = static_cast<double>(closed_quantity) * price;
        trade.pnl = (was_long ? exit_value - entry_value : entry_value - exit_value) - trade.commission;
        trade.return_pct = (entry_value != 0) ? trade.pnl / std::abs(entry_value) : 0.0;

        trade_log_.push_back(trade);
        logger->debug("Round Trip Trade Logged: {} qty {} PnL = {:.2f}", symbol, trade.quantity, trade.pnl);

        info.entry_quantity += was_long ? -closed_quantity : closed_quantity;
        info.entry_commission -= entry_commission;
    }

} // namespace backtester
