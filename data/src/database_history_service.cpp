#include "database_history_service.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <utility>

namespace data {

DatabaseHistoryService::DatabaseHistoryService(DatabaseManager& db_manager, std::string interval)
    : db_manager_(db_manager), interval_(std::move(interval)) {}

strategy_engine::PriceHistory DatabaseHistoryService::getHistory(const std::vector<core::Symbol>& symbols,
                                                                 int bar_count,
                                                                 strategy_engine::Resolution resolution) {
    auto logger = core::logging::getLogger();
    strategy_engine::PriceHistory history;
    if (symbols.empty() || bar_count <= 0) {
        return history;
    }

    const auto days = db_manager_.queryTradingDaysBefore(interval_, current_time_, bar_count);
    if (days.empty()) {
        logger->debug("No {} history before {}.", strategy_engine::toString(resolution),
                      core::utils::timestampToString(current_time_));
        return history;
    }

    for (const auto& symbol : symbols) {
        auto candles = db_manager_.queryCandles(symbol, interval_, days.front(), days.back());
        if (!candles.empty()) {
            history.bars.emplace(symbol, std::move(candles));
        }
    }

    if (history.bars.empty()) {
        logger->debug("History request for {} symbols over {} days returned no rows.", symbols.size(), days.size());
        return history;
    }

    history.fields = {"open", "high", "low", "close", "volume"};
    logger->trace("History for {} of {} symbols, {} days ending {}.", history.bars.size(), symbols.size(),
                  days.size(), core::utils::timestampToDateString(days.back()));
    return history;
}

} // namespace data
