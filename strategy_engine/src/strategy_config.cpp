#include "strategy_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    void StreakFadeConfig::validate() const {
        if (name.empty()) {
            throw core::ConfigException("Strategy name cannot be empty.");
        }
        if (streak_window < 1) {
            throw core::ConfigException(fmt::format("streak_window must be >= 1 (got {}).", streak_window));
        }
        if (!(allocation_pct > 0.0 && allocation_pct <= 1.0)) {
            throw core::ConfigException(fmt::format("allocation_pct must be in (0, 1] (got {}).", allocation_pct));
        }
        if (max_holding_period < 1) {
            throw core::ConfigException(fmt::format("max_holding_period must be >= 1 (got {}).", max_holding_period));
        }
        if (universe_size < 1) {
            throw core::ConfigException(fmt::format("universe_size must be >= 1 (got {}).", universe_size));
        }
        if (min_price < 0.0 || min_price > max_price) {
            throw core::ConfigException(fmt::format("Price band [{}, {}] is invalid.", min_price, max_price));
        }
        if (holdings_series.empty()) {
            throw core::ConfigException("holdings_series cannot be empty.");
        }
    }

} // namespace strategy_engine
