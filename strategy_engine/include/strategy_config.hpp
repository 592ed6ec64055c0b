#pragma once

#include <string>

namespace strategy_engine {

    struct StreakFadeConfig {
        std::string name = "BetAgainstStreaks";
        int streak_window = 5;          // how many days in a row to fade
        double allocation_pct = 0.01;   // fraction of equity per trade
        int max_holding_period = 5;     // cycles before forced liquidation
        int universe_size = 100;        // max number of coarse symbols to keep
        double min_price = 5.0;         // adjusted price band
        double max_price = 1000.0;
        std::string holdings_series = "NumHoldings";

        // Throws core::ConfigException on the first invalid field
        void validate() const;
    };

} // namespace strategy_engine
