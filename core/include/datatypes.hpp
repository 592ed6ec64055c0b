#pragma once

#include <string>
#include <vector>
#include <chrono> // For timestamps
#include <optional>

namespace core {

    // Using system_clock for time points; all timestamps are treated as UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // Opaque ticker identifier as issued by the universe provider
    using Symbol = std::string;


    struct Candle {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // One row of the daily coarse universe snapshot
    struct CoarseFundamental {
        Symbol symbol;
        double adjusted_price = 0.0;
        long long volume = 0;
        std::optional<double> dollar_volume; // Falls back to price * volume when absent
        bool has_fundamental_data = false;

        double getDollarVolume() const {
            return dollar_volume ? *dollar_volume : adjusted_price * static_cast<double>(volume);
        }
    };

    enum class SignalAction {
        None,
        EnterLong,
        ExitLong,
        EnterShort,
        ExitShort
    };

    struct Trade {
        Symbol symbol;
        core::SignalAction entry_action = core::SignalAction::None; // EnterLong or EnterShort
        core::Timestamp entry_time;
        core::Timestamp exit_time;
        long long quantity = 0;         // Signed closed quantity (+long, -short)
        double entry_price = 0.0;
        double exit_price = 0.0;
        double commission = 0.0;      // Total commission (entry + exit)
        double pnl = 0.0;             // Profit or Loss for this trade
        double return_pct = 0.0;      // PnL / Entry Value
    };

    template<typename T>
    using TimeSeries = std::vector<T>; // Simple alias for now

} // namespace core
