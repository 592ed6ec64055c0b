#pragma once
#include "datatypes.hpp"
#include <map>
#include <string>
#include <vector>

namespace strategy_engine {

    // History bar granularity requested from the history service
    enum class Resolution {
        Daily
    };

    // Per-symbol age in rebalance cycles of every open position
    using Holdings = std::map<core::Symbol, int>;

    // Output of streak detection. The two lists are disjoint.
    struct StreakCandidates {
        std::vector<core::Symbol> shorts; // streaked up every day -> fade by shorting
        std::vector<core::Symbol> longs;  // streaked down every day -> fade by buying
    };

    // Membership changes reported by the universe provider after a rebuild
    struct UniverseChanges {
        std::vector<core::Symbol> added;
        std::vector<core::Symbol> removed;
    };

    // Daily history as returned by the history service.
    // `fields` lists the price fields present; an empty result has none.
    struct PriceHistory {
        std::vector<std::string> fields;
        std::map<core::Symbol, core::TimeSeries<core::Candle>> bars;

        bool hasField(const std::string& field) const;
    };

    // What one rebalance cycle did
    struct RebalanceSummary {
        std::vector<core::Symbol> liquidated;
        std::vector<core::Symbol> shorted;
        std::vector<core::Symbol> bought;
    };

    const char* toString(Resolution resolution);

} // namespace strategy_engine
