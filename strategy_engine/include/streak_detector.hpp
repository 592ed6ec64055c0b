#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <map>
#include <vector>

namespace strategy_engine {

    // Finds symbols whose close-to-close return kept the same sign on every one of the
    // last `window` days
    class StreakDetector {
    public:
        explicit StreakDetector(int window);

        int getWindow() const { return window_; }

        // Fetches window + 1 daily bars for the universe and classifies them.
        // A history without a close field yields empty lists.
        StreakCandidates getStreakingSymbols(const std::vector<core::Symbol>& universe,
                                             IHistoryService& history_service) const;

        // Classification over an already fetched history
        StreakCandidates classify(const PriceHistory& history) const;

        // Close series per symbol aligned on the union of bar dates: forward-filled,
        // then remaining gaps filled with 0.0
        static std::map<core::Symbol, core::TimeSeries<double>> alignCloses(const PriceHistory& history);

        // Sum of the signs (-1, 0, +1) of the day-over-day returns of `closes`
        static int signSum(const core::TimeSeries<double>& closes);

    private:
        int window_;
    };

} // namespace strategy_engine
