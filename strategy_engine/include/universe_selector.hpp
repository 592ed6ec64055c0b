#pragma once

#include "datatypes.hpp"
#include <vector>

namespace strategy_engine {

    // Coarse universe screen: price band and fundamental-data filter, ranked by dollar volume
    class UniverseSelector {
    public:
        UniverseSelector(double min_price, double max_price, int universe_size);

        // Top `universe_size` symbols by descending dollar volume among rows with
        // adjusted price in [min_price, max_price] and valid fundamental data.
        // Ties keep snapshot order.
        std::vector<core::Symbol> select(const std::vector<core::CoarseFundamental>& snapshot) const;

        bool passesFilter(const core::CoarseFundamental& row) const;

    private:
        double min_price_;
        double max_price_;
        int universe_size_;
    };

} // namespace strategy_engine
