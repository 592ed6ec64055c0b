#include "universe_selector.hpp"
#include "logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace strategy_engine {

UniverseSelector::UniverseSelector(double min_price, double max_price, int universe_size)
    : min_price_(min_price), max_price_(max_price), universe_size_(universe_size)
{
    if (min_price_ < 0.0 || min_price_ > max_price_) {
        throw std::invalid_argument("UniverseSelector price band is invalid.");
    }
    if (universe_size_ <= 0) {
        throw std::invalid_argument("UniverseSelector universe size must be positive.");
    }
}

bool UniverseSelector::passesFilter(const core::CoarseFundamental& row) const {
    return row.has_fundamental_data &&
           row.adjusted_price >= min_price_ &&
           row.adjusted_price <= max_price_;
}

std::vector<core::Symbol> UniverseSelector::select(const std::vector<core::CoarseFundamental>& snapshot) const {
    auto logger = core::logging::getLogger();

    std::vector<const core::CoarseFundamental*> eligible;
    eligible.reserve(snapshot.size());
    for (const auto& row : snapshot) {
        if (passesFilter(row)) {
            eligible.push_back(&row);
        }
    }

    std::stable_sort(eligible.begin(), eligible.end(),
        [](const core::CoarseFundamental* a, const core::CoarseFundamental* b) {
            return a->getDollarVolume() > b->getDollarVolume();
        });

    size_t keep = std::min(eligible.size(), static_cast<size_t>(universe_size_));
    std::vector<core::Symbol> selected;
    selected.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        selected.push_back(eligible[i]->symbol);
    }

    logger->debug("Universe selection: {} rows, {} eligible, {} selected.", snapshot.size(), eligible.size(), selected.size());
    return selected;
}

} // namespace strategy_engine
