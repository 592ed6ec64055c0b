#include "common_types.hpp"
#include <algorithm>

namespace strategy_engine {

    bool PriceHistory::hasField(const std::string& field) const {
        return std::find(fields.begin(), fields.end(), field) != fields.end();
    }

    const char* toString(Resolution resolution) {
        switch (resolution) {
            case Resolution::Daily: return "Daily";
        }
        return "Unknown";
    }

} // namespace strategy_engine
