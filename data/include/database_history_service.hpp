#pragma once

#include <string>
#include <vector>

#include "database_manager.hpp"
#include "interfaces.hpp"

namespace data {

// Serves daily history out of the candle store as seen from the host's current time
class DatabaseHistoryService : public strategy_engine::IHistoryService {
public:
    DatabaseHistoryService(DatabaseManager& db_manager, std::string interval);

    // Bars on or after `now` are never returned
    void setCurrentTime(core::Timestamp now) { current_time_ = now; }
    core::Timestamp getCurrentTime() const { return current_time_; }

    strategy_engine::PriceHistory getHistory(const std::vector<core::Symbol>& symbols,
                                             int bar_count,
                                             strategy_engine::Resolution resolution) override;

private:
    DatabaseManager& db_manager_; // Not owned
    std::string interval_;
    core::Timestamp current_time_{};
};

} // namespace data
