#pragma once

#include <string>
#include <vector>
#include <map>

#include <sqlite3.h> // Standard C header

#include "datatypes.hpp"

namespace data {

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    // Owns the raw connection handle
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates historical_candles and coarse_fundamentals if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; duplicates on the primary key are skipped
    bool saveCandles(const core::TimeSeries<core::Candle>& candles,
                     const core::Symbol& symbol,
                     const std::string& interval);

    bool saveCoarseFundamentals(const std::vector<core::CoarseFundamental>& rows,
                                core::Timestamp as_of);

    // Candles for one symbol with start_time <= timestamp <= end_time, ascending
    core::TimeSeries<core::Candle> queryCandles(
        const core::Symbol& symbol,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

    // Distinct bar timestamps within [start_time, end_time], ascending
    std::vector<core::Timestamp> queryTradingDays(const std::string& interval,
                                                  core::Timestamp start_time,
                                                  core::Timestamp end_time);

    // The last `count` distinct bar timestamps strictly before `before`, ascending
    std::vector<core::Timestamp> queryTradingDaysBefore(const std::string& interval,
                                                        core::Timestamp before,
                                                        int count);

    // Every symbol's candle at exactly `timestamp`
    std::map<core::Symbol, core::Candle> queryCandlesAt(const std::string& interval,
                                                        core::Timestamp timestamp);

    // The coarse universe snapshot recorded for `as_of`, in symbol order
    std::vector<core::CoarseFundamental> queryCoarseSnapshot(core::Timestamp as_of);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr; // SQLite database connection handle
    bool connected_ = false;

    std::vector<core::Timestamp> collectTimestamps(sqlite3_stmt* stmt, const char* what);
};

} // namespace data
