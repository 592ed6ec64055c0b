#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp" // For timestampToString/stringToTimestamp
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace data
{

    namespace
    {

        // Finalizes a prepared statement on scope exit
        struct StatementGuard
        {
            sqlite3_stmt *stmt = nullptr;
            ~StatementGuard() { sqlite3_finalize(stmt); }
        };

        bool bindText(sqlite3_stmt *stmt, int index, const std::string &value)
        {
            // SQLITE_TRANSIENT: value may be a temporary
            return sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
        }

        bool bindDouble(sqlite3_stmt *stmt, int index, double value)
        {
            return sqlite3_bind_double(stmt, index, value) == SQLITE_OK;
        }

        bool bindInt64(sqlite3_stmt *stmt, int index, long long value)
        {
            return sqlite3_bind_int64(stmt, index, value) == SQLITE_OK;
        }

        core::Candle readCandle(sqlite3_stmt *stmt, int first_column)
        {
            core::Candle candle;
            const unsigned char *ts_text = sqlite3_column_text(stmt, first_column);
            if (!ts_text)
            {
                throw std::runtime_error("NULL timestamp in candle row");
            }
            candle.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char *>(ts_text));
            candle.open = sqlite3_column_double(stmt, first_column + 1);
            candle.high = sqlite3_column_double(stmt, first_column + 2);
            candle.low = sqlite3_column_double(stmt, first_column + 3);
            candle.close = sqlite3_column_double(stmt, first_column + 4);
            candle.volume = sqlite3_column_int64(stmt, first_column + 5);
            return candle;
        }

    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Close handle even if open failed (as per docs)
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (connected_)
        {
            core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
            int rc = sqlite3_close(db_);
            if (rc != SQLITE_OK)
            {
                // Usually un-finalized prepared statements
                core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
            }
            db_ = nullptr;
            connected_ = false;
        }
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg); // Must free error message memory
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_candles_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_candles (
            symbol TEXT,
            interval TEXT,
            timestamp TEXT, -- ISO8601 UTC, e.g. 2020-01-02T00:00:00Z
            open REAL,
            high REAL,
            low REAL,
            close REAL,
            volume INTEGER,
            PRIMARY KEY (symbol, interval, timestamp)
        );
    )";
        // Trading-day enumeration scans by interval and timestamp across symbols
        const std::string create_candles_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_candles_interval_timestamp
        ON historical_candles (interval, timestamp);
     )";

        const std::string create_fundamentals_sql = R"(
        CREATE TABLE IF NOT EXISTS coarse_fundamentals (
            symbol TEXT,
            as_of TEXT,
            adjusted_price REAL,
            volume INTEGER,
            dollar_volume REAL, -- NULL means price * volume
            has_fundamental_data INTEGER,
            PRIMARY KEY (symbol, as_of)
        );
    )";
        const std::string create_fundamentals_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_fundamentals_as_of
        ON coarse_fundamentals (as_of);
     )";

        bool success = true;
        success &= executeSQL(create_candles_sql);
        success &= executeSQL(create_candles_index_sql);
        success &= executeSQL(create_fundamentals_sql);
        success &= executeSQL(create_fundamentals_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    core::TimeSeries<core::Candle> DatabaseManager::queryCandles(
        const core::Symbol &symbol,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::TimeSeries<core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        std::string start_str = core::utils::timestampToString(start_time);
        std::string end_str = core::utils::timestampToString(end_time);
        logger->trace("Querying candles for {} ({}) between '{}' and '{}'", symbol, interval, start_str, end_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE symbol = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            return candles;
        }

        if (!(bindText(guard.stmt, 1, symbol) && bindText(guard.stmt, 2, interval) &&
              bindText(guard.stmt, 3, start_str) && bindText(guard.stmt, 4, end_str)))
        {
            logger->error("Failed to bind candle query parameters: {}", sqlite3_errmsg(db_));
            return candles;
        }

        int row_count = 0;
        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            row_count++;
            try
            {
                candles.push_back(readCandle(guard.stmt, 0));
            }
            catch (const std::exception &e)
            {
                logger->warn("Skipping candle row {} for {}: {}", row_count, symbol, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through candle query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        return candles;
    }

    std::vector<core::Timestamp> DatabaseManager::collectTimestamps(sqlite3_stmt *stmt, const char *what)
    {
        auto logger = core::logging::getLogger();
        std::vector<core::Timestamp> timestamps;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text)
            {
                continue;
            }
            try
            {
                timestamps.push_back(core::utils::stringToTimestamp(reinterpret_cast<const char *>(ts_text)));
            }
            catch (const std::exception &e)
            {
                logger->warn("Skipping unparsable timestamp in {}: {}", what, e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through {} [{}]: {}", what, rc, sqlite3_errmsg(db_));
        }
        return timestamps;
    }

    std::vector<core::Timestamp> DatabaseManager::queryTradingDays(const std::string &interval,
                                                                   core::Timestamp start_time,
                                                                   core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query trading days: Not connected to database.");
            return {};
        }

        const char *sql = R"(
            SELECT DISTINCT timestamp
            FROM historical_candles
            WHERE interval = ? AND timestamp >= ? AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare trading day query [{}]: {}", rc, sqlite3_errmsg(db_));
            return {};
        }
        if (!(bindText(guard.stmt, 1, interval) &&
              bindText(guard.stmt, 2, core::utils::timestampToString(start_time)) &&
              bindText(guard.stmt, 3, core::utils::timestampToString(end_time))))
        {
            logger->error("Failed to bind trading day query parameters: {}", sqlite3_errmsg(db_));
            return {};
        }
        return collectTimestamps(guard.stmt, "trading days");
    }

    std::vector<core::Timestamp> DatabaseManager::queryTradingDaysBefore(const std::string &interval,
                                                                         core::Timestamp before,
                                                                         int count)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query trading days: Not connected to database.");
            return {};
        }
        if (count <= 0)
        {
            return {};
        }

        const char *sql = R"(
            SELECT DISTINCT timestamp
            FROM historical_candles
            WHERE interval = ? AND timestamp < ?
            ORDER BY timestamp DESC
            LIMIT ?;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare trading day query [{}]: {}", rc, sqlite3_errmsg(db_));
            return {};
        }
        if (!(bindText(guard.stmt, 1, interval) &&
              bindText(guard.stmt, 2, core::utils::timestampToString(before)) &&
              bindInt64(guard.stmt, 3, count)))
        {
            logger->error("Failed to bind trading day query parameters: {}", sqlite3_errmsg(db_));
            return {};
        }

        std::vector<core::Timestamp> days = collectTimestamps(guard.stmt, "trading days");
        std::reverse(days.begin(), days.end());
        return days;
    }

    std::map<core::Symbol, core::Candle> DatabaseManager::queryCandlesAt(const std::string &interval,
                                                                         core::Timestamp timestamp)
    {
        std::map<core::Symbol, core::Candle> candles;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query candles: Not connected to database.");
            return candles;
        }

        const char *sql = R"(
            SELECT symbol, timestamp, open, high, low, close, volume
            FROM historical_candles
            WHERE interval = ? AND timestamp = ?;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare daily candle query [{}]: {}", rc, sqlite3_errmsg(db_));
            return candles;
        }
        if (!(bindText(guard.stmt, 1, interval) &&
              bindText(guard.stmt, 2, core::utils::timestampToString(timestamp))))
        {
            logger->error("Failed to bind daily candle query parameters: {}", sqlite3_errmsg(db_));
            return candles;
        }

        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            const unsigned char *symbol_text = sqlite3_column_text(guard.stmt, 0);
            if (!symbol_text)
            {
                continue;
            }
            try
            {
                candles[reinterpret_cast<const char *>(symbol_text)] = readCandle(guard.stmt, 1);
            }
            catch (const std::exception &e)
            {
                logger->warn("Skipping daily candle row for {}: {}", reinterpret_cast<const char *>(symbol_text), e.what());
            }
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through daily candle results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        return candles;
    }

    std::vector<core::CoarseFundamental> DatabaseManager::queryCoarseSnapshot(core::Timestamp as_of)
    {
        std::vector<core::CoarseFundamental> rows;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query coarse snapshot: Not connected to database.");
            return rows;
        }

        const char *sql = R"(
            SELECT symbol, adjusted_price, volume, dollar_volume, has_fundamental_data
            FROM coarse_fundamentals
            WHERE as_of = ?
            ORDER BY symbol ASC;
        )";

        StatementGuard guard;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare coarse snapshot query [{}]: {}", rc, sqlite3_errmsg(db_));
            return rows;
        }
        if (!bindText(guard.stmt, 1, core::utils::timestampToString(as_of)))
        {
            logger->error("Failed to bind coarse snapshot query parameters: {}", sqlite3_errmsg(db_));
            return rows;
        }

        while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW)
        {
            const unsigned char *symbol_text = sqlite3_column_text(guard.stmt, 0);
            if (!symbol_text)
            {
                continue;
            }
            core::CoarseFundamental row;
            row.symbol = reinterpret_cast<const char *>(symbol_text);
            row.adjusted_price = sqlite3_column_double(guard.stmt, 1);
            row.volume = sqlite3_column_int64(guard.stmt, 2);
            if (sqlite3_column_type(guard.stmt, 3) != SQLITE_NULL)
            {
                row.dollar_volume = sqlite3_column_double(guard.stmt, 3);
            }
            row.has_fundamental_data = sqlite3_column_int(guard.stmt, 4) != 0;
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through coarse snapshot results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        return rows;
    }

    bool DatabaseManager::saveCandles(const core::TimeSeries<core::Candle> &candles,
                                      const core::Symbol &symbol,
                                      const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save candles: Not connected to database.");
            return false;
        }
        if (candles.empty())
        {
            logger->debug("No candles provided to save for {} ({}).", symbol, interval);
            return true; // Nothing to do, report success
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_candles
(symbol, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving candles.");
            return false;
        }

        bool success = true;
        int saved_count = 0;
        {
            StatementGuard guard;
            int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
            }

            for (const auto &candle : candles)
            {
                if (!success)
                {
                    break;
                }
                bool bound = bindText(guard.stmt, 1, symbol) &&
                             bindText(guard.stmt, 2, interval) &&
                             bindText(guard.stmt, 3, core::utils::timestampToString(candle.timestamp)) &&
                             bindDouble(guard.stmt, 4, candle.open) &&
                             bindDouble(guard.stmt, 5, candle.high) &&
                             bindDouble(guard.stmt, 6, candle.low) &&
                             bindDouble(guard.stmt, 7, candle.close) &&
                             bindInt64(guard.stmt, 8, candle.volume);
                if (!bound || (rc = sqlite3_step(guard.stmt)) != SQLITE_DONE)
                {
                    logger->error("Failed to insert candle for {}: {}", symbol, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                if (sqlite3_changes(db_) > 0)
                {
                    saved_count++;
                }
                if (sqlite3_reset(guard.stmt) != SQLITE_OK)
                {
                    logger->error("Failed to reset prepared statement: {}", sqlite3_errmsg(db_));
                    success = false;
                }
            }
        } // statement finalized before commit/rollback

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving candles.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger->info("Saved {} new candles (duplicates ignored) for {} ({}).", saved_count, symbol, interval);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during candle save for {} ({}).", symbol, interval);
        }
        return success;
    }

    bool DatabaseManager::saveCoarseFundamentals(const std::vector<core::CoarseFundamental> &rows,
                                                 core::Timestamp as_of)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save coarse fundamentals: Not connected to database.");
            return false;
        }
        if (rows.empty())
        {
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO coarse_fundamentals
(symbol, as_of, adjusted_price, volume, dollar_volume, has_fundamental_data)
VALUES (?, ?, ?, ?, ?, ?);
)";

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving coarse fundamentals.");
            return false;
        }

        const std::string as_of_str = core::utils::timestampToString(as_of);
        bool success = true;
        int saved_count = 0;
        {
            StatementGuard guard;
            int rc = sqlite3_prepare_v2(db_, sql, -1, &guard.stmt, nullptr);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
            }

            for (const auto &row : rows)
            {
                if (!success)
                {
                    break;
                }
                bool bound = bindText(guard.stmt, 1, row.symbol) &&
                             bindText(guard.stmt, 2, as_of_str) &&
                             bindDouble(guard.stmt, 3, row.adjusted_price) &&
                             bindInt64(guard.stmt, 4, row.volume) &&
                             (row.dollar_volume ? bindDouble(guard.stmt, 5, *row.dollar_volume)
                                                : sqlite3_bind_null(guard.stmt, 5) == SQLITE_OK) &&
                             bindInt64(guard.stmt, 6, row.has_fundamental_data ? 1 : 0);
                if (!bound || (rc = sqlite3_step(guard.stmt)) != SQLITE_DONE)
                {
                    logger->error("Failed to insert coarse row for {}: {}", row.symbol, sqlite3_errmsg(db_));
                    success = false;
                    break;
                }
                if (sqlite3_changes(db_) > 0)
                {
                    saved_count++;
                }
                if (sqlite3_reset(guard.stmt) != SQLITE_OK)
                {
                    logger->error("Failed to reset prepared statement: {}", sqlite3_errmsg(db_));
                    success = false;
                }
            }
        }

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving coarse fundamentals.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger->debug("Saved {} coarse rows for {}.", saved_count, core::utils::timestampToDateString(as_of));
        }
        return success;
    }

} // namespace data
