// cli/src/main.cpp

#include <iostream>
#include <string>
#include <exception>
#include <memory>
#include <fstream>

#include "logging.hpp"
#include "exceptions.hpp"
#include "database_manager.hpp"
#include "csv_importer.hpp"
#include "indicators.hpp"
#include "backtester.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>

namespace {

    using json = nlohmann::json;

    void printUsage(const char* program) {
        std::cerr << "Usage:\n"
                  << "  " << program << " backtest <config.json>\n"
                  << "  " << program << " import-candles <db> <csv> [interval]\n"
                  << "  " << program << " import-fundamentals <db> <csv>\n";
    }

    json loadConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException("Failed to open config file: " + path);
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException("Failed to parse config file '" + path + "': " + e.what());
        }
    }

    // Opens the store and makes sure the tables exist
    void openDatabase(data::DatabaseManager& db_manager) {
        if (!db_manager.connect()) {
            throw core::DataLoadException("Database connection failed");
        }
        if (!db_manager.initializeSchema()) {
            throw core::DataLoadException("Database schema initialization failed");
        }
    }

    int runBacktest(const std::string& config_path) {
        auto logger = core::logging::getLogger();
        logger->info("Loading config from: {}", config_path);
        json config = loadConfig(config_path);

        backtester::BacktestSettings settings = backtester::BacktestSettings::fromJson(config);
        logger->info("Using SQLite database path: {}", settings.database);
        data::DatabaseManager db_manager(settings.database);
        openDatabase(db_manager);

        indicators::TaLibSession ta_session;
        backtester::Backtester the_backtester(db_manager);
        bool success = the_backtester.run(config);
        db_manager.disconnect();

        if (!success) {
            logger->error("---=== Backtest Run Failed ===---");
            return 1;
        }

        const auto& metrics = the_backtester.getMetrics();
        std::cout << "Final equity: " << metrics.final_equity
                  << "  Return: " << metrics.total_return_pct * 100.0 << "%"
                  << "  Max drawdown: " << metrics.max_drawdown_pct * 100.0 << "%"
                  << "  Round trips: " << metrics.round_trip_trades
                  << "  Avg holdings: " << metrics.avg_num_holdings << std::endl;
        logger->info("---=== Backtest Run Finished Successfully ===---");
        return 0;
    }

    int runImport(const std::string& command, const std::string& db_path, const std::string& csv_path,
                  const std::string& interval) {
        auto logger = core::logging::getLogger();
        data::DatabaseManager db_manager(db_path);
        openDatabase(db_manager);

        data::CsvImporter importer(db_manager);
        std::size_t rows = (command == "import-candles") ? importer.importCandles(csv_path, interval)
                                                         : importer.importFundamentals(csv_path);
        db_manager.disconnect();

        logger->info("{}: {} rows imported from {} into {}", command, rows, csv_path, db_path);
        std::cout << rows << " rows imported" << std::endl;
        return 0;
    }

} // end anonymous namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }
    const std::string command = argv[1];
    const bool is_backtest = command == "backtest" && argc == 3;
    const bool is_candles = command == "import-candles" && (argc == 4 || argc == 5);
    const bool is_fundamentals = command == "import-fundamentals" && argc == 4;
    if (!is_backtest && !is_candles && !is_fundamentals) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        core::logging::initialize("streak_fade_cli", spdlog::level::info, spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Streak fade CLI starting: {}", command);

        int rc = 0;
        if (is_backtest) {
            rc = runBacktest(argv[2]);
        } else {
            rc = runImport(command, argv[2], argv[3], argc == 5 ? argv[4] : "day");
        }

        logger->info("Streak fade CLI finished with code {}.", rc);
        return rc;

    } catch (const core::StreakFadeException& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }
}
