#include "csv_importer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

namespace {

    std::string trim(const std::string& str) {
        const auto first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    std::vector<std::string> split(const std::string& line, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            tokens.push_back(trim(token));
        }
        return tokens;
    }

    // Whole-token conversions; trailing garbage is an error
    double toDouble(const std::string& token) {
        std::size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument("not a number: " + token);
        }
        return value;
    }

    long long toInt64(const std::string& token) {
        std::size_t consumed = 0;
        // Volumes are sometimes exported as 1.2e6 or 1000.0
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument("not a number: " + token);
        }
        return static_cast<long long>(value);
    }

    bool toFlag(const std::string& token) {
        std::string lower = token;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "1" || lower == "true" || lower == "yes") return true;
        if (lower == "0" || lower == "false" || lower == "no") return false;
        throw std::invalid_argument("not a boolean: " + token);
    }

    bool isNumeric(const std::string& token) {
        try {
            toDouble(token);
            return true;
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return true;
        }
    }

    std::ifstream openOrThrow(const std::string& csv_path) {
        std::ifstream file(csv_path);
        if (!file.is_open()) {
            throw core::DataLoadException("Cannot open CSV file: " + csv_path);
        }
        return file;
    }

    // Walks non-empty data lines, skipping a non-numeric header on the first of them.
    // `parse` throws std::exception on a malformed line.
    template <typename ParseFn>
    std::size_t forEachRow(std::ifstream& file, const std::string& csv_path, std::size_t min_columns,
                           ParseFn parse) {
        auto logger = core::logging::getLogger();
        std::string line;
        std::size_t line_num = 0;
        std::size_t parsed = 0;
        std::size_t skipped = 0;
        bool first_row = true;

        while (std::getline(file, line)) {
            line_num++;
            if (trim(line).empty()) continue;

            auto tokens = split(line, ',');
            if (first_row) {
                first_row = false;
                if (tokens.size() >= 3 && !isNumeric(tokens[2])) {
                    logger->debug("Skipping header row in {}", csv_path);
                    continue;
                }
            }

            if (tokens.size() < min_columns) {
                logger->warn("{}:{}: expected at least {} columns, got {}. Skipping.", csv_path, line_num,
                             min_columns, tokens.size());
                skipped++;
                continue;
            }

            try {
                parse(tokens);
                parsed++;
            } catch (const std::exception& e) {
                logger->warn("{}:{}: {}. Skipping.", csv_path, line_num, e.what());
                skipped++;
            }
        }

        logger->info("Parsed {} rows from {} ({} skipped).", parsed, csv_path, skipped);
        return parsed;
    }

} // end anonymous namespace

CsvImporter::CsvImporter(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::size_t CsvImporter::importCandles(const std::string& csv_path, const std::string& interval) {
    auto file = openOrThrow(csv_path);
    std::map<core::Symbol, core::TimeSeries<core::Candle>> by_symbol;

    std::size_t parsed = forEachRow(file, csv_path, 7, [&](const std::vector<std::string>& tokens) {
        if (tokens[0].empty()) {
            throw std::invalid_argument("empty symbol");
        }
        core::Candle candle;
        candle.timestamp = core::utils::dateToTimestamp(tokens[1]);
        candle.open = toDouble(tokens[2]);
        candle.high = toDouble(tokens[3]);
        candle.low = toDouble(tokens[4]);
        candle.close = toDouble(tokens[5]);
        candle.volume = toInt64(tokens[6]);
        by_symbol[tokens[0]].push_back(candle);
    });

    for (auto& [symbol, candles] : by_symbol) {
        std::sort(candles.begin(), candles.end());
        if (!db_manager_.saveCandles(candles, symbol, interval)) {
            throw core::DataLoadException("Failed to save candles for " + symbol + " from " + csv_path);
        }
    }
    core::logging::getLogger()->info("Imported candles for {} symbols from {}.", by_symbol.size(), csv_path);
    return parsed;
}

std::size_t CsvImporter::importFundamentals(const std::string& csv_path) {
    auto file = openOrThrow(csv_path);
    std::map<core::Timestamp, std::vector<core::CoarseFundamental>> by_day;

    std::size_t parsed = forEachRow(file, csv_path, 4, [&](const std::vector<std::string>& tokens) {
        if (tokens[0].empty()) {
            throw std::invalid_argument("empty symbol");
        }
        core::CoarseFundamental row;
        row.symbol = tokens[0];
        core::Timestamp as_of = core::utils::dateToTimestamp(tokens[1]);
        row.adjusted_price = toDouble(tokens[2]);
        row.volume = toInt64(tokens[3]);
        row.has_fundamental_data = tokens.size() > 4 && !tokens[4].empty() ? toFlag(tokens[4]) : true;
        if (tokens.size() > 5 && !tokens[5].empty()) {
            row.dollar_volume = toDouble(tokens[5]);
        }
        by_day[as_of].push_back(std::move(row));
    });

    for (const auto& [as_of, rows] : by_day) {
        if (!db_manager_.saveCoarseFundamentals(rows, as_of)) {
            throw core::DataLoadException("Failed to save coarse snapshot for " +
                                          core::utils::timestampToDateString(as_of) + " from " + csv_path);
        }
    }
    core::logging::getLogger()->info("Imported {} coarse snapshots from {}.", by_day.size(), csv_path);
    return parsed;
}

} // namespace data
