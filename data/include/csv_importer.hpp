#pragma once

#include <cstddef>
#include <string>

#include "database_manager.hpp"

namespace data {

// Loads daily candles and coarse universe snapshots from CSV files into the store.
// A header row is optional. Malformed lines are logged and skipped.
class CsvImporter {
public:
    explicit CsvImporter(DatabaseManager& db_manager);

    // symbol,date,open,high,low,close,volume
    // Returns the number of rows parsed. Throws core::DataLoadException if the file
    // cannot be read or the store rejects a batch.
    std::size_t importCandles(const std::string& csv_path, const std::string& interval = "day");

    // symbol,date,adjusted_price,volume[,has_fundamental_data[,dollar_volume]]
    // has_fundamental_data defaults to true when the column is absent.
    std::size_t importFundamentals(const std::string& csv_path);

private:
    DatabaseManager& db_manager_; // Not owned
};

} // namespace data
