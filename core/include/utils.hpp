#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 UTC string (YYYY-MM-DDTHH:MM:SSZ)
    std::string timestampToString(const Timestamp& ts);

    // ISO 8601 string with 'Z' or +HH:MM/-HH:MM offset -> Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // YYYY-MM-DD -> midnight UTC of that day
    Timestamp dateToTimestamp(const std::string& date);

    // Timestamp -> YYYY-MM-DD (UTC calendar day)
    std::string timestampToDateString(const Timestamp& ts);

    std::string signalActionToString(SignalAction action);

} // namespace utils
} // namespace core
