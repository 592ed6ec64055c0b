#pragma once

#include <stdexcept>
#include <string>

namespace core {

    class StreakFadeException : public std::runtime_error {
    public:
        explicit StreakFadeException(const std::string& message)
            : std::runtime_error(message) {}

        explicit StreakFadeException(const char* message)
            : std::runtime_error(message) {}
    };

    // Specific exception types
    class ConfigException : public StreakFadeException {
    public: using StreakFadeException::StreakFadeException; };

    class DataLoadException : public StreakFadeException {
    public: using StreakFadeException::StreakFadeException; };

    class IndicatorCalculationException : public StreakFadeException {
    public: using StreakFadeException::StreakFadeException; };

    class BacktestException : public StreakFadeException {
    public: using StreakFadeException::StreakFadeException; };

} // namespace core
