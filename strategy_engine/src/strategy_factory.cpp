#include "strategy_factory.hpp"
#include "streak_fade_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"

#include <string>
#include <memory>
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

    namespace { // file-local helpers

        const char* const kStreakFadeType = "StreakFade";

        int readInt(const json& params, const char* key, int fallback) {
            if (!params.contains(key)) return fallback;
            const json& value = params[key];
            if (!value.is_number_integer()) {
                throw core::ConfigException(fmt::format("Parameter '{}' must be an integer.", key));
            }
            return value.get<int>();
        }

        double readDouble(const json& params, const char* key, double fallback) {
            if (!params.contains(key)) return fallback;
            const json& value = params[key];
            if (!value.is_number()) {
                throw core::ConfigException(fmt::format("Parameter '{}' must be a number.", key));
            }
            return value.get<double>();
        }

        std::string readString(const json& params, const char* key, const std::string& fallback) {
            if (!params.contains(key)) return fallback;
            const json& value = params[key];
            if (!value.is_string()) {
                throw core::ConfigException(fmt::format("Parameter '{}' must be a string.", key));
            }
            return value.get<std::string>();
        }

    } // end anonymous namespace

    StreakFadeConfig StrategyFactory::parseConfig(const json& config) {
        if (!config.is_object()) {
            throw core::ConfigException("Strategy config must be a JSON object.");
        }

        StreakFadeConfig parsed;
        parsed.name = readString(config, "name", parsed.name);

        std::string type = readString(config, "type", kStreakFadeType);
        if (type != kStreakFadeType) {
            throw core::ConfigException(fmt::format("Unknown strategy type '{}'.", type));
        }

        if (config.contains("parameters")) {
            const json& params = config["parameters"];
            if (!params.is_object()) {
                throw core::ConfigException("'parameters' must be a JSON object.");
            }
            parsed.streak_window = readInt(params, "streak_window", parsed.streak_window);
            parsed.allocation_pct = readDouble(params, "allocation_pct", parsed.allocation_pct);
            parsed.max_holding_period = readInt(params, "max_holding_period", parsed.max_holding_period);
            parsed.universe_size = readInt(params, "universe_size", parsed.universe_size);
            parsed.min_price = readDouble(params, "min_price", parsed.min_price);
            parsed.max_price = readDouble(params, "max_price", parsed.max_price);
            parsed.holdings_series = readString(params, "holdings_series", parsed.holdings_series);
        }

        parsed.validate();
        return parsed;
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const json& config, const StrategyServices& services) {
        auto logger = core::logging::getLogger();
        logger->info("Attempting to create strategy from JSON config...");

        StreakFadeConfig parsed = parseConfig(config);
        logger->info("Creating {} strategy instance for '{}'", kStreakFadeType, parsed.name);
        auto strategy = std::make_unique<StreakFadeStrategy>(std::move(parsed),
                                                             services.history,
                                                             services.execution,
                                                             services.metrics);
        logger->info("Successfully created strategy: '{}'", strategy->getName());
        return strategy;
    }

} // namespace strategy_engine
