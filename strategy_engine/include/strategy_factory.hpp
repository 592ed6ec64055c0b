#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "strategy_config.hpp"

namespace strategy_engine {

    using json = nlohmann::json; // Alias for convenience

    // Host-side collaborators handed to a strategy at construction
    struct StrategyServices {
        IHistoryService& history;
        IExecutionService& execution;
        IMetricsSink& metrics;
    };

    class StrategyFactory {
    public:
        // Parses and validates the "parameters" section. Absent keys keep their defaults.
        // Throws core::ConfigException.
        static StreakFadeConfig parseConfig(const json& config);

        // Builds the strategy named by "type". Throws core::ConfigException.
        static std::unique_ptr<IStrategy> createStrategy(const json& config, const StrategyServices& services);
    };

} // namespace strategy_engine
