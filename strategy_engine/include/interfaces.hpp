#pragma once

#include <vector>
#include <string>

#include "datatypes.hpp"
#include "common_types.hpp"

namespace strategy_engine {

    // --- History Service ---
    // Supplies recent daily bars for a symbol set
    class IHistoryService {
    public:
        virtual ~IHistoryService() = default;

        // Returns up to `bar_count` most recent completed bars per symbol. Symbols with no data
        // are absent from the result. The result may lack the close field entirely.
        virtual PriceHistory getHistory(const std::vector<core::Symbol>& symbols,
                                        int bar_count,
                                        Resolution resolution) = 0;
    };

    // --- Execution / Portfolio Service ---
    // Fire-and-forget order instructions
    class IExecutionService {
    public:
        virtual ~IExecutionService() = default;

        // Move the position in `symbol` to `fraction_of_equity` of total portfolio value
        // (negative for short)
        virtual void setTargetAllocation(const core::Symbol& symbol, double fraction_of_equity) = 0;

        // Close the whole position in `symbol`
        virtual void liquidate(const core::Symbol& symbol) = 0;
    };

    // --- Observability Sink ---
    // Best-effort metric samples
    class IMetricsSink {
    public:
        virtual ~IMetricsSink() = default;
        virtual void emitMetric(const std::string& series_name, double value) = 0;
    };

    // --- Strategy Interface ---
    // Callbacks a host driver invokes, in this order per trading day:
    // selectUniverse -> onUniverseChanged -> onSchedule
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name/ID of the strategy
        virtual std::string getName() const = 0;

        // Reset state before the first cycle
        virtual void initialize() = 0;

        // Coarse universe selection over the day's snapshot
        virtual std::vector<core::Symbol> selectUniverse(const std::vector<core::CoarseFundamental>& snapshot) = 0;

        // Membership changes after a universe rebuild
        virtual void onUniverseChanged(const UniverseChanges& changes) = 0;

        // Scheduled daily callback near market close
        virtual void onSchedule(core::Timestamp now) = 0;
    };

} // namespace strategy_engine
