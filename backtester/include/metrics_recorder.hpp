#pragma once

#include <map>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "interfaces.hpp"

namespace backtester {

    struct MetricSample {
        core::Timestamp timestamp;
        double value = 0.0;
    };

    // Keeps every sample a strategy emits, stamped with the simulation clock
    class MetricsRecorder : public strategy_engine::IMetricsSink {
    public:
        void setCurrentTime(core::Timestamp now) { now_ = now; }

        void emitMetric(const std::string& series_name, double value) override;

        // Empty when the series was never emitted
        const std::vector<MetricSample>& getSeries(const std::string& series_name) const;
        std::vector<std::string> getSeriesNames() const;

        // Mean of a series, 0 when empty
        double average(const std::string& series_name) const;

    private:
        core::Timestamp now_{};
        std::map<std::string, std::vector<MetricSample>> series_;
    };

} // namespace backtester
