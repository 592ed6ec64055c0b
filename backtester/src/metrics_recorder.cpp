#include "metrics_recorder.hpp"
#include "logging.hpp"
#include "utils.hpp"

namespace backtester {

    void MetricsRecorder::emitMetric(const std::string& series_name, double value) {
        series_[series_name].push_back(MetricSample{now_, value});
        core::logging::getLogger()->debug("Metric {} @ {} = {}", series_name,
                                          core::utils::timestampToDateString(now_), value);
    }

    const std::vector<MetricSample>& MetricsRecorder::getSeries(const std::string& series_name) const {
        static const std::vector<MetricSample> empty;
        auto it = series_.find(series_name);
        return it != series_.end() ? it->second : empty;
    }

    std::vector<std::string> MetricsRecorder::getSeriesNames() const {
        std::vector<std::string> names;
        names.reserve(series_.size());
        for (const auto& entry : series_) {
            names.push_back(entry.first);
        }
        return names;
    }

    double MetricsRecorder::average(const std::string& series_name) const {
        const auto& samples = getSeries(series_name);
        if (samples.empty()) {
            return 0.0;
        }
        double sum = 0.0;
        for (const auto& sample : samples) {
            sum += sample.value;
        }
        return sum / static_cast<double>(samples.size());
    }

} // namespace backtester
