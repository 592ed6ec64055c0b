#include "streak_detector.hpp"
#include "returns_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace strategy_engine {

StreakDetector::StreakDetector(int window) : window_(window) {
    if (window_ <= 0) {
        throw std::invalid_argument("Streak window must be positive.");
    }
}

StreakCandidates StreakDetector::getStreakingSymbols(const std::vector<core::Symbol>& universe,
                                                     IHistoryService& history_service) const
{
    auto logger = core::logging::getLogger();
    if (universe.empty()) {
        logger->debug("Universe is empty, no streaks to look for.");
        return {};
    }

    PriceHistory history = history_service.getHistory(universe, window_ + 1, Resolution::Daily);
    if (!history.hasField("close")) {
        logger->warn("close field missing from history for {} symbols! returning empty candidate lists", universe.size());
        return {};
    }
    return classify(history);
}

StreakCandidates StreakDetector::classify(const PriceHistory& history) const {
    auto logger = core::logging::getLogger();
    StreakCandidates candidates;

    for (const auto& [symbol, closes] : alignCloses(history)) {
        int sum = 0;
        try {
            sum = signSum(closes);
        } catch (const core::IndicatorCalculationException& e) {
            logger->error("Skipping {}: {}", symbol, e.what());
            continue;
        }
        logger->trace("{}: {} closes, sign sum {}", symbol, closes.size(), sum);

        if (sum == window_) {
            candidates.shorts.push_back(symbol);
        } else if (sum == -window_) {
            candidates.longs.push_back(symbol);
        }
    }

    logger->debug("Streak detection (window {}): {} short candidates, {} long candidates.",
                  window_, candidates.shorts.size(), candidates.longs.size());
    return candidates;
}

std::map<core::Symbol, core::TimeSeries<double>> StreakDetector::alignCloses(const PriceHistory& history) {
    std::set<core::Timestamp> dates;
    for (const auto& [symbol, bars] : history.bars) {
        for (const auto& bar : bars) {
            dates.insert(bar.timestamp);
        }
    }
    std::vector<core::Timestamp> index(dates.begin(), dates.end());

    std::map<core::Symbol, core::TimeSeries<double>> aligned;
    for (const auto& [symbol, bars] : history.bars) {
        std::map<core::Timestamp, double> by_date;
        for (const auto& bar : bars) {
            by_date[bar.timestamp] = bar.close;
        }

        core::TimeSeries<double> series;
        series.reserve(index.size());
        double last = std::numeric_limits<double>::quiet_NaN();
        for (const auto& ts : index) {
            auto it = by_date.find(ts);
            if (it != by_date.end() && !std::isnan(it->second)) {
                last = it->second;
            }
            // Leading gaps have nothing to carry forward and become 0.0
            series.push_back(std::isnan(last) ? 0.0 : last);
        }
        aligned.emplace(symbol, std::move(series));
    }
    return aligned;
}

int StreakDetector::signSum(const core::TimeSeries<double>& closes) {
    indicators::ReturnsIndicator returns(1);
    returns.calculate(closes);

    int sum = 0;
    for (double r : returns.getResult()) {
        if (r > 0.0) {
            ++sum;
        } else if (r < 0.0) {
            --sum;
        }
    }
    return sum;
}

} // namespace strategy_engine
