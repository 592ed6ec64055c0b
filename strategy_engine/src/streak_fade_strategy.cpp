#include "streak_fade_strategy.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <spdlog/fmt/ranges.h>

namespace strategy_engine {

namespace {

    StreakFadeConfig validated(StreakFadeConfig config) {
        config.validate();
        return config;
    }

} // end anonymous namespace

StreakFadeStrategy::StreakFadeStrategy(StreakFadeConfig config,
                                       IHistoryService& history,
                                       IExecutionService& execution,
                                       IMetricsSink& metrics)
    : config_(validated(std::move(config))),
      history_(history),
      execution_(execution),
      metrics_(metrics),
      selector_(config_.min_price, config_.max_price, config_.universe_size),
      detector_(config_.streak_window),
      state_(config_.max_holding_period)
{
    core::logging::getLogger()->debug("Strategy '{}' created.", config_.name);
}

std::string StreakFadeStrategy::getName() const { return config_.name; }

void StreakFadeStrategy::initialize() {
    state_.universe.clear();
    state_.holdings.clear();
    state_.plot_count = 0;
    core::logging::getLogger()->info(
        "Strategy '{}' initialized: window={}, allocation={:.2f}%, max_holding={}, universe_size={}, price band=[{:.2f}, {:.2f}]",
        config_.name, config_.streak_window, config_.allocation_pct * 100.0, config_.max_holding_period,
        config_.universe_size, config_.min_price, config_.max_price);
}

std::vector<core::Symbol> StreakFadeStrategy::selectUniverse(const std::vector<core::CoarseFundamental>& snapshot) {
    state_.universe = selector_.select(snapshot);
    return state_.universe;
}

void StreakFadeStrategy::onUniverseChanged(const UniverseChanges& changes) {
    auto& universe = state_.universe;
    for (const auto& symbol : changes.removed) {
        auto it = std::find(universe.begin(), universe.end(), symbol);
        if (it != universe.end()) {
            universe.erase(it);
            core::logging::getLogger()->trace("{} removed from universe.", symbol);
        }
    }
}

void StreakFadeStrategy::onSchedule(core::Timestamp now) {
    rebalance(now);
}

void StreakFadeStrategy::onPositionClosed(const core::Symbol& symbol) {
    if (state_.holdings.onPositionClosed(symbol)) {
        core::logging::getLogger()->debug("{} closed externally, holding removed.", symbol);
    }
}

RebalanceSummary StreakFadeStrategy::rebalance(core::Timestamp now) {
    auto logger = core::logging::getLogger();
    RebalanceSummary summary;

    state_.holdings.incrementHoldingPeriod();

    StreakCandidates candidates = detector_.getStreakingSymbols(state_.universe, history_);
    state_.holdings.removeDuplicateSymbols(candidates);

    summary.liquidated = state_.holdings.liquidateStaleHoldings(execution_);

    for (const auto& symbol : candidates.shorts) {
        execution_.setTargetAllocation(symbol, -config_.allocation_pct);
        state_.holdings.openPosition(symbol);
        summary.shorted.push_back(symbol);
    }

    for (const auto& symbol : candidates.longs) {
        execution_.setTargetAllocation(symbol, config_.allocation_pct);
        state_.holdings.openPosition(symbol);
        summary.bought.push_back(symbol);
    }

    emitHoldingsSample();

    logger->info("{} | rebalance: universe={}, liquidated={}, shorted={}, bought={}, holdings={}",
                 core::utils::timestampToDateString(now), state_.universe.size(),
                 summary.liquidated.size(), summary.shorted.size(), summary.bought.size(),
                 state_.holdings.size());
    if (!summary.shorted.empty() || !summary.bought.empty()) {
        logger->debug("Shorts: [{}] Longs: [{}]", fmt::join(summary.shorted, ", "), fmt::join(summary.bought, ", "));
    }
    return summary;
}

void StreakFadeStrategy::emitHoldingsSample() {
    if (state_.plot_count >= config_.max_holding_period) {
        metrics_.emitMetric(config_.holdings_series, static_cast<double>(state_.holdings.size()));
        state_.plot_count = 0;
    } else {
        ++state_.plot_count;
    }
}

} // namespace strategy_engine
