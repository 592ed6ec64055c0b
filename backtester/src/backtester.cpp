#include "backtester.hpp"
#include "strategy_factory.hpp"
#include "common_types.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <chrono>

namespace backtester {

    namespace {

        std::string readDate(const json& section, const char* key) {
            auto it = section.find(key);
            if (it == section.end() || !it->is_string()) {
                throw core::ConfigException(std::string("backtest.") + key + " must be a YYYY-MM-DD string");
            }
            std::string value = it->get<std::string>();
            try {
                core::utils::dateToTimestamp(value);
            } catch (const std::runtime_error& e) {
                throw core::ConfigException(std::string("backtest.") + key + ": " + e.what());
            }
            return value;
        }

        void readNumber(const json& section, const char* key, double& out) {
            auto it = section.find(key);
            if (it == section.end()) return;
            if (!it->is_number()) {
                throw core::ConfigException(std::string("backtest.") + key + " must be a number");
            }
            out = it->get<double>();
        }

        void readString(const json& section, const char* key, std::string& out) {
            auto it = section.find(key);
            if (it == section.end()) return;
            if (!it->is_string()) {
                throw core::ConfigException(std::string("backtest.") + key + " must be a string");
            }
            out = it->get<std::string>();
        }

    } // end anonymous namespace

    BacktestSettings BacktestSettings::fromJson(const json& config) {
        auto section_it = config.find("backtest");
        if (section_it == config.end() || !section_it->is_object()) {
            throw core::ConfigException("Config is missing the \"backtest\" object");
        }
        const json& section = *section_it;

        BacktestSettings settings;
        readString(section, "database", settings.database);
        readString(section, "interval", settings.interval);
        settings.start_date = readDate(section, "start_date");
        settings.end_date = readDate(section, "end_date");
        readNumber(section, "initial_capital", settings.initial_capital);
        readNumber(section, "commission_per_share", settings.commission_per_share);

        if (settings.interval.empty()) {
            throw core::ConfigException("backtest.interval must not be empty");
        }
        if (!(settings.initial_capital > 0)) {
            throw core::ConfigException("backtest.initial_capital must be positive");
        }
        if (!(settings.commission_per_share >= 0)) {
            throw core::ConfigException("backtest.commission_per_share must not be negative");
        }
        if (core::utils::dateToTimestamp(settings.start_date) > core::utils::dateToTimestamp(settings.end_date)) {
            throw core::ConfigException("backtest.start_date is after backtest.end_date");
        }
        return settings;
    }

    Backtester::Backtester(data::DatabaseManager& db_manager)
        : db_manager_(db_manager)
    {
        core::logging::getLogger()->debug("Backtester initialized.");
    }

    const Portfolio& Backtester::getPortfolio() const {
        if (!portfolio_) {
            throw core::BacktestException("No backtest has been run yet");
        }
        return *portfolio_;
    }

    const MetricsRecorder& Backtester::getMetricsRecorder() const {
        if (!recorder_) {
            throw core::BacktestException("No backtest has been run yet");
        }
        return *recorder_;
    }

    bool Backtester::run(const json& config)
    {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run");
        logger->info("========================================================");

        try {
            settings_ = BacktestSettings::fromJson(config);
            holdings_series_ = strategy_engine::StrategyFactory::parseConfig(config).holdings_series;
            logger->info("Period: {} to {}, capital {:.2f}, commission {}/share, interval '{}'",
                         settings_.start_date, settings_.end_date, settings_.initial_capital,
                         settings_.commission_per_share, settings_.interval);

            if (!db_manager_.isConnected()) {
                logger->info("Connecting to DB for backtest data...");
                if (!db_manager_.connect()) {
                    logger->error("Failed to connect to DB for backtest.");
                    return false;
                }
            }

            // Tear down in reverse dependency order before rebuilding
            strategy_.reset();
            execution_.reset();
            last_closes_.clear();
            metrics_ = BacktestMetrics{};
            portfolio_ = std::make_unique<Portfolio>(settings_.initial_capital);
            recorder_ = std::make_unique<MetricsRecorder>();
            history_ = std::make_unique<data::DatabaseHistoryService>(db_manager_, settings_.interval);
            execution_ = std::make_unique<SimulatedExecution>(*portfolio_, last_closes_, settings_.commission_per_share);

            strategy_ = strategy_engine::StrategyFactory::createStrategy(
                config, strategy_engine::StrategyServices{*history_, *execution_, *recorder_});
            strategy_->initialize();
            logger->info("Strategy '{}' loaded successfully.", strategy_->getName());

            core::Timestamp start_ts = core::utils::dateToTimestamp(settings_.start_date);
            core::Timestamp end_ts = core::utils::dateToTimestamp(settings_.end_date) +
                                     std::chrono::hours(24) - std::chrono::seconds(1);
            auto trading_days = db_manager_.queryTradingDays(settings_.interval, start_ts, end_ts);
            if (trading_days.empty()) {
                logger->error("No {} bars found between {} and {}.", settings_.interval,
                              settings_.start_date, settings_.end_date);
                return false;
            }

            logger->info("Starting event loop over {} trading days...", trading_days.size());
            runEventLoop(trading_days);
            logger->info("Event loop finished.");

            calculateMetrics(static_cast<int>(trading_days.size()));
            metrics_.logMetrics();

            logger->info("========================================================");
            logger->info("Backtest Run Completed for Strategy '{}'", strategy_->getName());
            logger->info("========================================================");
            return true;

        } catch (const core::ConfigException& e) {
            logger->error("Invalid backtest configuration: {}", e.what());
            return false;
        } catch (const std::exception& e) {
            logger->critical("Exception during backtest run: {}", e.what());
            return false;
        }
    }

    void Backtester::updateUniverse(core::Timestamp day, std::vector<core::Symbol>& current_universe) {
        auto snapshot = db_manager_.queryCoarseSnapshot(day);
        if (snapshot.empty()) {
            return; // Universe carries over until the next snapshot
        }

        std::vector<core::Symbol> selected = strategy_->selectUniverse(snapshot);
        std::vector<core::Symbol> sorted_selected = selected;
        std::sort(sorted_selected.begin(), sorted_selected.end());

        strategy_engine::UniverseChanges changes;
        std::set_difference(sorted_selected.begin(), sorted_selected.end(),
                            current_universe.begin(), current_universe.end(),
                            std::back_inserter(changes.added));
        std::set_difference(current_universe.begin(), current_universe.end(),
                            sorted_selected.begin(), sorted_selected.end(),
                            std::back_inserter(changes.removed));

        if (!changes.added.empty() || !changes.removed.empty()) {
            core::logging::getLogger()->debug("{}: universe +{} -{}", core::utils::timestampToDateString(day),
                                              changes.added.size(), changes.removed.size());
            strategy_->onUniverseChanged(changes);
        }
        current_universe = std::move(sorted_selected);
    }

    void Backtester::runEventLoop(const std::vector<core::Timestamp>& trading_days) {
        auto logger = core::logging::getLogger();
        std::vector<core::Symbol> current_universe; // sorted

        for (const auto& day : trading_days) {
            // 1. Today's closes: fills happen here and marks carry forward
            std::map<core::Symbol, double> todays_closes;
            for (const auto& [symbol, candle] : db_manager_.queryCandlesAt(settings_.interval, day)) {
                todays_closes[symbol] = candle.close;
                last_closes_[symbol] = candle.close;
            }

            history_->setCurrentTime(day);
            recorder_->setCurrentTime(day);
            execution_->beginDay(day, std::move(todays_closes));

            // 2. Universe selection on days with a coarse snapshot
            updateUniverse(day, current_universe);

            // 3. Daily scheduled callback
            strategy_->onSchedule(day);

            // 4. Mark to market
            portfolio_->recordTimestampValue(day, last_closes_);
            logger->trace("{}: equity {:.2f}", core::utils::timestampToDateString(day),
                          portfolio_->getEquityCurve().back().total_equity);
        }
    }

    void Backtester::calculateMetrics(int trading_days) {
        auto logger = core::logging::getLogger();
        logger->info("Calculating performance metrics...");

        const auto& equity_curve = portfolio_->getEquityCurve();
        const auto& trade_log = portfolio_->getTradeLog();
        const double initial_capital = portfolio_->getInitialCapital();

        BacktestMetrics metrics;
        metrics.initial_capital = initial_capital;
        metrics.trading_days = trading_days;
        metrics.total_executions = portfolio_->getTotalExecutions();
        metrics.avg_num_holdings = recorder_->average(holdings_series_);

        if (equity_curve.empty()) {
            logger->warn("No equity points recorded, metrics left at defaults.");
            metrics.final_equity = initial_capital;
            metrics_ = metrics;
            return;
        }

        // --- PnL and Return ---
        metrics.final_equity = equity_curve.back().total_equity;
        metrics.total_pnl = metrics.final_equity - initial_capital;
        metrics.total_return_pct = metrics.total_pnl / initial_capital;

        // --- Max Drawdown ---
        double peak_equity = initial_capital;
        double max_drawdown = 0.0;
        for (const auto& state : equity_curve) {
            peak_equity = std::max(peak_equity, state.total_equity);
            double current_drawdown = (peak_equity > 1e-9) ? (peak_equity - state.total_equity) / peak_equity : 0.0;
            max_drawdown = std::max(max_drawdown, current_drawdown);
        }
        metrics.max_drawdown_pct = max_drawdown;

        // --- Trade-Based Metrics ---
        metrics.round_trip_trades = static_cast<int>(trade_log.size());
        int winning_trades = 0;
        int losing_trades = 0;
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        for (const auto& trade : trade_log) {
            if (trade.pnl > 0) {
                winning_trades++;
                gross_profit += trade.pnl;
            } else if (trade.pnl < 0) {
                losing_trades++;
                gross_loss += trade.pnl;
            }
        }

        if (metrics.round_trip_trades > 0) {
            metrics.win_rate = static_cast<double>(winning_trades) / metrics.round_trip_trades;
        }
        if (winning_trades > 0) {
            metrics.avg_win_pnl = gross_profit / winning_trades;
        }
        if (losing_trades > 0) {
            metrics.avg_loss_pnl = gross_loss / losing_trades;
        }
        if (gross_loss < 0) {
            metrics.profit_factor = gross_profit / -gross_loss;
        }

        metrics_ = metrics;
    }

} // namespace backtester
