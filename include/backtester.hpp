#pragma once

#include "indicator.hpp"
#include "performance.hpp"
#include "price_series.hpp"
#include "signal_rule.hpp"
#include "simulator.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace smacross {

/// Strategy and broker parameters for one run.
struct BacktestConfig {
    int fast_period{20};
    int slow_period{50};
    double initial_cash{10000.0};
    double commission_rate{0.001};      // fraction of traded value
    double annualization_factor{252.0}; // bars per year, for Sharpe

    /// Throws InvalidParameter unless 1 <= fast < slow, initial_cash > 0,
    /// 0 <= commission_rate < 1 and annualization_factor > 0.
    void validate() const;

    /// e.g. "fast=20 slow=50 commission=0.001"
    std::string describe() const;
};

/// Everything one run produces. Indicator, signal and change series are aligned with the input bars;
/// equity_curve has one point per processed bar.
struct BacktestResult {
    std::vector<IndicatorValue> fast;
    std::vector<IndicatorValue> slow;
    std::vector<Signal> signals;
    std::vector<PositionChange> changes;
    std::vector<Trade> trades;
    std::vector<EquityPoint> equity_curve;
    PerformanceResult performance;
    double buy_and_hold_return{0};  // last close / first close - 1
    std::size_t bars_processed{0};
    bool insufficient_data{false};  // fewer bars than slow_period: no signal could form
    bool stopped_early{false};
    std::string stop_reason;
};

/// Orchestrates a backtest: indicators -> signals -> position changes -> simulated fills -> statistics.
/// The configuration is validated in the constructor, so a bad configuration never starts a run.
class Backtester {
public:
    /// rule defaults to the SMA crossover rule. Throws InvalidParameter on a bad config.
    explicit Backtester(const BacktestConfig& config, std::unique_ptr<ISignalRule> rule = nullptr);

    /// Run over the whole series. If cancel is given it is checked between bars;
    /// once set, the run stops with stopped_early and statistics cover the processed bars.
    BacktestResult run(const PriceSeries& series, const std::atomic<bool>* cancel = nullptr) const;

    /// Optional execution log: one line per fill plus a closing summary line.
    void setLog(std::ostream* log) { log_ = log; }

    const BacktestConfig& config() const { return config_; }
    const ISignalRule& rule() const { return *rule_; }

private:
    void logTrade(const Trade& t, const Trade* open_buy) const;

    BacktestConfig config_;
    std::unique_ptr<ISignalRule> rule_;
    std::ostream* log_{nullptr};
};

} // namespace smacross
