#include "backtester.hpp"
#include "errors.hpp"
#include "sma_crossover_rule.hpp"
#include "time_util.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace smacross {

void BacktestConfig::validate() const {
    if (fast_period < 1)
        throw InvalidParameter("fast period must be >= 1 (got " + std::to_string(fast_period) + ")");
    if (slow_period < 1)
        throw InvalidParameter("slow period must be >= 1 (got " + std::to_string(slow_period) + ")");
    if (slow_period <= fast_period) {
        throw InvalidParameter("slow period (" + std::to_string(slow_period)
                               + ") must be greater than fast period (" + std::to_string(fast_period) + ")");
    }
    if (!(initial_cash > 0) || !std::isfinite(initial_cash))
        throw InvalidParameter("initial cash must be > 0");
    if (!(commission_rate >= 0 && commission_rate < 1))
        throw InvalidParameter("commission rate must be in [0, 1)");
    if (!(annualization_factor > 0) || !std::isfinite(annualization_factor))
        throw InvalidParameter("annualization factor must be > 0");
}

std::string BacktestConfig::describe() const {
    std::ostringstream ss;
    ss << "fast=" << fast_period << " slow=" << slow_period << " commission=" << commission_rate;
    return ss.str();
}

Backtester::Backtester(const BacktestConfig& config, std::unique_ptr<ISignalRule> rule)
    : config_(config)
    , rule_(rule ? std::move(rule) : createSmaCrossoverRule())
{
    config_.validate();
}

void Backtester::logTrade(const Trade& t, const Trade* open_buy) const {
    if (!log_) return;
    std::ostringstream line;
    line << std::fixed << std::setprecision(2) << formatTimestamp(t.time, true) << ", ";
    if (t.side == Side::Buy) {
        line << "BUY EXECUTED, Price: " << t.price << ", Cost: " << t.price * t.quantity
             << ", Comm " << t.commission;
    } else {
        line << "SELL EXECUTED, Price: " << t.price << ", Value: " << t.price * t.quantity
             << ", Comm " << t.commission;
        if (open_buy) {
            double gross = (t.price - open_buy->price) * t.quantity;
            double net = t.cashFlow() - open_buy->cashFlow();
            line << "\n" << formatTimestamp(t.time, true) << ", OPERATION PROFIT, GROSS " << gross
                 << ", NET " << net;
        }
    }
    *log_ << line.str() << "\n";
}

BacktestResult Backtester::run(const PriceSeries& series, const std::atomic<bool>* cancel) const {
    BacktestResult r;

    // 1. Indicators: independent, read-only over the series
    r.fast = computeSma(series, config_.fast_period);
    r.slow = computeSma(series, config_.slow_period);
    r.insufficient_data = series.size() < static_cast<std::size_t>(config_.slow_period);

    // 2. Signals and transitions
    r.signals = rule_->generate(r.fast, r.slow);
    if (r.signals.size() != series.size())
        throw InvariantViolation("signal rule returned " + std::to_string(r.signals.size())
                                 + " signals for " + std::to_string(series.size()) + " bars");
    r.changes = derivePositionChanges(r.signals);

    // 3. Sequential simulation, one bar at a time
    Simulator sim(config_.initial_cash, config_.commission_rate);
    std::optional<Trade> open_buy;
    for (std::size_t i = 0; i < series.size(); ++i) {
        if (cancel && cancel->load()) {
            r.stopped_early = true;
            r.stop_reason = "cancelled";
            break;
        }
        auto trade = sim.step(series[i], r.changes[i]);
        ++r.bars_processed;
        if (trade) {
            logTrade(*trade, open_buy ? &*open_buy : nullptr);
            if (trade->side == Side::Buy)
                open_buy = trade;
            else
                open_buy.reset();
        }
    }

    // 4. Statistics
    r.trades = sim.trades();
    r.equity_curve = sim.equityCurve();
    r.performance = analyzePerformance(r.equity_curve, r.trades, config_.initial_cash,
                                       config_.annualization_factor);
    if (!series.empty() && series.front().close > 0)
        r.buy_and_hold_return = series.back().close / series.front().close - 1.0;

    if (log_) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(2) << "Ending Value " << r.performance.final_equity
             << " (" << rule_->name() << " " << config_.describe() << ")";
        *log_ << line.str() << "\n";
    }
    return r;
}

} // namespace smacross
