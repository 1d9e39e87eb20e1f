#include "performance.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace smacross {

std::vector<double> periodReturns(const std::vector<EquityPoint>& curve) {
    std::vector<double> returns;
    if (curve.size() < 2) return returns;
    returns.reserve(curve.size() - 1);
    for (std::size_t i = 1; i < curve.size(); ++i) {
        if (curve[i - 1].equity != 0)
            returns.push_back(curve[i].equity / curve[i - 1].equity - 1.0);
        else
            returns.push_back(0);
    }
    return returns;
}

PerformanceResult analyzePerformance(const std::vector<EquityPoint>& curve,
                                     const std::vector<Trade>& trades,
                                     double initial_cash,
                                     double annualization_factor) {
    PerformanceResult m;
    m.initial_equity = initial_cash;
    m.final_equity = curve.empty() ? initial_cash : curve.back().equity;
    m.total_return = (initial_cash != 0) ? (m.final_equity / initial_cash - 1.0) : 0;

    // Drawdown: depth and longest stretch below the running peak
    if (!curve.empty()) {
        double peak = curve[0].equity;
        std::size_t run = 0;
        for (const auto& p : curve) {
            if (p.equity > peak) peak = p.equity;
            if (p.equity < peak) {
                ++run;
                if (run > m.max_drawdown_duration) m.max_drawdown_duration = run;
            } else {
                run = 0;
            }
            double dd = (peak != 0) ? (p.equity / peak - 1.0) : 0;
            if (dd < m.max_drawdown) m.max_drawdown = dd;
        }
    }

    // Sharpe: mean and sample std of period returns, annualized by bars per year
    std::vector<double> returns = periodReturns(curve);
    m.num_observations = returns.size();
    if (returns.size() >= 2 && annualization_factor > 0) {
        double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
        double sq_sum = 0;
        for (double r : returns) sq_sum += (r - mean) * (r - mean);
        double stddev = std::sqrt(sq_sum / static_cast<double>(returns.size() - 1));
        // Rounding leaves a residual stdev on constant returns
        if (std::isfinite(stddev) && stddev > 1e-12 * std::max(1.0, std::abs(mean)))
            m.sharpe_ratio = (mean / stddev) * std::sqrt(annualization_factor);
    }

    // Round trips: each sell closes the most recent unmatched buy
    const Trade* open_buy = nullptr;
    double total_pnl = 0;
    for (const auto& t : trades) {
        if (t.side == Side::Buy) {
            open_buy = &t;
            continue;
        }
        if (!open_buy) continue;
        double pnl = t.cashFlow() - open_buy->cashFlow();
        ++m.total_trades;
        if (pnl > 0) ++m.winning_trades;
        total_pnl += pnl;
        open_buy = nullptr;
    }
    m.losing_trades = m.total_trades - m.winning_trades;
    m.win_rate = (m.total_trades > 0) ? static_cast<double>(m.winning_trades) / m.total_trades : 0;
    m.avg_trade_pnl = (m.total_trades > 0) ? (total_pnl / m.total_trades) : 0;
    m.open_position = open_buy ? open_buy->quantity : 0;

    return m;
}

} // namespace smacross
