#pragma once

#include "simulator.hpp"
#include <cstddef>
#include <vector>

namespace smacross {

/// Summary statistics of one backtest. Returns and drawdown are fractions (0.05 = 5%).
struct PerformanceResult {
    double initial_equity{0};
    double final_equity{0};
    double total_return{0};          // final / initial - 1
    double sharpe_ratio{0};          // annualized; 0 if < 2 returns or zero variance
    double max_drawdown{0};          // <= 0; 0 = no drawdown
    std::size_t max_drawdown_duration{0};  // bars
    std::size_t num_observations{0};       // period returns used for Sharpe
    int total_trades{0};             // closed round trips
    int winning_trades{0};
    int losing_trades{0};
    double win_rate{0};              // winning / total, 0 if no round trips
    double avg_trade_pnl{0};         // net of commission, per round trip
    double open_position{0};         // holdings after the last fill (0 = flat)
};

/// Period-over-period returns of an equity curve (size n-1; 0 where the prior equity is 0).
std::vector<double> periodReturns(const std::vector<EquityPoint>& curve);

/// Compute all statistics from the equity curve and the fill log.
/// Degenerate inputs (empty curve, no trades, flat returns) produce zeros, never an exception.
PerformanceResult analyzePerformance(const std::vector<EquityPoint>& curve,
                                     const std::vector<Trade>& trades,
                                     double initial_cash,
                                     double annualization_factor);

} // namespace smacross
