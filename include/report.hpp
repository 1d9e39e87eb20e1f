#pragma once

#include "backtester.hpp"
#include "price_series.hpp"
#include <iostream>
#include <ostream>
#include <string>

namespace smacross {

/// Formats a finished run for people and for downstream tools (CSV).
class Report {
public:
    /// strategy_name and strategy_params are included in report output (e.g. "sma_crossover", "fast=20 slow=50").
    Report(const BacktestResult& result, const PriceSeries& series,
           const std::string& strategy_name = "",
           const std::string& strategy_params = "");

    /// Print summary to console.
    void printSummary(std::ostream& out = std::cout) const;

    /// Fill log: time,side,price,quantity,commission,cash_after. Returns false and logs to stderr on failure.
    bool writeTradeLog(const std::string& filepath) const;

    /// One row per processed bar: bar_index,time,close,equity. Returns false and logs to stderr on failure.
    bool writeEquityCurve(const std::string& filepath) const;

    /// One row per bar: time,close,sma_fast,sma_slow,signal,position_change (empty cell = undefined SMA).
    bool writeSignals(const std::string& filepath) const;

    /// Write full report to a text file. Returns false and logs to stderr on failure.
    bool writeReport(const std::string& filepath) const;

private:
    void writeBody(std::ostream& out) const;

    const BacktestResult& result_;
    const PriceSeries& series_;
    std::string strategy_name_;
    std::string strategy_params_;
};

} // namespace smacross
