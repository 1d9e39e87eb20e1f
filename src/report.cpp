#include "report.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>

namespace smacross {

Report::Report(const BacktestResult& result, const PriceSeries& series,
               const std::string& strategy_name, const std::string& strategy_params)
    : result_(result), series_(series)
    , strategy_name_(strategy_name), strategy_params_(strategy_params) {}

namespace {
    std::ofstream openCsv(const std::string& filepath) {
        std::ofstream f(filepath);
        if (f) f << static_cast<char>(0xEF) << static_cast<char>(0xBB) << static_cast<char>(0xBF);
        return f;
    }

    double pct(double fraction) { return fraction * 100.0; }
}

void Report::writeBody(std::ostream& out) const {
    const PerformanceResult& m = result_.performance;
    if (result_.stopped_early)
        out << "*** Backtest stopped: " << result_.stop_reason << " ***\n\n";
    if (!strategy_name_.empty()) {
        out << "Strategy: " << strategy_name_;
        if (!strategy_params_.empty()) out << " (" << strategy_params_ << ")";
        out << "\n";
    }
    out << std::fixed << std::setprecision(2);
    out << "Bars:             " << series_.size();
    if (!series_.empty())
        out << " (" << formatTimestamp(series_.front().time) << " to " << formatTimestamp(series_.back().time) << ")";
    out << "\n";
    if (result_.insufficient_data)
        out << "Insufficient data: fewer bars than the slow period, no signals formed\n";
    out << "Initial equity:   " << m.initial_equity << "\n";
    out << "Final equity:     " << m.final_equity << "\n";
    out << "Total return:     " << pct(m.total_return) << "%\n";
    out << "Buy & hold:       " << pct(result_.buy_and_hold_return) << "%\n";
    out << "Max drawdown:     " << pct(m.max_drawdown) << "%\n";
    out << "Max DD duration:  " << m.max_drawdown_duration << " bars\n";
    out << "Sharpe ratio:     " << std::setprecision(3) << m.sharpe_ratio << "\n";
    out << std::setprecision(2);
    out << "Round trips:      " << m.total_trades << "\n";
    out << "Winning trades:   " << m.winning_trades << "\n";
    out << "Losing trades:    " << m.losing_trades << "\n";
    out << "Win rate:         " << pct(m.win_rate) << "%\n";
    out << "Avg trade P&L:    " << m.avg_trade_pnl << "\n";
    if (m.open_position > 0)
        out << "Open position:    " << std::setprecision(6) << m.open_position << " (long)\n";
}

void Report::printSummary(std::ostream& out) const {
    out << "\n========== Backtest Report ==========\n";
    writeBody(out);
    out << "======================================\n\n";
}

bool Report::writeTradeLog(const std::string& filepath) const {
    std::ofstream f = openCsv(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "time,side,price,quantity,commission,cash_after\n";
    f << std::fixed;
    for (const auto& t : result_.trades) {
        f << formatTimestamp(t.time) << ',' << toString(t.side) << ','
          << std::setprecision(2) << t.price << ','
          << std::setprecision(8) << t.quantity << ','
          << std::setprecision(2) << t.commission << ',' << t.cash_after << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write trade log: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeEquityCurve(const std::string& filepath) const {
    std::ofstream f = openCsv(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "bar_index,time,close,equity\n";
    f << std::fixed << std::setprecision(2);
    const auto& curve = result_.equity_curve;
    const std::size_t n = std::min(curve.size(), series_.size());
    for (std::size_t i = 0; i < n; ++i) {
        f << i << ',' << formatTimestamp(curve[i].time) << ',' << series_[i].close << ','
          << curve[i].equity << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write equity curve: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeSignals(const std::string& filepath) const {
    std::ofstream f = openCsv(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "time,close,sma_fast,sma_slow,signal,position_change\n";
    f << std::fixed << std::setprecision(2);
    const std::size_t n = std::min({series_.size(), result_.fast.size(), result_.slow.size(),
                                    result_.signals.size(), result_.changes.size()});
    for (std::size_t i = 0; i < n; ++i) {
        f << formatTimestamp(series_[i].time) << ',' << series_[i].close << ',';
        if (result_.fast[i].value) f << *result_.fast[i].value;
        f << ',';
        if (result_.slow[i].value) f << *result_.slow[i].value;
        f << ',' << toString(result_.signals[i]) << ',' << toString(result_.changes[i]) << "\n";
    }
    if (!f) {
        std::cerr << "Failed to write signals: " << filepath << "\n";
        return false;
    }
    return true;
}

bool Report::writeReport(const std::string& filepath) const {
    std::ofstream f(filepath);
    if (!f) {
        std::cerr << "Failed to open for writing: " << filepath << "\n";
        return false;
    }
    f << "Backtest Report\n";
    f << "================\n\n";
    writeBody(f);
    return f ? true : (std::cerr << "Failed to write report: " << filepath << "\n", false);
}

} // namespace smacross
