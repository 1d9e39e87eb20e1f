#include "backtester.hpp"
#include "data_source.hpp"
#include "errors.hpp"
#include "report.hpp"
#include "sample_data.hpp"
#include "time_util.hpp"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Defaults mirror the daily BTC setup: SMA 20/50, 10k cash, 0.1% commission
constexpr int DEFAULT_SMA_FAST = 20;
constexpr int DEFAULT_SMA_SLOW = 50;
constexpr double DEFAULT_CASH = 10000.0;
constexpr double DEFAULT_COMMISSION = 0.001;

//-----------------------------------------------------------------------------
// Config: all CLI and run options in one place
//-----------------------------------------------------------------------------
struct Config {
    std::string data_path = "data/btc_daily.csv";
    std::string reports_dir = "reports";
    std::string bar_resolution = "1d";
    double initial_cash = DEFAULT_CASH;
    double commission = DEFAULT_COMMISSION;
    double annualization = 0;   // 0 = derive from bar_resolution
    int sma_fast = DEFAULT_SMA_FAST;
    int sma_slow = DEFAULT_SMA_SLOW;
    int synthetic_bars = 0;     // > 0 = generate instead of loading --data
    int seed = 42;
    bool verbose = false;
    bool resample = false;      // --bar given explicitly: aggregate loaded bars to it
};

// Safe parse: on failure set error_msg and return false.
bool parseDouble(const char* s, double& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected number)";
        return false;
    }
}
bool parseInt(const char* s, int& out, std::string& error_msg, const char* flag) {
    try {
        std::size_t pos = 0;
        out = std::stoi(s, &pos);
        if (s[pos] != '\0') throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        error_msg = std::string("Invalid value for ") + flag + ": \"" + s + "\" (expected integer)";
        return false;
    }
}

void printUsage(std::ostream& out) {
    out << "Usage: smacross [options]\n"
        << "  --data PATH          CSV with timestamp,open,high,low,close[,volume] or date,price\n"
        << "  --synthetic N        generate N random-walk bars instead of loading --data\n"
        << "  --seed N             seed for --synthetic (default 42)\n"
        << "  --bar RES            bar resolution: 1m, 5m, 15m, 1h, 4h, 1d (default 1d)\n"
        << "  --fast N             fast SMA period (default " << DEFAULT_SMA_FAST << ")\n"
        << "  --slow N             slow SMA period (default " << DEFAULT_SMA_SLOW << ")\n"
        << "  --cash X             initial cash (default " << DEFAULT_CASH << ")\n"
        << "  --commission X       commission rate per fill, e.g. 0.001 = 0.1%\n"
        << "  --annualization X    bars per year for Sharpe (default from --bar)\n"
        << "  --reports-dir DIR    output directory (default reports)\n"
        << "  --verbose            log every fill\n";
}

/// Returns false and sets error_msg on parse error.
bool parseArgs(int argc, char* argv[], Config& cfg, std::string& error_msg, bool& show_help) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() { return i + 1 < argc ? argv[++i] : nullptr; };
        auto missing = [&]() { error_msg = "Missing value for " + arg; return false; };

        if (arg == "--help" || arg == "-h") { show_help = true; }
        else if (arg == "--data") { if (!next()) return missing(); cfg.data_path = argv[i]; }
        else if (arg == "--reports-dir") { if (!next()) return missing(); cfg.reports_dir = argv[i]; }
        else if (arg == "--bar") { if (!next()) return missing(); cfg.bar_resolution = argv[i]; cfg.resample = true; }
        else if (arg == "--cash") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.initial_cash, error_msg, "--cash")) return false; }
        else if (arg == "--commission") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.commission, error_msg, "--commission")) return false; }
        else if (arg == "--annualization") { if (!next()) return missing(); if (!parseDouble(argv[i], cfg.annualization, error_msg, "--annualization")) return false; }
        else if (arg == "--fast") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.sma_fast, error_msg, "--fast")) return false; }
        else if (arg == "--slow") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.sma_slow, error_msg, "--slow")) return false; }
        else if (arg == "--synthetic") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.synthetic_bars, error_msg, "--synthetic")) return false; }
        else if (arg == "--seed") { if (!next()) return missing(); if (!parseInt(argv[i], cfg.seed, error_msg, "--seed")) return false; }
        else if (arg == "--verbose" || arg == "-v") { cfg.verbose = true; }
        else { error_msg = "Unknown option: " + arg; return false; }
    }
    return true;
}

/// Returns false and sets error_msg if config is invalid. Strategy parameters are checked by BacktestConfig.
bool validateConfig(const Config& cfg, std::string& error_msg) {
    if (smacross::resolutionSeconds(cfg.bar_resolution) == 0) {
        error_msg = "--bar must be one of 1m, 5m, 15m, 1h, 4h, 1d (got \"" + cfg.bar_resolution + "\")";
        return false;
    }
    if (cfg.synthetic_bars < 0) { error_msg = "--synthetic must be >= 0"; return false; }
    if (cfg.seed < 0) { error_msg = "--seed must be >= 0"; return false; }
    if (cfg.annualization < 0) { error_msg = "--annualization must be > 0"; return false; }
    return true;
}

smacross::BacktestConfig toBacktestConfig(const Config& cfg) {
    smacross::BacktestConfig bc;
    bc.fast_period = cfg.sma_fast;
    bc.slow_period = cfg.sma_slow;
    bc.initial_cash = cfg.initial_cash;
    bc.commission_rate = cfg.commission;
    bc.annualization_factor = cfg.annualization > 0
        ? cfg.annualization
        : smacross::annualizationFactorFor(cfg.bar_resolution);
    return bc;
}

/// Load or generate the bars. Returns false (message already printed) on failure.
bool loadSeries(const Config& cfg, smacross::PriceSeries& out) {
    using namespace smacross;
    if (cfg.synthetic_bars > 0) {
        SampleParams p;
        p.count = static_cast<std::size_t>(cfg.synthetic_bars);
        p.interval_seconds = resolutionSeconds(cfg.bar_resolution);
        p.seed = static_cast<std::uint32_t>(cfg.seed);
        out = PriceSeries(generateSampleBars(p));
        std::cerr << "Generated " << out.size() << " synthetic " << cfg.bar_resolution << " bars (seed "
                  << cfg.seed << ")\n";
        return true;
    }

    DataSource data(cfg.data_path);
    if (!data.load()) return false;
    if (cfg.resample && !data.aggregateBars(cfg.bar_resolution)) {
        std::cerr << "Cannot resample to " << cfg.bar_resolution << "\n";
        return false;
    }
    if (data.empty()) {
        std::cerr << "No bars loaded from " << cfg.data_path << "\n";
        return false;
    }
    out = data.series();
    std::cerr << "Loaded " << out.size() << " bars from " << cfg.data_path << "\n";
    return true;
}

int run(const Config& cfg) {
    using namespace smacross;
    BacktestConfig bc = toBacktestConfig(cfg);
    bc.validate();

    PriceSeries series;
    if (!loadSeries(cfg, series)) return 1;

    // Loaded file without --bar or --annualization: annualize by the actual bar spacing
    if (!cfg.resample && cfg.annualization <= 0 && cfg.synthetic_bars == 0) {
        std::int64_t spacing = series.medianSpacing();
        if (spacing > 0 && spacing != resolutionSeconds(cfg.bar_resolution)) {
            bc.annualization_factor = annualizationFactorForSpacing(spacing);
            std::cerr << "Median bar spacing is " << spacing << "s; annualizing with "
                      << bc.annualization_factor << " bars per year\n";
        }
    }

    Backtester bt(bc);
    if (cfg.verbose) bt.setLog(&std::cerr);

    BacktestResult result = bt.run(series);

    Report report(result, series, bt.rule().name(), bt.config().describe());
    report.printSummary(std::cout);

    std::error_code ec;
    fs::create_directories(cfg.reports_dir, ec);
    if (ec) {
        std::cerr << "Cannot create reports directory " << cfg.reports_dir << ": " << ec.message() << "\n";
        return 1;
    }
    bool ok = report.writeTradeLog((fs::path(cfg.reports_dir) / "trades.csv").string());
    ok = report.writeEquityCurve((fs::path(cfg.reports_dir) / "equity_curve.csv").string()) && ok;
    ok = report.writeSignals((fs::path(cfg.reports_dir) / "signals.csv").string()) && ok;
    ok = report.writeReport((fs::path(cfg.reports_dir) / "report.txt").string()) && ok;
    if (!ok) return 1;
    std::cout << "Reports written to " << cfg.reports_dir << "/\n";
    return 0;
}

} // namespace

//-----------------------------------------------------------------------------
// main
//-----------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Config cfg;
    std::string error_msg;
    bool show_help = false;
    if (!parseArgs(argc, argv, cfg, error_msg, show_help)) {
        std::cerr << error_msg << "\n";
        printUsage(std::cerr);
        return 1;
    }
    if (show_help) {
        printUsage(std::cout);
        return 0;
    }
    if (!validateConfig(cfg, error_msg)) {
        std::cerr << error_msg << "\n";
        return 1;
    }

    // Resolve default data path when running from build/
    if (cfg.synthetic_bars == 0 && !fs::is_regular_file(cfg.data_path) &&
        fs::is_regular_file(fs::path("..") / cfg.data_path))
        cfg.data_path = (fs::path("..") / cfg.data_path).string();

    try {
        return run(cfg);
    } catch (const smacross::InvalidParameter& e) {
        std::cerr << "Invalid parameter: " << e.what() << "\n";
        return 1;
    } catch (const smacross::InvariantViolation& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 2;
    }
}
