#pragma once

#include "bar.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace smacross {

/// Parameters for a synthetic BTC-like series (seeded, reproducible).
struct SampleParams {
    std::size_t count = 720;                  // bars
    double base_price = 45000.0;
    double volatility = 0.02;                 // std of per-bar return
    double wick = 0.005;                      // std of high/low extension beyond open/close
    double mean_volume = 1000.0;
    std::int64_t start_time = 1767225600;     // 2026-01-01T00:00:00Z
    std::int64_t interval_seconds = 3600;
    std::uint32_t seed = 42;
};

/// Geometric random walk: each close = previous close * (1 + N(0, volatility)); open = previous close.
/// High/low extend max/min(open, close) by |N(0, wick)|; volume ~ Exponential(mean_volume).
/// Every bar satisfies the PriceSeries invariants.
std::vector<Bar> generateSampleBars(const SampleParams& params = SampleParams{});

} // namespace smacross
