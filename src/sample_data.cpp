#include "sample_data.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace smacross {

std::vector<Bar> generateSampleBars(const SampleParams& params) {
    std::vector<Bar> bars;
    bars.reserve(params.count);

    std::mt19937 rng(params.seed);
    std::normal_distribution<double> ret(0.0, params.volatility);
    std::normal_distribution<double> wick(0.0, params.wick);
    std::exponential_distribution<double> vol(params.mean_volume > 0 ? 1.0 / params.mean_volume : 1.0);

    double prev = params.base_price;
    for (std::size_t i = 0; i < params.count; ++i) {
        // Clamp so a large negative draw cannot push the price to zero or below
        double close = std::max(prev * (1.0 + ret(rng)), prev * 0.01);
        Bar b;
        b.time = params.start_time + static_cast<std::int64_t>(i) * params.interval_seconds;
        b.open = prev;
        b.close = close;
        b.high = std::max(b.open, b.close) * (1.0 + std::abs(wick(rng)));
        b.low = std::min(b.open, b.close) * (1.0 - std::min(std::abs(wick(rng)), 0.99));
        b.volume = params.mean_volume > 0 ? vol(rng) : 0.0;
        bars.push_back(b);
        prev = close;
    }
    return bars;
}

} // namespace smacross
