#include "indicator.hpp"
#include "errors.hpp"
#include <string>

namespace smacross {

namespace {

double windowMean(const PriceSeries& series, std::size_t end_index, int period) {
    double sum = 0;
    for (int k = 0; k < period; ++k) {
        sum += series[end_index - static_cast<std::size_t>(k)].close;
    }
    return sum / period;
}

} // namespace

std::vector<IndicatorValue> computeSma(const PriceSeries& series, int period) {
    if (period < 1)
        throw InvalidParameter("SMA period must be >= 1 (got " + std::to_string(period) + ")");

    std::vector<IndicatorValue> out;
    out.reserve(series.size());
    const std::size_t warmup = static_cast<std::size_t>(period) - 1;
    for (std::size_t i = 0; i < series.size(); ++i) {
        IndicatorValue v;
        v.time = series[i].time;
        if (i >= warmup) v.value = windowMean(series, i, period);
        out.push_back(v);
    }
    return out;
}

} // namespace smacross
