#pragma once

#include "price_series.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace smacross {

/// Indicator output for one bar. value is empty while the window lacks history.
struct IndicatorValue {
    std::int64_t time{0};
    std::optional<double> value;
};

/// Simple moving average of closes, aligned one-to-one with the series.
/// Entry i holds mean(close[i-period+1 .. i]) for i >= period-1 and is empty before that.
/// Only bars at or before i are read. period > series.size() yields all-empty values.
/// Throws InvalidParameter if period < 1.
std::vector<IndicatorValue> computeSma(const PriceSeries& series, int period);

} // namespace smacross
