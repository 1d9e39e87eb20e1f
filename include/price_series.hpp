#pragma once

#include "bar.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace smacross {

/// Immutable, validated bar sequence in strictly ascending time order.
/// Construction throws InvalidParameter if any bar has negative/non-finite values,
/// high < max(open, close), low > min(open, close), or a timestamp not greater than its predecessor.
class PriceSeries {
public:
    PriceSeries() = default;
    explicit PriceSeries(std::vector<Bar> bars);

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    const Bar& at(std::size_t i) const { return bars_.at(i); }
    const Bar& operator[](std::size_t i) const { return bars_[i]; }
    const Bar& front() const { return bars_.front(); }
    const Bar& back() const { return bars_.back(); }

    std::vector<Bar>::const_iterator begin() const { return bars_.begin(); }
    std::vector<Bar>::const_iterator end() const { return bars_.end(); }

    /// Median gap between consecutive bar times in seconds; 0 with fewer than two bars.
    std::int64_t medianSpacing() const;

    /// nullptr if the bar satisfies the OHLCV invariants, else the reason.
    static const char* checkBar(const Bar& bar);

private:
    std::vector<Bar> bars_;
};

} // namespace smacross
