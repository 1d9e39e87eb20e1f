#include "price_series.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace smacross {

const char* PriceSeries::checkBar(const Bar& b) {
    for (double v : {b.open, b.high, b.low, b.close, b.volume}) {
        if (!std::isfinite(v)) return "non-finite value";
        if (v < 0) return "negative value";
    }
    if (b.high < std::max(b.open, b.close)) return "high below open/close";
    if (b.low > std::min(b.open, b.close)) return "low above open/close";
    return nullptr;
}

PriceSeries::PriceSeries(std::vector<Bar> bars) : bars_(std::move(bars)) {
    for (std::size_t i = 0; i < bars_.size(); ++i) {
        const Bar& b = bars_[i];
        if (const char* reason = checkBar(b)) {
            throw InvalidParameter("bar " + std::to_string(i) + " (" + formatTimestamp(b.time)
                                   + "): " + reason);
        }
        if (i > 0 && b.time <= bars_[i - 1].time) {
            throw InvalidParameter("bar " + std::to_string(i) + " (" + formatTimestamp(b.time)
                                   + "): timestamp not after previous bar");
        }
    }
}

std::int64_t PriceSeries::medianSpacing() const {
    if (bars_.size() < 2) return 0;
    std::vector<std::int64_t> gaps;
    gaps.reserve(bars_.size() - 1);
    for (std::size_t i = 1; i < bars_.size(); ++i)
        gaps.push_back(bars_[i].time - bars_[i - 1].time);
    auto mid = gaps.begin() + static_cast<std::ptrdiff_t>(gaps.size() / 2);
    std::nth_element(gaps.begin(), mid, gaps.end());
    return *mid;
}

} // namespace smacross
