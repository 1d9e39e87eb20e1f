#pragma once

#include <cstdint>

namespace smacross {

/// Single OHLCV bar. time is Unix seconds (UTC) of the bar open.
struct Bar {
    std::int64_t time{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};       // optional
};

} // namespace smacross
