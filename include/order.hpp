#pragma once

namespace smacross {

enum class Side { Buy, Sell };

inline const char* toString(Side side) { return side == Side::Buy ? "buy" : "sell"; }

} // namespace smacross
