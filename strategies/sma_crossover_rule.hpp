#pragma once

#include "signal_rule.hpp"
#include <memory>

namespace smacross {

/// Factory: Long while fast SMA > slow SMA (strict), Flat on ties or missing history.
std::unique_ptr<ISignalRule> createSmaCrossoverRule();

} // namespace smacross
