#include "signal_rule.hpp"

namespace smacross {

const char* toString(Signal s) {
    return s == Signal::Long ? "long" : "flat";
}

const char* toString(PositionChange c) {
    switch (c) {
        case PositionChange::Enter: return "enter";
        case PositionChange::Exit: return "exit";
        case PositionChange::None: break;
    }
    return "none";
}

std::vector<PositionChange> derivePositionChanges(const std::vector<Signal>& signals) {
    std::vector<PositionChange> changes(signals.size(), PositionChange::None);
    for (std::size_t i = 1; i < signals.size(); ++i) {
        if (signals[i - 1] == Signal::Flat && signals[i] == Signal::Long)
            changes[i] = PositionChange::Enter;
        else if (signals[i - 1] == Signal::Long && signals[i] == Signal::Flat)
            changes[i] = PositionChange::Exit;
    }
    return changes;
}

} // namespace smacross
