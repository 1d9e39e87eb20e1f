#include "sma_crossover_rule.hpp"
#include "errors.hpp"
#include <string>

namespace smacross {

/// Fast over slow = Long. Equal values resolve to Flat, so there is no "hold" state.
class SmaCrossoverRule : public ISignalRule {
public:
    std::vector<Signal> generate(const std::vector<IndicatorValue>& fast,
                                 const std::vector<IndicatorValue>& slow) const override {
        if (fast.size() != slow.size()) {
            throw InvalidParameter("indicator length mismatch: fast=" + std::to_string(fast.size())
                                   + " slow=" + std::to_string(slow.size()));
        }
        std::vector<Signal> out(fast.size(), Signal::Flat);
        for (std::size_t i = 0; i < fast.size(); ++i) {
            // Use only values at i (no look-ahead)
            if (fast[i].value && slow[i].value && *fast[i].value > *slow[i].value)
                out[i] = Signal::Long;
        }
        return out;
    }

    std::string name() const override { return "sma_crossover"; }
};

std::unique_ptr<ISignalRule> createSmaCrossoverRule() {
    return std::make_unique<SmaCrossoverRule>();
}

} // namespace smacross
