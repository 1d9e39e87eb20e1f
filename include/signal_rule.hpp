#pragma once

#include "indicator.hpp"
#include <string>
#include <vector>

namespace smacross {

enum class Signal { Flat, Long };

enum class PositionChange { None, Enter, Exit };

const char* toString(Signal s);
const char* toString(PositionChange c);

/// Interface a signal rule must implement: two aligned indicator sequences in, one Signal per bar out.
/// Entry i may only depend on indicator entries 0..i (no look-ahead).
/// An undefined indicator value must resolve to Signal::Flat.
class ISignalRule {
public:
    virtual ~ISignalRule() = default;

    /// Throws InvalidParameter if fast and slow differ in length.
    virtual std::vector<Signal> generate(const std::vector<IndicatorValue>& fast,
                                         const std::vector<IndicatorValue>& slow) const = 0;

    /// Short name for reports, e.g. "sma_crossover".
    virtual std::string name() const = 0;
};

/// Enter on Flat->Long, Exit on Long->Flat, None otherwise. Index 0 is always None.
std::vector<PositionChange> derivePositionChanges(const std::vector<Signal>& signals);

} // namespace smacross
