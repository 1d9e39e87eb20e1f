#pragma once

#include <stdexcept>
#include <string>

namespace smacross {

/// Rejected input: bad configuration or a malformed bar series.
/// Raised before any bar is simulated.
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what) : std::invalid_argument(what) {}
};

/// Internal state that must never occur (e.g. negative cash). Not recoverable.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace smacross
