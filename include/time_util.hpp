#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace smacross {

/// Parse a bar timestamp into Unix seconds (UTC).
/// Accepts: "1704067200" (seconds), "1704067200000" (milliseconds), "2024-01-02",
/// "2024-01-02T09:30", "2024-01-02 09:30:00", "2024-01-02T09:30:00Z", "2024-01-02 00:00:00+00:00".
/// A trailing zone suffix is ignored (timestamps are treated as UTC).
std::optional<std::int64_t> parseTimestamp(const std::string& ts);

/// "YYYY-MM-DDTHH:MM:SS" for any time; "YYYY-MM-DD" when date_only is set.
std::string formatTimestamp(std::int64_t unix_seconds, bool date_only = false);

/// Length of a bar resolution string in seconds: "1m", "5m", "15m", "1h" ("1hr"), "4h", "1d".
/// Returns 0 for an unknown resolution.
std::int64_t resolutionSeconds(const std::string& resolution);

/// Bars per year for a resolution, on a 252-trading-day year (1d = 252, 1h = 252*24, ...).
/// Returns 0 for an unknown resolution.
double annualizationFactorFor(const std::string& resolution);

/// Bars per year for bars spaced `seconds` apart, on the same 252-day year. Returns 0 if seconds <= 0.
double annualizationFactorForSpacing(std::int64_t seconds);

} // namespace smacross
