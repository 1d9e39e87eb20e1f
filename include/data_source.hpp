#pragma once

#include "bar.hpp"
#include "price_series.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace smacross {

/// Loads OHLCV bars from a CSV file.
/// Columns are found by header name: timestamp/date/datetime/time, open, high, low, close (or
/// "close price", "adj close", price) [, volume]. A file with only a price column yields bars with
/// open = high = low = close. Without a named time column the first column holds the time, and
/// header rows before the first parseable timestamp are ignored.
/// Rows that fail to parse or break the OHLC invariants are skipped; bars are sorted by time and
/// rows repeating an earlier timestamp are dropped.
class DataSource {
public:
    explicit DataSource(const std::string& filepath);

    /// Load bars from the CSV file. Returns false (with a message on stderr) if the file cannot be
    /// opened or lacks the required columns.
    bool load();

    const std::vector<Bar>& bars() const { return bars_; }
    std::size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }
    const Bar& at(std::size_t i) const { return bars_.at(i); }

    std::size_t skippedRows() const { return skipped_rows_; }
    std::size_t duplicateRows() const { return duplicate_rows_; }

    /// Resample into coarser bars: "1m" (no-op), "5m", "15m", "1h" (or "1hr"), "4h", "1d".
    /// OHLCV: open=first, high=max, low=min, close=last, volume=sum. Returns false for an unknown resolution.
    bool aggregateBars(const std::string& resolution);

    /// Validated series of the loaded bars. Throws InvalidParameter if the bars are not a valid series.
    PriceSeries series() const { return PriceSeries(bars_); }

private:
    struct Columns {
        int time{-1};
        int open{-1};
        int high{-1};
        int low{-1};
        int close{-1};
        int volume{-1};
    };

    std::string filepath_;
    std::vector<Bar> bars_;
    std::size_t skipped_rows_{0};
    std::size_t duplicate_rows_{0};

    static std::optional<Bar> parseLine(const std::string& line, const Columns& cols);
};

} // namespace smacross
