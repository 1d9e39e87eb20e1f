#include "data_source.hpp"
#include "time_util.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <sstream>
#include <stdexcept>

namespace smacross {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\"");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\"");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delim) {
    std::vector<std::string> parts;
    std::istringstream iss(line);
    std::string part;
    while (std::getline(iss, part, delim)) {
        parts.push_back(trim(part));
    }
    return parts;
}

void toLower(std::string& s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

int findColumn(const std::vector<std::string>& headers, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        for (std::size_t i = 0; i < headers.size(); ++i) {
            if (headers[i] == name) return static_cast<int>(i);
        }
    }
    return -1;
}

// Strict number parse: the whole field must be consumed
bool parseNumber(const std::vector<std::string>& parts, int index, double& out) {
    if (index < 0 || static_cast<std::size_t>(index) >= parts.size()) return false;
    const std::string& s = parts[static_cast<std::size_t>(index)];
    try {
        std::size_t pos = 0;
        out = std::stod(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

DataSource::DataSource(const std::string& filepath) : filepath_(filepath) {}

bool DataSource::load() {
    bars_.clear();
    skipped_rows_ = 0;
    duplicate_rows_ = 0;

    std::ifstream f(filepath_);
    if (!f.is_open()) {
        std::cerr << "Failed to open data file: " << filepath_ << "\n";
        return false;
    }

    std::string line;
    if (!std::getline(f, line)) {
        std::cerr << "Empty data file: " << filepath_ << "\n";
        return false;
    }
    // Strip UTF-8 BOM
    if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

    std::vector<std::string> headers = split(line, ',');
    for (auto& h : headers) toLower(h);

    Columns cols;
    cols.time = findColumn(headers, {"timestamp", "date", "datetime", "time"});
    cols.open = findColumn(headers, {"open", "o"});
    cols.high = findColumn(headers, {"high", "h"});
    cols.low = findColumn(headers, {"low", "l"});
    cols.close = findColumn(headers, {"close", "c", "close price", "adj close", "price"});
    cols.volume = findColumn(headers, {"volume", "vol", "v"});
    // Multi-row yfinance header ("Price,Close,...", "Ticker,...", "Date,,,"): dates sit in the unnamed first column
    if (cols.time < 0 && !headers.empty() && cols.close != 0 && cols.open != 0 && cols.high != 0
        && cols.low != 0 && cols.volume != 0)
        cols.time = 0;

    if (cols.time < 0 || cols.close < 0) {
        std::cerr << "Missing timestamp or close/price column in " << filepath_ << "\n";
        return false;
    }
    int missingOhlc = (cols.open < 0) + (cols.high < 0) + (cols.low < 0);
    if (missingOhlc != 0 && missingOhlc != 3) {
        std::cerr << "Incomplete open/high/low columns in " << filepath_ << "\n";
        return false;
    }

    bool in_data = false;
    while (std::getline(f, line)) {
        if (trim(line).empty()) continue;
        if (!in_data) {
            // Extra header rows before the first row with a parseable timestamp
            auto parts = split(line, ',');
            if (static_cast<std::size_t>(cols.time) >= parts.size()
                || !parseTimestamp(parts[static_cast<std::size_t>(cols.time)]))
                continue;
            in_data = true;
        }
        auto bar = parseLine(line, cols);
        if (!bar) {
            ++skipped_rows_;
            continue;
        }
        bars_.push_back(*bar);
    }

    std::stable_sort(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.time < b.time;
    });
    auto last = std::unique(bars_.begin(), bars_.end(), [](const Bar& a, const Bar& b) {
        return a.time == b.time;
    });
    duplicate_rows_ = static_cast<std::size_t>(std::distance(last, bars_.end()));
    bars_.erase(last, bars_.end());

    if (skipped_rows_ > 0)
        std::cerr << "Skipped " << skipped_rows_ << " invalid rows in " << filepath_ << "\n";
    if (duplicate_rows_ > 0)
        std::cerr << "Dropped " << duplicate_rows_ << " rows with duplicate timestamps in " << filepath_ << "\n";
    return true;
}

std::optional<Bar> DataSource::parseLine(const std::string& line, const Columns& cols) {
    auto parts = split(line, ',');
    if (cols.time < 0 || static_cast<std::size_t>(cols.time) >= parts.size()) return std::nullopt;

    auto time = parseTimestamp(parts[static_cast<std::size_t>(cols.time)]);
    if (!time) return std::nullopt;

    Bar b;
    b.time = *time;
    if (!parseNumber(parts, cols.close, b.close)) return std::nullopt;
    if (cols.open >= 0) {
        if (!parseNumber(parts, cols.open, b.open) || !parseNumber(parts, cols.high, b.high)
            || !parseNumber(parts, cols.low, b.low))
            return std::nullopt;
    } else {
        b.open = b.high = b.low = b.close;
    }
    if (cols.volume >= 0 && static_cast<std::size_t>(cols.volume) < parts.size()
        && !parts[static_cast<std::size_t>(cols.volume)].empty()) {
        if (!parseNumber(parts, cols.volume, b.volume)) return std::nullopt;
    }

    if (PriceSeries::checkBar(b)) return std::nullopt;
    return b;
}

bool DataSource::aggregateBars(const std::string& resolution) {
    const std::int64_t interval = resolutionSeconds(resolution);
    if (interval <= 0) return false;
    if (interval == 60) return true;

    std::map<std::int64_t, Bar> bucketToBar;
    for (const Bar& b : bars_) {
        std::int64_t rem = b.time % interval;
        if (rem < 0) rem += interval;
        std::int64_t key = b.time - rem;
        auto it = bucketToBar.find(key);
        if (it == bucketToBar.end()) {
            Bar agg = b;
            agg.time = key;
            bucketToBar[key] = agg;
        } else {
            Bar& agg = it->second;
            if (b.high > agg.high) agg.high = b.high;
            if (b.low < agg.low) agg.low = b.low;
            agg.close = b.close;
            agg.volume += b.volume;
        }
    }
    bars_.clear();
    for (const auto& p : bucketToBar)
        bars_.push_back(p.second);
    return true;
}

} // namespace smacross
