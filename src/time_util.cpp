#include "time_util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace smacross {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;
constexpr double TRADING_DAYS_PER_YEAR = 252.0;

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, int& year, unsigned& month, unsigned& day) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (month <= 2));
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

bool readInt(const std::string& s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size()) return false;
    std::string part = s.substr(pos, len);
    if (!allDigits(part)) return false;
    out = std::stoi(part);
    return true;
}

} // namespace

std::optional<std::int64_t> parseTimestamp(const std::string& ts) {
    if (ts.empty()) return std::nullopt;

    // Numeric epoch: seconds, or milliseconds when too large to be seconds
    if (allDigits(ts)) {
        try {
            long long v = std::stoll(ts);
            if (v > 100000000000LL) v /= 1000;
            return static_cast<std::int64_t>(v);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    // Date YYYY-MM-DD
    int year = 0, month = 0, day = 0;
    if (ts.size() < 10 || ts[4] != '-' || ts[7] != '-') return std::nullopt;
    if (!readInt(ts, 0, 4, year) || !readInt(ts, 5, 2, month) || !readInt(ts, 8, 2, day))
        return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    if (ts.size() > 10) {
        if (ts[10] != 'T' && ts[10] != ' ') return std::nullopt;
        std::string timePart = ts.substr(11);
        // Drop zone suffix ("Z", "+00:00", "-05:00") and fractional seconds
        auto zone = timePart.find_first_of("Z+-");
        if (zone != std::string::npos) timePart = timePart.substr(0, zone);
        auto frac = timePart.find('.');
        if (frac != std::string::npos) timePart = timePart.substr(0, frac);
        for (auto& c : timePart) if (c == '_') c = ':';

        if (!timePart.empty()) {
            if (!readInt(timePart, 0, 2, hour) || timePart.size() < 5 || timePart[2] != ':'
                || !readInt(timePart, 3, 2, minute))
                return std::nullopt;
            if (timePart.size() > 5) {
                if (timePart[5] != ':' || !readInt(timePart, 6, 2, second)) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
}

std::string formatTimestamp(std::int64_t unix_seconds, bool date_only) {
    std::int64_t days = unix_seconds / SECONDS_PER_DAY;
    std::int64_t rem = unix_seconds % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        --days;
    }
    int year = 0;
    unsigned month = 0, day = 0;
    civilFromDays(days, year, month, day);

    char buf[32];
    if (date_only) {
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    } else {
        int h = static_cast<int>(rem / 3600);
        int m = static_cast<int>((rem % 3600) / 60);
        int s = static_cast<int>(rem % 60);
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", year, month, day, h, m, s);
    }
    return std::string(buf);
}

std::int64_t resolutionSeconds(const std::string& resolution) {
    std::string r = resolution;
    for (auto& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (r == "1m") return 60;
    if (r == "5m") return 5 * 60;
    if (r == "15m") return 15 * 60;
    if (r == "1h" || r == "1hr") return 3600;
    if (r == "4h") return 4 * 3600;
    if (r == "1d") return SECONDS_PER_DAY;
    return 0;
}

double annualizationFactorFor(const std::string& resolution) {
    return annualizationFactorForSpacing(resolutionSeconds(resolution));
}

double annualizationFactorForSpacing(std::int64_t seconds) {
    if (seconds <= 0) return 0;
    return TRADING_DAYS_PER_YEAR * static_cast<double>(SECONDS_PER_DAY) / static_cast<double>(seconds);
}

} // namespace smacross
