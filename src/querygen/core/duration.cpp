#include "querygen/core/duration.h"
#include <cctype>
#include <cmath>
#include <limits>

namespace querygen {
namespace core {

namespace {

// Nanoseconds per unit; nullopt for an unknown unit.
std::optional<long double> UnitScale(const std::string& unit) {
    if (unit == "ns") return 1.0L;
    if (unit == "us" || unit == "\xC2\xB5s" || unit == "\xCE\xBCs") return 1e3L;
    if (unit == "ms") return 1e6L;
    if (unit == "s") return 1e9L;
    if (unit == "m") return 60e9L;
    if (unit == "h") return 3600e9L;
    return std::nullopt;
}

} // namespace

Result<Duration> ParseDuration(const std::string& text) {
    if (text.empty()) {
        return Result<Duration>::error("invalid duration \"\"");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }
    if (text.substr(pos) == "0") {
        return Result<Duration>(Duration(0));
    }
    if (pos == text.size()) {
        return Result<Duration>::error("invalid duration \"" + text + "\"");
    }

    long double total_ns = 0.0L;
    while (pos < text.size()) {
        size_t number_start = pos;
        bool seen_digit = false;
        bool seen_dot = false;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            if (text[pos] == '.') {
                if (seen_dot) {
                    return Result<Duration>::error("invalid duration \"" + text + "\"");
                }
                seen_dot = true;
            } else {
                seen_digit = true;
            }
            ++pos;
        }
        if (!seen_digit) {
            return Result<Duration>::error("invalid duration \"" + text + "\"");
        }
        long double number = std::stold(text.substr(number_start, pos - number_start));

        size_t unit_start = pos;
        while (pos < text.size() && text[pos] != '.' &&
               !std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (unit_start == pos) {
            return Result<Duration>::error("missing unit in duration \"" + text + "\"");
        }
        std::string unit = text.substr(unit_start, pos - unit_start);
        auto scale = UnitScale(unit);
        if (!scale) {
            return Result<Duration>::error("unknown unit \"" + unit + "\" in duration \"" + text + "\"");
        }
        total_ns += number * *scale;
    }

    long double total_ms = std::floor(total_ns / 1e6L);
    if (total_ms > static_cast<long double>(std::numeric_limits<int64_t>::max())) {
        return Result<Duration>::error("invalid duration \"" + text + "\": out of range");
    }
    int64_t ms = static_cast<int64_t>(total_ms);
    return Result<Duration>(Duration(negative ? -ms : ms));
}

std::string FormatDuration(Duration duration) {
    int64_t ms = duration.count();
    if (ms == 0) {
        return "0s";
    }

    std::string out;
    if (ms < 0) {
        out = "-";
        ms = -ms;
    }
    if (ms < 1000) {
        return out + std::to_string(ms) + "ms";
    }

    int64_t hours = ms / 3600000;
    int64_t minutes = (ms / 60000) % 60;
    int64_t seconds = (ms / 1000) % 60;
    int64_t millis = ms % 1000;
    if (hours > 0) out += std::to_string(hours) + "h";
    if (minutes > 0) out += std::to_string(minutes) + "m";
    if (seconds > 0 || millis > 0) {
        out += std::to_string(seconds);
        if (millis > 0) {
            std::string frac = std::to_string(millis + 1000).substr(1);
            while (!frac.empty() && frac.back() == '0') frac.pop_back();
            out += "." + frac;
        }
        out += "s";
    }
    return out;
}

} // namespace core
} // namespace querygen
