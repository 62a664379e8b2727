#include "fixed_point.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace sky {

Fixed64 Fixed64::parse(const std::string& text) {
    std::size_t pos = 0;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    std::size_t end = text.size();
    while (end > pos && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    if (pos == end) {
        throw std::invalid_argument("empty decimal string");
    }

    bool negative = false;
    if (text[pos] == '-' || text[pos] == '+') {
        negative = text[pos] == '-';
        ++pos;
    }

    __int128 whole = 0;
    std::int64_t fraction = 0;
    int fractionDigits = 0;
    bool seenDigit = false;
    bool seenPoint = false;
    for (; pos < end; ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seenPoint) {
                throw std::invalid_argument("malformed decimal: " + text);
            }
            seenPoint = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("malformed decimal: " + text);
        }
        seenDigit = true;
        int digit = c - '0';
        if (seenPoint) {
            if (fractionDigits == 6) {
                throw std::invalid_argument("too many fractional digits: " + text);
            }
            fraction = fraction * 10 + digit;
            ++fractionDigits;
        } else {
            whole = whole * 10 + digit;
            if (whole > kMaxWhole) {
                throw std::overflow_error("decimal out of range: " + text);
            }
        }
    }
    if (!seenDigit) {
        throw std::invalid_argument("malformed decimal: " + text);
    }
    for (int i = fractionDigits; i < 6; ++i) {
        fraction *= 10;
    }

    __int128 raw = whole * kScale + fraction;
    if (negative) {
        raw = -raw;
    }
    if (raw > std::numeric_limits<std::int64_t>::max() || raw < std::numeric_limits<std::int64_t>::min()) {
        throw std::overflow_error("decimal out of range: " + text);
    }
    return Fixed64(static_cast<std::int64_t>(raw), RawTag{});
}

Fixed64 Fixed64::roundToHundredths() const {
    std::int64_t half = kCent / 2;
    std::int64_t shifted = raw_ >= 0 ? raw_ + half : raw_ - half;
    return Fixed64(shifted - (shifted % kCent), RawTag{});
}

std::string Fixed64::toString(int decimals) const {
    if (decimals < 0) {
        decimals = 0;
    }
    if (decimals > 6) {
        decimals = 6;
    }
    std::int64_t divisor = 1;
    for (int i = decimals; i < 6; ++i) {
        divisor *= 10;
    }

    // Truncation toward zero keeps rendered amounts from overstating a balance.
    __int128 magnitude = raw_ < 0 ? -static_cast<__int128>(raw_) : static_cast<__int128>(raw_);
    std::int64_t units = static_cast<std::int64_t>(magnitude / divisor);
    std::int64_t perWhole = kScale / divisor;

    std::ostringstream oss;
    if (raw_ < 0 && units != 0) {
        oss << '-';
    }
    oss << units / perWhole;
    if (decimals > 0) {
        oss << '.' << std::setw(decimals) << std::setfill('0') << units % perWhole;
    }
    return oss.str();
}

} // namespace sky
