#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace sky {

// Deterministic fixed-point value used for every amount and multiplier.
// Stakes, balances and payouts are quantized to cents; multipliers to hundredths.
class Fixed64 {
public:
    static constexpr std::int64_t kScale = 1'000'000; // microunits
    static constexpr std::int64_t kCent = kScale / 100;
    static constexpr std::int64_t kMaxWhole =
        std::numeric_limits<std::int64_t>::max() / kScale;
    static constexpr std::int64_t kMinWhole =
        std::numeric_limits<std::int64_t>::min() / kScale;

    Fixed64() : raw_(0) {}
    explicit Fixed64(std::int64_t whole) : raw_(scaleWhole(whole)) {}
    static Fixed64 fromRaw(std::int64_t raw) { return Fixed64(raw, RawTag{}); }
    static Fixed64 fromCents(std::int64_t cents) {
        if (cents > std::numeric_limits<std::int64_t>::max() / kCent ||
            cents < std::numeric_limits<std::int64_t>::min() / kCent) {
            throw std::overflow_error("Fixed64 cent value out of range");
        }
        return Fixed64(cents * kCent, RawTag{});
    }
    static Fixed64 fromDouble(double value) {
        double scaled = std::round(value * static_cast<double>(kScale));
        if (scaled >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return Fixed64(std::numeric_limits<std::int64_t>::max(), RawTag{});
        }
        if (scaled <= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
            return Fixed64(std::numeric_limits<std::int64_t>::min(), RawTag{});
        }
        return Fixed64(static_cast<std::int64_t>(scaled), RawTag{});
    }

    // Parses "12", "12.5", "-0.75". At most six fractional digits.
    static Fixed64 parse(const std::string& text);

    double toDouble() const { return static_cast<double>(raw_) / static_cast<double>(kScale); }
    std::int64_t raw() const { return raw_; }
    std::int64_t cents() const { return raw_ / kCent; }

    // Truncates toward negative infinity onto the cent grid.
    Fixed64 floorToCents() const { return Fixed64(floorTo(raw_, kCent), RawTag{}); }
    // Multipliers share the cent grid (0.01x).
    Fixed64 floorToHundredths() const { return floorToCents(); }
    Fixed64 roundToHundredths() const;
    bool isCentAligned() const { return raw_ % kCent == 0; }

    std::string toString(int decimals = 2) const;

    Fixed64 operator+(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) + static_cast<__int128>(other.raw_);
        return Fixed64(clampToInt64(wide), RawTag{});
    }
    Fixed64 operator-(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) - static_cast<__int128>(other.raw_);
        return Fixed64(clampToInt64(wide), RawTag{});
    }

    Fixed64 operator*(Fixed64 other) const {
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(other.raw_);
        wide /= kScale;
        return Fixed64(clampToInt64(wide), RawTag{});
    }

    Fixed64 operator/(Fixed64 other) const {
        if (other.raw_ == 0) {
            return Fixed64(0, RawTag{});
        }
        __int128 wide = static_cast<__int128>(raw_) * static_cast<__int128>(kScale);
        wide /= other.raw_;
        return Fixed64(clampToInt64(wide), RawTag{});
    }

    Fixed64& operator+=(Fixed64 other) {
        *this = *this + other;
        return *this;
    }

    Fixed64& operator-=(Fixed64 other) {
        *this = *this - other;
        return *this;
    }

    bool operator<(Fixed64 other) const { return raw_ < other.raw_; }
    bool operator>(Fixed64 other) const { return raw_ > other.raw_; }
    bool operator<=(Fixed64 other) const { return raw_ <= other.raw_; }
    bool operator>=(Fixed64 other) const { return raw_ >= other.raw_; }
    bool operator==(Fixed64 other) const { return raw_ == other.raw_; }
    bool operator!=(Fixed64 other) const { return raw_ != other.raw_; }

private:
    struct RawTag {};
    explicit Fixed64(std::int64_t raw, RawTag) : raw_(raw) {}

    static std::int64_t clampToInt64(__int128 value) {
        if (value > static_cast<__int128>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        if (value < static_cast<__int128>(std::numeric_limits<std::int64_t>::min())) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }

    static std::int64_t scaleWhole(std::int64_t whole) {
        if (whole > kMaxWhole || whole < kMinWhole) {
            throw std::overflow_error("Fixed64 whole value out of range");
        }
        __int128 wide = static_cast<__int128>(whole) * static_cast<__int128>(kScale);
        return static_cast<std::int64_t>(wide);
    }

    static std::int64_t floorTo(std::int64_t raw, std::int64_t quantum) {
        std::int64_t rem = raw % quantum;
        if (rem < 0) {
            rem += quantum;
        }
        return raw - rem;
    }

    std::int64_t raw_;
};

// Payout for a stake settled at a multiplier, truncated to whole cents.
inline Fixed64 payoutFor(Fixed64 stake, Fixed64 multiplier) {
    return (stake * multiplier).floorToCents();
}

} // namespace sky
