#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace phh::domain {

// Exact decimal amount (chips or currency) with four fractional digits.
//
// Hand histories print amounts like "150", "$0.02" or "104.02"; they are
// summed and compared, so they are never stored as binary floating point.
class Money {
public:
    static constexpr std::int64_t kScale = 10000;
    static constexpr int          kFractionDigits = 4;

    Money() = default;

    static Money fromUnits(std::int64_t units) {
        Money m;
        m.units_ = units;
        return m;
    }

    static Money whole(std::int64_t value) {
        return fromUnits(value * kScale);
    }

    // Parses "123", "123.4", "0.01". Leading sign, grouping separators and
    // more than kFractionDigits decimals are rejected.
    static std::optional<Money> parse(std::string_view text);

    std::int64_t units() const noexcept { return units_; }
    bool isZero() const noexcept { return units_ == 0; }

    // Shortest exact form: "150", "0.01", "104.02".
    std::string toString() const;

    Money& operator+=(Money other) {
        units_ += other.units_;
        return *this;
    }
    Money& operator-=(Money other) {
        units_ -= other.units_;
        return *this;
    }

    friend Money operator+(Money a, Money b) { return a += b; }
    friend Money operator-(Money a, Money b) { return a -= b; }

    friend bool operator==(Money a, Money b) { return a.units_ == b.units_; }
    friend bool operator!=(Money a, Money b) { return a.units_ != b.units_; }
    friend bool operator<(Money a, Money b) { return a.units_ < b.units_; }
    friend bool operator>(Money a, Money b) { return a.units_ > b.units_; }
    friend bool operator<=(Money a, Money b) { return a.units_ <= b.units_; }
    friend bool operator>=(Money a, Money b) { return a.units_ >= b.units_; }

private:
    std::int64_t units_{0};
};

} // namespace phh::domain
