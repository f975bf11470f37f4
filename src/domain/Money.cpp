#include "domain/Money.hpp"

#include <cctype>
#include <limits>

namespace phh::domain {

std::optional<Money> Money::parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::int64_t whole = 0;
    std::int64_t frac = 0;
    int fracDigits = 0;
    bool seenDot = false;
    bool seenDigit = false;

    constexpr std::int64_t kMaxWhole = std::numeric_limits<std::int64_t>::max() / kScale - 1;

    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '.') {
            if (seenDot) return std::nullopt;
            seenDot = true;
            continue;
        }
        if (!std::isdigit(c)) return std::nullopt;
        seenDigit = true;

        const int digit = c - '0';
        if (seenDot) {
            if (fracDigits == kFractionDigits) return std::nullopt;
            frac = frac * 10 + digit;
            ++fracDigits;
        } else {
            whole = whole * 10 + digit;
            if (whole > kMaxWhole) return std::nullopt;
        }
    }

    if (!seenDigit) return std::nullopt;

    for (int i = fracDigits; i < kFractionDigits; ++i) {
        frac *= 10;
    }
    return fromUnits(whole * kScale + frac);
}

std::string Money::toString() const {
    std::int64_t v = units_;
    std::string out;
    if (v < 0) {
        out.push_back('-');
        v = -v;
    }

    out += std::to_string(v / kScale);

    std::int64_t frac = v % kScale;
    if (frac == 0) return out;

    std::string digits(kFractionDigits, '0');
    for (int i = kFractionDigits - 1; i >= 0; --i) {
        digits[static_cast<size_t>(i)] = static_cast<char>('0' + frac % 10);
        frac /= 10;
    }
    while (!digits.empty() && digits.back() == '0') digits.pop_back();

    out.push_back('.');
    out += digits;
    return out;
}

} // namespace phh::domain
