#pragma once

#include <string>
#include <utility>

#include "lending/types.hpp"

namespace lending {

/**
 * Decimal with exactly four fractional digits, stored as an integer
 * scaled by 10^4. Used for average rates and matching efficiency so that
 * results stay bit-reproducible (no floating point anywhere).
 */
class Decimal4
{
public:
    static constexpr unsigned kFractionDigits = 4;

    Decimal4() = default;

    /// Value whose scaled representation is `scaled` (1.5 == from_scaled(15000)).
    static Decimal4 from_scaled(Amount scaled);

    /// numerator / denominator truncated toward zero at four digits.
    /// Zero when the denominator is zero.
    static Decimal4 quotient(const Amount& numerator, const Amount& denominator);

    const Amount& scaled() const noexcept { return scaled_; }
    bool is_zero() const { return scaled_ == 0; }

    /// "466.6666", "1.0000", "-0.5000".
    std::string to_string() const;

    friend bool operator==(const Decimal4& a, const Decimal4& b) { return a.scaled_ == b.scaled_; }
    friend bool operator!=(const Decimal4& a, const Decimal4& b) { return a.scaled_ != b.scaled_; }
    friend bool operator<(const Decimal4& a, const Decimal4& b)  { return a.scaled_ < b.scaled_; }
    friend bool operator>(const Decimal4& a, const Decimal4& b)  { return a.scaled_ > b.scaled_; }
    friend bool operator<=(const Decimal4& a, const Decimal4& b) { return a.scaled_ <= b.scaled_; }
    friend bool operator>=(const Decimal4& a, const Decimal4& b) { return a.scaled_ >= b.scaled_; }

private:
    explicit Decimal4(Amount scaled) : scaled_(std::move(scaled)) {}

    Amount scaled_{0};
};

/// Basis points as a percent string with two decimals: 466 -> "4.66%".
std::string format_rate_percent(const RateBps& bps);

} // namespace lending
