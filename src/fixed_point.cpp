#include "lending/fixed_point.hpp"

#include <utility>

namespace lending {

namespace {

const Amount& scale()
{
    static const Amount kScale = 10000; // 10^kFractionDigits
    return kScale;
}

// Splits |value| into "<int>.<frac>" with `digits` fractional digits.
std::string format_scaled(const Amount& value, const Amount& divisor, unsigned digits)
{
    const bool negative = value < 0;
    const Amount magnitude = negative ? Amount(-value) : value;

    const Amount whole = magnitude / divisor;
    const Amount frac  = magnitude % divisor;

    std::string frac_str = frac.str();
    if (frac_str.size() < digits)
        frac_str.insert(0, digits - frac_str.size(), '0');

    std::string out;
    if (negative)
        out += '-';
    out += whole.str();
    out += '.';
    out += frac_str;
    return out;
}

} // namespace

Decimal4 Decimal4::from_scaled(Amount scaled)
{
    return Decimal4(std::move(scaled));
}

Decimal4 Decimal4::quotient(const Amount& numerator, const Amount& denominator)
{
    if (denominator == 0)
        return Decimal4{};

    // cpp_int division truncates toward zero.
    return Decimal4(numerator * scale() / denominator);
}

std::string Decimal4::to_string() const
{
    return format_scaled(scaled_, scale(), kFractionDigits);
}

std::string format_rate_percent(const RateBps& bps)
{
    return format_scaled(bps, Amount(100), 2) + "%";
}

} // namespace lending
