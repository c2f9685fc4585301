/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <limits>
#include <source_location>
#include <spanstream>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace derivsim
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

inline const decimal_t kInfinity = std::numeric_limits<decimal_t>::infinity();

}  // namespace derivsim

//-------------------------------------------------------------------------

namespace derivsim::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 8;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(BloombergLP::bdldfp::DecimalConvertUtil::decimal64FromDouble(val), decimalPlaces);
}

[[nodiscard]] inline decimal_t parseDecimal(const std::string& str)
{
    decimal_t parsed;
    if (str.empty()
        || BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, str.c_str()) != 0
        || !BloombergLP::bdldfp::DecimalUtil::isFinite(parsed)) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot parse '{}' as a decimal",
            std::source_location::current().function_name(),
            str)};
    }
    return parsed;
}

[[nodiscard]] inline bool isFinite(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

[[nodiscard]] inline decimal_t dec1p(decimal_t val) noexcept
{
    return 1 + val;
}

[[nodiscard]] inline decimal_t dec1m(decimal_t val) noexcept
{
    return 1 - val;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

}  // namespace derivsim::util

//-------------------------------------------------------------------------

namespace derivsim::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace derivsim::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<derivsim::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(derivsim::decimal_t val, FormatContext& ctx) const
    {
        using namespace derivsim::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
