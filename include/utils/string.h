// Copyright (c) 2026 UltiMaker
// TravelOptimizer is released under the terms of the AGPLv3 or higher

#ifndef UTILS_STRING_H
#define UTILS_STRING_H

#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <ostream>
#include <span>
#include <string_view>

#include "utils/math.h"

namespace travel
{

// c++11 no longer supplies a strcasecmp, so define our own version.
static inline int stringcasecompare(const char* a, const char* b)
{
    while (*a && *b)
    {
        if (tolower(*a) != tolower(*b))
            return tolower(*a) - tolower(*b);
        a++;
        b++;
    }
    return *a - *b;
}

/*!
 * \brief Trims spaces, tabs and carriage returns from both ends of a view.
 */
[[nodiscard]] inline std::string_view trim(std::string_view text)
{
    constexpr std::string_view whitespace = " \t\r\n";
    const size_t first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const size_t last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

/*!
 * \brief Format a fixed point unsigned integer as a decimal ascii string.
 * \tparam fixed_precision log10 of the fixed point scaling factor
 * \tparam out_precision Number of decimal places to be written
 * \param buffer_end Pointer past the end of the output buffer
 * \param value The unsigned value to format
 * \return A pair of char*, delimiting the result range in the buffer
 */
template<unsigned fixed_precision, unsigned out_precision, size_t buffer_length>
static inline std::span<char> format_unsigned_decimal_fixed_point(std::array<char, buffer_length>& buffer, size_t value)
{
    // Rounding to the required precision
    if constexpr (fixed_precision > out_precision)
    {
        value = round_divide(value, ipow(size_t{ 10 }, fixed_precision - out_precision));
    }

    if (value != 0)
    {
        // Writes pairs of digit backward in the buffer. This is heavily inspired by the fmt library.
        size_t quotient = value;
        auto begin = buffer.end();
        while (quotient >= 10)
        {
            const char* twodigits = &"0001020304050607080910111213141516171819"
                                     "2021222324252627282930313233343536373839"
                                     "4041424344454647484950515253545556575859"
                                     "6061626364656667686970717273747576777879"
                                     "8081828384858687888990919293949596979899"[(quotient % 100) * 2];
            quotient /= 100;
            begin -= 2;
            assert(begin >= buffer.begin());
            begin[0] = twodigits[0];
            begin[1] = twodigits[1];
        }
        if (quotient > 0)
        { // Odd number of digits
            assert(begin > buffer.begin());
            *--begin = '0' + static_cast<char>(quotient);
        }
        else if (*begin == '0')
        { // The last division by 100 might have produced a leading zero, drop it
            begin++;
        }

        // Trims zeros at the right of the fractional part
        const auto first_fractional_place = buffer.end() - out_precision;
        auto end = buffer.end();
        while (end > first_fractional_place && *(end - 1) == '0')
        {
            --end;
        }
        if (end > first_fractional_place)
        { // We have a factional part
            if (begin < first_fractional_place)
            {
                // We also have an integral part: move it one char to the left to make room for the '.'
                assert(begin > buffer.begin());
                *std::copy(begin, first_fractional_place, begin - 1) = '.';
                --begin;
            }
            else
            {
                // fractional only: fill '0's at the left of the fractional part
                std::fill(first_fractional_place, begin, '0');
                begin = first_fractional_place - 2;
                assert(begin >= buffer.begin());
                begin[0] = '0';
                begin[1] = '.';
            }
        }
        return { begin, end };
    }
    else
    {
        static_assert(buffer_length >= 1);
        char* const begin = buffer.end() - 1;
        *begin = '0';
        return { begin, buffer.end() };
    }
}

/*!
 * \brief Format a fixed point signed integer as a decimal ascii string.
 * \tparam fixed_precision log10 of the fixed point scaling factor
 * \tparam out_precision Number of decimal places to be written
 * \param value The signed value to format
 * \return A pair of char*, delimiting the result range in the buffer
 */
template<unsigned fixed_precision, unsigned out_precision, size_t buffer_length>
static inline std::span<char> format_signed_decimal_fixed_point(std::array<char, buffer_length>& buffer, ptrdiff_t value)
{
    bool is_neg = value < 0;
    auto abs_value = static_cast<size_t>(is_neg ? -value : value);
    auto result = format_unsigned_decimal_fixed_point<fixed_precision, out_precision>(buffer, abs_value);
    if (is_neg)
    {
        auto begin = --result.begin();
        *begin = '-';
        return { begin, result.end() };
    }
    return result;
}

/*!
 * \brief Wraps a double for writing it in base 10 to a ostream with at most a fixed number of decimal places.
 *
 * Trailing zeros of the fractional part are not written, so 10.500 is written as "10.5" and 3.000 as "3".
 * \tparam precision The number of decimal places
 * \warning Does not allows values larger that LLONG_MAX / 10^precision
 */
template<size_t precision>
struct PrecisionedDouble
{
    double value; //!< The double value

    friend inline std::ostream& operator<<(std::ostream& out, const PrecisionedDouble input)
    {
        constexpr size_t buffer_size = std::numeric_limits<int64_t>::digits10 + 3;
        // +1 because digits10 is log_10(max) rounded down
        // +1 for the sign
        // +1 for the decimal separator
        std::array<char, buffer_size> buffer;

        constexpr size_t factor = ipow(size_t{ 10 }, precision);
        double scaled_value = input.value * factor;
        assert(std::abs(scaled_value) < static_cast<double>(std::numeric_limits<int64_t>::max()));
        int64_t fixed_point = std::llround(scaled_value);
        auto res = format_signed_decimal_fixed_point<precision, precision>(buffer, fixed_point);
        out.write(&res.front(), static_cast<std::streamsize>(res.size()));
        return out;
    }
};

} // namespace travel

#endif // UTILS_STRING_H
