#ifndef TIERLEND_BASICS_CHECKEDMATH_H_INCLUDED
#define TIERLEND_BASICS_CHECKEDMATH_H_INCLUDED

#include <cstdint>
#include <initializer_list>
#include <optional>

namespace tierlend {

/** Overflow checked arithmetic on unsigned 64-bit amounts.

    Every function returns std::nullopt instead of wrapping. Callers turn
    that into tecARITHMETIC_OVERFLOW.
*/

std::optional<std::uint64_t>
checkedAdd(std::uint64_t a, std::uint64_t b);

/** Returns std::nullopt if b > a. */
std::optional<std::uint64_t>
checkedSub(std::uint64_t a, std::uint64_t b);

std::optional<std::uint64_t>
checkedMul(std::uint64_t a, std::uint64_t b);

/** Return value*mul/div, truncated, with a 128-bit intermediate.

    Returns std::nullopt when div is zero or the quotient does not fit.
*/
std::optional<std::uint64_t>
checkedMulDiv(std::uint64_t value, std::uint64_t mul, std::uint64_t div);

/** Return (f1*f2*...*fn)/div, truncated.

    The product is formed in a checked 128-bit integer so no intermediate
    rounding happens; an overflow of the product or the quotient yields
    std::nullopt.
*/
std::optional<std::uint64_t>
checkedProductDiv(
    std::initializer_list<std::uint64_t> factors,
    std::uint64_t div);

}  // namespace tierlend

#endif
