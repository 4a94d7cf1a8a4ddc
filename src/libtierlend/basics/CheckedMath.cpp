#include <tierlend/basics/CheckedMath.h>
//
#include <xrpl/basics/mulDiv.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <limits>
#include <stdexcept>

namespace tierlend {

std::optional<std::uint64_t>
checkedAdd(std::uint64_t a, std::uint64_t b)
{
    if (a > std::numeric_limits<std::uint64_t>::max() - b)
        return std::nullopt;
    return a + b;
}

std::optional<std::uint64_t>
checkedSub(std::uint64_t a, std::uint64_t b)
{
    if (b > a)
        return std::nullopt;
    return a - b;
}

std::optional<std::uint64_t>
checkedMul(std::uint64_t a, std::uint64_t b)
{
    if (a != 0 && b > std::numeric_limits<std::uint64_t>::max() / a)
        return std::nullopt;
    return a * b;
}

std::optional<std::uint64_t>
checkedMulDiv(std::uint64_t value, std::uint64_t mul, std::uint64_t div)
{
    if (div == 0)
        return std::nullopt;
    return ripple::mulDiv(value, mul, div);
}

std::optional<std::uint64_t>
checkedProductDiv(
    std::initializer_list<std::uint64_t> factors,
    std::uint64_t div)
{
    using namespace boost::multiprecision;

    if (div == 0)
        return std::nullopt;

    try
    {
        checked_uint128_t product = 1;
        for (auto const factor : factors)
            product *= factor;

        checked_uint128_t const quotient = product / div;
        if (quotient > std::numeric_limits<std::uint64_t>::max())
            return std::nullopt;

        return static_cast<std::uint64_t>(quotient);
    }
    catch (std::overflow_error const&)
    {
        return std::nullopt;
    }
}

}  // namespace tierlend
