#ifndef TIERLEND_APP_MISC_EXTERNALPROVIDERS_H_INCLUDED
#define TIERLEND_APP_MISC_EXTERNALPROVIDERS_H_INCLUDED

#include <xrpl/basics/Expected.h>

#include <cstdint>
#include <string>

namespace tierlend {

/** Converts the staked asset into a liquid derivative and back.

    Conversions are assumed to be 1:1. An error string means the call
    failed and the operation invoking it must be rolled back.
*/
class LiquidityConverter
{
public:
    virtual ~LiquidityConverter() = default;

    virtual ripple::Expected<std::uint64_t, std::string>
    convert(std::uint64_t amount) = 0;

    virtual ripple::Expected<std::uint64_t, std::string>
    redeem(std::uint64_t derivativeAmount) = 0;
};

/** Opens and closes leveraged positions collateralized by the derivative. */
class LeverageProvider
{
public:
    virtual ~LeverageProvider() = default;

    /** Returns a handle identifying the new position. */
    virtual ripple::Expected<std::string, std::string>
    open(std::uint64_t collateral) = 0;

    /** Returns the derivative amount released by closing the position. */
    virtual ripple::Expected<std::uint64_t, std::string>
    close(std::string const& handle) = 0;
};

/** The providers available to operations while they apply. */
struct ProviderSet
{
    LiquidityConverter& converter;
    LeverageProvider& leverage;
};

}  // namespace tierlend

#endif
