#include <tierlendd/app/misc/Collateral.h>
//
#include <tierlendd/app/misc/Accrual.h>

#include <tierlend/basics/CheckedMath.h>

#include <limits>

namespace tierlend {

using boost::multiprecision::uint128_t;
using boost::multiprecision::uint256_t;

bool
CollateralSummary::withinBorrowLimit() const
{
    // borrowValue <= weightedLtv / 10000 without the truncation
    return uint128_t{borrowValue} * bipsPerUnity <= weightedLtv;
}

bool
CollateralSummary::liquidatable() const
{
    if (borrowValue == 0)
        return false;
    return weightedThreshold < uint128_t{borrowValue} * bipsPerUnity;
}

std::optional<std::uint64_t>
CollateralSummary::healthFactor() const
{
    if (borrowValue == 0)
        return std::nullopt;

    uint128_t const factor = weightedThreshold / borrowValue;
    if (factor > std::numeric_limits<std::uint64_t>::max())
        return std::numeric_limits<std::uint64_t>::max();
    return static_cast<std::uint64_t>(factor);
}

Expected<CollateralSummary, TER>
summarizeCollateral(ReadView const& view, UserAccount const& account)
{
    CollateralSummary summary;

    for (auto const& [id, position] : account.deposits)
    {
        auto const reserve = view.reserve(id);
        if (!reserve)
            return Unexpected(tefBAD_LEDGER);  // LCOV_EXCL_LINE

        auto const value = positionValue(position, reserve->depositIndex);
        if (!value)
            return Unexpected(value.error());

        auto const total = checkedAdd(summary.collateralValue, *value);
        if (!total)
            return Unexpected(tecARITHMETIC_OVERFLOW);
        summary.collateralValue = *total;

        // Each term is below 2^78; eight positions cannot overflow.
        summary.weightedLtv += uint128_t{*value} * reserve->ltvRatio;
        summary.weightedThreshold +=
            uint128_t{*value} * reserve->liquidationThreshold;
    }

    for (auto const& [id, position] : account.borrows)
    {
        auto const reserve = view.reserve(id);
        if (!reserve)
            return Unexpected(tefBAD_LEDGER);  // LCOV_EXCL_LINE

        auto const value = positionValue(position, reserve->borrowIndex);
        if (!value)
            return Unexpected(value.error());

        auto const total = checkedAdd(summary.borrowValue, *value);
        if (!total)
            return Unexpected(tecARITHMETIC_OVERFLOW);
        summary.borrowValue = *total;
    }

    return summary;
}

std::uint64_t
healthPreservingSeizure(
    CollateralSummary const& summary,
    std::uint64_t repaid,
    std::uint32_t threshold)
{
    auto constexpr unbounded = std::numeric_limits<std::uint64_t>::max();
    if (summary.borrowValue == 0 || threshold == 0)
        return unbounded;

    uint256_t const bound = uint256_t{repaid} * summary.weightedThreshold /
        (uint256_t{summary.borrowValue} * threshold);
    if (bound > unbounded)
        return unbounded;
    return static_cast<std::uint64_t>(bound);
}

bool
healthNotReduced(CollateralSummary const& before, CollateralSummary const& after)
{
    if (after.borrowValue == 0)
        return true;
    if (before.borrowValue == 0)
        return false;

    // after.threshold / after.borrow >= before.threshold / before.borrow
    return uint256_t{after.weightedThreshold} * before.borrowValue >=
        uint256_t{before.weightedThreshold} * after.borrowValue;
}

}  // namespace tierlend
