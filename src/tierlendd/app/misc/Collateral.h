#ifndef TIERLEND_APP_MISC_COLLATERAL_H_INCLUDED
#define TIERLEND_APP_MISC_COLLATERAL_H_INCLUDED

#include <tierlend/ledger/ReadView.h>
#include <tierlend/protocol/TER.h>

#include <xrpl/basics/Expected.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>

namespace tierlend {

/* Collateralization.
 *
 * Positions are valued at face: every reserve's asset is worth one unit of
 * account per base unit, and a position is worth its current value under the
 * reserve's index.
 *
 *   borrowLimit      = sum(deposit_i * ltvRatio_i) / 10000
 *   liquidationLimit = sum(deposit_i * liquidationThreshold_i) / 10000
 *   healthFactor     = liquidationLimit / borrowValue
 *
 * A borrow or withdrawal may not leave borrowValue above borrowLimit. An
 * account whose health factor is below one may be liquidated.
 */
struct CollateralSummary
{
    std::uint64_t collateralValue = 0;
    std::uint64_t borrowValue = 0;

    // sum(deposit_i * ltvRatio_i), not yet divided by 10000.
    boost::multiprecision::uint128_t weightedLtv = 0;

    // sum(deposit_i * liquidationThreshold_i), not yet divided by 10000.
    boost::multiprecision::uint128_t weightedThreshold = 0;

    /** borrowValue does not exceed the loan-to-value limit. */
    bool
    withinBorrowLimit() const;

    /** The health factor is below one. */
    bool
    liquidatable() const;

    /** Health factor in basis points; std::nullopt means no debt. */
    std::optional<std::uint64_t>
    healthFactor() const;
};

/** Value an account's positions against the current reserve indices.

    The caller is responsible for accruing the touched reserves first.
*/
ripple::Expected<CollateralSummary, TER>
summarizeCollateral(ReadView const& view, UserAccount const& account);

/** The most that can be seized from a reserve with liquidation `threshold`
    for `repaid` of debt without lowering the health factor of `summary`.

    Repaying R and seizing S leaves the health factor no lower when
    S * threshold / R <= weightedThreshold / borrowValue.
*/
std::uint64_t
healthPreservingSeizure(
    CollateralSummary const& summary,
    std::uint64_t repaid,
    std::uint32_t threshold);

/** True if `after` has a health factor no lower than `before`. */
bool
healthNotReduced(CollateralSummary const& before, CollateralSummary const& after);

}  // namespace tierlend

#endif
