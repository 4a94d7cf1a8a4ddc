#ifndef TIERLEND_APP_MISC_INTERESTRATE_H_INCLUDED
#define TIERLEND_APP_MISC_INTERESTRATE_H_INCLUDED

#include <tierlend/protocol/MarketTypes.h>

#include <cstdint>

namespace tierlend {

/* Interest rate model.
 *
 * Rates follow a two-slope ("kinked") curve over utilization:
 *
 *   u           = totalBorrows / totalDeposits             (bips, max 10000)
 *   borrowRate  = baseRate
 *               + min(u, kink) * multiplier / 10000
 *               + max(u - kink, 0) * jumpMultiplier / 10000
 *   depositRate = borrowRate * u / 10000 * (10000 - reserveFactor) / 10000
 *
 * All rates are annualized basis points. The functions are pure; the
 * accrual code and the tests both use them.
 */

/** Utilization in basis points. Zero when nothing is deposited. */
std::uint32_t
utilization(std::uint64_t totalBorrows, std::uint64_t totalDeposits);

std::uint64_t
borrowRate(InterestRateModel const& model, std::uint32_t utilization);

std::uint64_t
depositRate(
    InterestRateModel const& model,
    std::uint32_t utilization,
    std::uint32_t reserveFactor);

}  // namespace tierlend

#endif
