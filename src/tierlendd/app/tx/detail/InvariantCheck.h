#ifndef TIERLEND_APP_TX_INVARIANTCHECK_H_INCLUDED
#define TIERLEND_APP_TX_INVARIANTCHECK_H_INCLUDED

#include <tierlend/ledger/ReadView.h>
#include <tierlend/protocol/TER.h>
#include <tierlend/protocol/Transaction.h>

#include <xrpl/beast/utility/Journal.h>

#include <tuple>

namespace tierlend {

#if GENERATING_DOCS
/**
 * @brief Prototype for invariant check implementations.
 *
 * __THIS CLASS DOES NOT EXIST__ - or rather it exists in documentation only
 * to communicate the interface required of any invariant checker. Any
 * invariant check implementation should implement the public method
 * documented here.
 */
class InvariantChecker_PROTOTYPE
{
public:
    /**
     * @brief called after the transaction's changes have been made, but
     * before they are written to the parent view.
     *
     * @param before the state the transaction started from
     * @param after the state the transaction would leave behind
     * @param tx the transaction being applied
     * @param flags the flags the transaction is applied with
     * @param j journal for logging
     *
     * @return true if check passes, false if it fails
     */
    bool
    finalize(
        ReadView const& before,
        ReadView const& after,
        Transaction const& tx,
        ApplyFlags flags,
        beast::Journal const& j);
};
#endif

/**
 * @brief Invariant: no reserve lends out more than it holds.
 *
 * totalBorrows <= totalDeposits for every reserve of the market.
 */
class ReserveSolvency
{
public:
    bool
    finalize(
        ReadView const&,
        ReadView const&,
        Transaction const&,
        ApplyFlags,
        beast::Journal const&);
};

/**
 * @brief Invariant: market totals equal the sums over its reserves.
 */
class MarketTotalsMatch
{
public:
    bool
    finalize(
        ReadView const&,
        ReadView const&,
        Transaction const&,
        ApplyFlags,
        beast::Journal const&);
};

/**
 * @brief Invariant: borrow and deposit indices, and the accrual clock, never
 * move backwards.
 */
class IndicesNeverDecrease
{
public:
    bool
    finalize(
        ReadView const&,
        ReadView const&,
        Transaction const&,
        ApplyFlags,
        beast::Journal const&);
};

/**
 * @brief Invariant: once the outermost transaction finishes no reserve has a
 * flash loan in progress.
 *
 * Transactions applied inside a flash loan strategy are exempt.
 */
class FlashLoanSettled
{
public:
    bool
    finalize(
        ReadView const&,
        ReadView const&,
        Transaction const&,
        ApplyFlags,
        beast::Journal const&);
};

/**
 * @brief Invariant: the permanent account's balances never decrease.
 */
class PermanentAccountOnlyGrows
{
public:
    bool
    finalize(
        ReadView const&,
        ReadView const&,
        Transaction const&,
        ApplyFlags,
        beast::Journal const&);
};

// additional invariant checks can be declared above and then added to this
// tuple
using InvariantChecks = std::tuple<
    ReserveSolvency,
    MarketTotalsMatch,
    IndicesNeverDecrease,
    FlashLoanSettled,
    PermanentAccountOnlyGrows>;

/**
 * @brief get a tuple of all invariant checks
 *
 * @return std::tuple of instances that implement the required invariant check
 * methods
 *
 * @see tierlend::InvariantChecker_PROTOTYPE
 */
inline InvariantChecks
getInvariantChecks()
{
    return InvariantChecks{};
}

/** Run every invariant check. Returns tecINVARIANT_FAILED if any fails. */
TER
checkInvariants(
    ReadView const& before,
    ReadView const& after,
    Transaction const& tx,
    ApplyFlags flags,
    beast::Journal j);

}  // namespace tierlend

#endif
