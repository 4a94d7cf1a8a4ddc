#ifndef TIERLEND_APP_MISC_ACCRUAL_H_INCLUDED
#define TIERLEND_APP_MISC_ACCRUAL_H_INCLUDED

#include <tierlend/ledger/ReadView.h>
#include <tierlend/protocol/TER.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <vector>

namespace tierlend {

using ripple::Expected;
using ripple::Unexpected;

/* Interest accrual.
 *
 * Each reserve carries a borrow index and a deposit index, both fixed point
 * numbers scaled by indexOne. Accruing over an interval of dt seconds
 * compounds each index once:
 *
 *   index' = index + index * rate * dt / (10000 * secondsInYear)
 *
 * where rate is the borrow or deposit rate from the interest rate model
 * evaluated at the utilization before the accrual.
 *
 * The interest owed by borrowers over the interval is
 *
 *   Ib = totalBorrows * borrowIndex' / borrowIndex - totalBorrows
 *
 * and is added to both totalBorrows and totalDeposits. Depositors receive
 * Id, computed the same way from the deposit index and never more than Ib,
 * through the deposit index. The remainder Ib - Id is the protocol share and
 * is recorded on the reserve and the permanent account.
 *
 * Positions are never touched by accrual. A position opened at index i is
 * worth principal * currentIndex / i, and is settled to that value whenever
 * its owner changes it.
 */

/** Accrue interest on one reserve up to `now`.

    Returns tefBAD_CLOCK if `now` precedes the last accrual, and
    tecARITHMETIC_OVERFLOW if any step would overflow. Nothing is modified
    unless tesSUCCESS is returned.
*/
[[nodiscard]] TER
accrueInterest(
    Reserve& reserve,
    Market& market,
    PermanentAccount& permanent,
    Timestamp now,
    beast::Journal j);

/** Accrue every listed reserve in `view` up to the view's close time. */
[[nodiscard]] TER
accrueReserves(
    ApplyView& view,
    std::vector<ReserveID> const& reserves,
    beast::Journal j);

/** Every reserve the account holds a deposit or a borrow in. */
std::vector<ReserveID>
touchedReserves(UserAccount const& account);

/** The current value of a position. */
Expected<std::uint64_t, TER>
positionValue(Position const& position, std::uint64_t currentIndex);

/** Roll accrued interest into the principal and restamp the index. */
[[nodiscard]] TER
settlePosition(Position& position, std::uint64_t currentIndex);

}  // namespace tierlend

#endif
