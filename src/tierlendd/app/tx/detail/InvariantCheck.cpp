#include <tierlendd/app/tx/detail/InvariantCheck.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>
#include <xrpl/json/to_string.h>

namespace tierlend {

bool
ReserveSolvency::finalize(
    ReadView const&,
    ReadView const& after,
    Transaction const&,
    ApplyFlags,
    beast::Journal const& j)
{
    auto const market = after.market();
    if (!market)
        return true;

    for (auto const& id : market->reserves)
    {
        auto const reserve = after.reserve(id);
        if (!reserve)
        {
            JLOG(j.fatal()) << "Invariant failed: market lists missing reserve "
                            << id;
            return false;
        }

        if (reserve->totalBorrows > reserve->totalDeposits)
        {
            JLOG(j.fatal()) << "Invariant failed: reserve " << id
                            << " borrows " << reserve->totalBorrows
                            << " exceed deposits " << reserve->totalDeposits;
            return false;
        }
    }

    return true;
}

//------------------------------------------------------------------------------

bool
MarketTotalsMatch::finalize(
    ReadView const&,
    ReadView const& after,
    Transaction const&,
    ApplyFlags,
    beast::Journal const& j)
{
    auto const market = after.market();
    if (!market)
        return true;

    std::uint64_t deposits = 0;
    std::uint64_t borrows = 0;
    for (auto const& id : market->reserves)
    {
        auto const reserve = after.reserve(id);
        if (!reserve)
            return false;

        auto const d = checkedAdd(deposits, reserve->totalDeposits);
        auto const b = checkedAdd(borrows, reserve->totalBorrows);
        if (!d || !b)
        {
            JLOG(j.fatal()) << "Invariant failed: reserve totals overflow";
            return false;
        }
        deposits = *d;
        borrows = *b;
    }

    if (deposits != market->totalDeposits || borrows != market->totalBorrows)
    {
        JLOG(j.fatal()) << "Invariant failed: market totals "
                        << market->totalDeposits << "/"
                        << market->totalBorrows << " do not match reserves "
                        << deposits << "/" << borrows;
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------

bool
IndicesNeverDecrease::finalize(
    ReadView const& before,
    ReadView const& after,
    Transaction const&,
    ApplyFlags,
    beast::Journal const& j)
{
    auto const market = before.market();
    if (!market)
        return true;

    for (auto const& id : market->reserves)
    {
        auto const prior = before.reserve(id);
        auto const current = after.reserve(id);
        if (!prior || !current)
            continue;

        if (current->borrowIndex < prior->borrowIndex ||
            current->depositIndex < prior->depositIndex)
        {
            JLOG(j.fatal()) << "Invariant failed: index of reserve " << id
                            << " decreased";
            return false;
        }

        if (current->lastAccrualTime < prior->lastAccrualTime)
        {
            JLOG(j.fatal()) << "Invariant failed: accrual time of reserve "
                            << id << " moved backwards";
            return false;
        }
    }

    return true;
}

//------------------------------------------------------------------------------

bool
FlashLoanSettled::finalize(
    ReadView const&,
    ReadView const& after,
    Transaction const&,
    ApplyFlags flags,
    beast::Journal const& j)
{
    if (flags & tapNESTED)
        return true;

    auto const market = after.market();
    if (!market)
        return true;

    for (auto const& id : market->reserves)
    {
        auto const reserve = after.reserve(id);
        if (reserve &&
            (reserve->flashLoanActive || reserve->flashLoanOutstanding != 0))
        {
            JLOG(j.fatal()) << "Invariant failed: flash loan on reserve " << id
                            << " still outstanding";
            return false;
        }
    }

    return true;
}

//------------------------------------------------------------------------------

bool
PermanentAccountOnlyGrows::finalize(
    ReadView const& before,
    ReadView const& after,
    Transaction const&,
    ApplyFlags,
    beast::Journal const& j)
{
    auto const prior = before.permanent();
    if (!prior)
        return true;

    auto const current = after.permanent();
    if (!current || current->totalPenalties < prior->totalPenalties ||
        current->protocolFees < prior->protocolFees)
    {
        JLOG(j.fatal()) << "Invariant failed: permanent account decreased";
        return false;
    }

    return true;
}

//------------------------------------------------------------------------------

TER
checkInvariants(
    ReadView const& before,
    ReadView const& after,
    Transaction const& tx,
    ApplyFlags flags,
    beast::Journal j)
{
    auto checkers = getInvariantChecks();

    // call each check's finalizer to see that it passes
    bool const passed = std::apply(
        [&](auto&... checker) {
            return (... & checker.finalize(before, after, tx, flags, j));
        },
        checkers);

    if (!passed)
    {
        JLOG(j.fatal()) << "Transaction " << to_string(tx.type)
                        << " has failed one or more invariants: "
                        << Json::to_string(tx.getJson());
        return tecINVARIANT_FAILED;
    }

    return tesSUCCESS;
}

}  // namespace tierlend
