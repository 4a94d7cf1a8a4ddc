#include <tierlendd/app/tx/detail/Borrow.h>
//
#include <tierlendd/app/misc/Accrual.h>
#include <tierlendd/app/misc/Collateral.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
Borrow::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.reserve)
        return temMALFORMED;

    if (!ctx.tx.amount || *ctx.tx.amount == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
Borrow::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!ctx.view.reserve(*tx.reserve))
    {
        JLOG(ctx.j.warn()) << "Reserve does not exist.";
        return tecNO_ENTRY;
    }

    auto const account = ctx.view.account(tx.account);
    if (!account || account->deposits.empty())
    {
        JLOG(ctx.j.warn()) << "Account has no collateral.";
        return tecINSUFFICIENT_COLLATERAL;
    }

    if (!hasPositionSlot(account->borrows, *tx.reserve))
    {
        JLOG(ctx.j.warn()) << "No free borrow slot.";
        return tecPOSITIONS_FULL;
    }

    return tesSUCCESS;
}

TER
Borrow::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;
    auto const amount = *tx.amount;

    auto const account = view().peekAccount(account_);
    if (!account)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto touched = touchedReserves(*account);
    touched.push_back(reserveID);
    if (auto const ter = accrueReserves(view(), touched, j_))
        return ter;

    auto const reserve = view().peekReserve(reserveID);
    auto const market = view().peekMarket();
    if (!reserve || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto& position = account->borrows[reserveID];
    if (position.principal == 0)
        position.index = reserve->borrowIndex;
    else if (auto const ter = settlePosition(position, reserve->borrowIndex))
        return ter;

    auto const principal = checkedAdd(position.principal, amount);
    auto const reserveBorrows = checkedAdd(reserve->totalBorrows, amount);
    auto const marketBorrows = checkedAdd(market->totalBorrows, amount);
    if (!principal || !reserveBorrows || !marketBorrows)
        return tecARITHMETIC_OVERFLOW;

    position.principal = *principal;
    reserve->totalBorrows = *reserveBorrows;
    market->totalBorrows = *marketBorrows;

    auto const summary = summarizeCollateral(view(), *account);
    if (!summary)
        return summary.error();

    if (!summary->withinBorrowLimit())
    {
        JLOG(j_.warn()) << "Borrow of " << amount << " rejected: borrow value "
                        << summary->borrowValue << " exceeds the limit of "
                        << summary->collateralValue << " collateral.";
        return tecINSUFFICIENT_COLLATERAL;
    }

    // The reserve must still hold the funds it lends, including any flash
    // loan in progress.
    auto const lent = checkedAdd(*reserveBorrows, reserve->flashLoanOutstanding);
    if (!lent || *lent > reserve->totalDeposits)
    {
        JLOG(j_.warn()) << "Borrow of " << amount << " exceeds reserve "
                        << reserveID << " liquidity.";
        return tecINSUFFICIENT_LIQUIDITY;
    }

    JLOG(j_.debug()) << "Borrowed " << amount << " from " << reserveID
                     << ", position " << position.principal;
    return tesSUCCESS;
}

}  // namespace tierlend
