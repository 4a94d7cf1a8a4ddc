#include <tierlendd/app/tx/detail/Deposit.h>
//
#include <tierlendd/app/misc/Accrual.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
Deposit::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.reserve)
        return temMALFORMED;

    if (!ctx.tx.amount || *ctx.tx.amount == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
Deposit::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!ctx.view.reserve(*tx.reserve))
    {
        JLOG(ctx.j.warn()) << "Reserve does not exist.";
        return tecNO_ENTRY;
    }

    auto const account = ctx.view.account(tx.account);
    if (!account)
        return checkNewAccount(ctx.view, tx.account, ctx.j);

    if (!hasPositionSlot(account->deposits, *tx.reserve))
    {
        JLOG(ctx.j.warn()) << "No free deposit slot.";
        return tecPOSITIONS_FULL;
    }

    return tesSUCCESS;
}

TER
Deposit::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;
    auto const amount = *tx.amount;

    if (auto const ter = accrueReserves(view(), {reserveID}, j_))
        return ter;

    auto const account = peekOrCreateAccount(account_);
    if (!account)
        return account.error();

    auto const reserve = view().peekReserve(reserveID);
    auto const market = view().peekMarket();
    if (!reserve || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto& position = (*account)->deposits[reserveID];
    if (position.principal == 0)
        position.index = reserve->depositIndex;
    else if (auto const ter = settlePosition(position, reserve->depositIndex))
        return ter;

    auto const principal = checkedAdd(position.principal, amount);
    auto const reserveDeposits = checkedAdd(reserve->totalDeposits, amount);
    auto const marketDeposits = checkedAdd(market->totalDeposits, amount);
    if (!principal || !reserveDeposits || !marketDeposits)
        return tecARITHMETIC_OVERFLOW;

    position.principal = *principal;
    reserve->totalDeposits = *reserveDeposits;
    market->totalDeposits = *marketDeposits;

    JLOG(j_.debug()) << "Deposited " << amount << " into " << reserveID
                     << ", position " << position.principal;
    return tesSUCCESS;
}

}  // namespace tierlend
