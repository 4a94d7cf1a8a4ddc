#include <tierlendd/app/tx/detail/Repay.h>
//
#include <tierlendd/app/misc/Accrual.h>

#include <xrpl/basics/Log.h>

#include <algorithm>

namespace tierlend {

NotTEC
Repay::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.reserve)
        return temMALFORMED;

    if (!ctx.tx.amount || *ctx.tx.amount == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
Repay::preclaim(PreclaimContext const& ctx)
{
    auto const account = ctx.view.account(ctx.tx.account);
    if (!account || !account->borrows.contains(*ctx.tx.reserve))
    {
        JLOG(ctx.j.warn()) << "No borrow found in reserve.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

TER
Repay::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;

    if (auto const ter = accrueReserves(view(), {reserveID}, j_))
        return ter;

    auto const account = view().peekAccount(account_);
    auto const reserve = view().peekReserve(reserveID);
    auto const market = view().peekMarket();
    if (!account || !reserve || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const iter = account->borrows.find(reserveID);
    if (iter == account->borrows.end())
        return tecNO_ENTRY;  // LCOV_EXCL_LINE

    auto& position = iter->second;
    if (auto const ter = settlePosition(position, reserve->borrowIndex))
        return ter;

    // Repaying more than is owed only repays the debt.
    auto const repaid = std::min(*tx.amount, position.principal);

    // Positions and the reserve total are rounded separately, so a
    // settled position can exceed the total by a unit.
    auto const released = std::min(repaid, reserve->totalBorrows);
    if (released != repaid)
    {
        JLOG(j_.debug()) << "Repay of " << repaid << " exceeds reserve borrows "
                         << reserve->totalBorrows;
    }

    position.principal -= repaid;
    if (position.principal == 0)
        account->borrows.erase(iter);

    reserve->totalBorrows -= released;
    market->totalBorrows -= released;

    ctx_.deliver(repaid);

    JLOG(j_.debug()) << "Repaid " << repaid << " to " << reserveID;
    return tesSUCCESS;
}

}  // namespace tierlend
