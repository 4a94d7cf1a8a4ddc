#include <tierlendd/app/tx/detail/Liquidate.h>
//
#include <tierlendd/app/misc/Accrual.h>
#include <tierlendd/app/misc/Collateral.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

#include <algorithm>

namespace tierlend {

NotTEC
Liquidate::preflight(PreflightContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!tx.reserve || !tx.target || *tx.target == beast::zero)
        return temMALFORMED;

    if (*tx.target == tx.account)
    {
        JLOG(ctx.j.warn()) << "Account cannot liquidate itself.";
        return temINVALID;
    }

    if (!tx.amount || *tx.amount == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
Liquidate::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!ctx.view.reserve(*tx.reserve))
        return tecNO_ENTRY;

    auto const collateralID = tx.collateralReserve.value_or(*tx.reserve);
    if (!ctx.view.reserve(collateralID))
    {
        JLOG(ctx.j.warn()) << "Collateral reserve does not exist.";
        return tecNO_ENTRY;
    }

    auto const target = ctx.view.account(*tx.target);
    if (!target || !target->borrows.contains(*tx.reserve))
    {
        JLOG(ctx.j.warn()) << "Target has no borrow in reserve.";
        return tecNO_ENTRY;
    }

    auto const liquidator = ctx.view.account(tx.account);
    if (!liquidator)
        return checkNewAccount(ctx.view, tx.account, ctx.j);

    if (!hasPositionSlot(liquidator->deposits, collateralID))
        return tecPOSITIONS_FULL;

    return tesSUCCESS;
}

TER
Liquidate::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;
    auto const collateralID = tx.collateralReserve.value_or(reserveID);

    auto const target = view().peekAccount(*tx.target);
    if (!target)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto touched = touchedReserves(*target);
    touched.push_back(collateralID);
    if (auto const ter = accrueReserves(view(), touched, j_))
        return ter;

    auto const before = summarizeCollateral(view(), *target);
    if (!before)
        return before.error();

    if (!before->liquidatable())
    {
        JLOG(j_.warn()) << "Target " << *tx.target
                        << " is healthy, health factor "
                        << before->healthFactor().value_or(0) << " bips.";
        return tecNOT_LIQUIDATABLE;
    }

    auto const reserve = view().peekReserve(reserveID);
    auto const collateral = view().peekReserve(collateralID);
    auto const market = view().peekMarket();
    if (!reserve || !collateral || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    // Debt side
    auto const debt = target->borrows.find(reserveID);
    if (debt == target->borrows.end())
        return tecNO_ENTRY;  // LCOV_EXCL_LINE
    if (auto const ter = settlePosition(debt->second, reserve->borrowIndex))
        return ter;

    auto const repaid = std::min(*tx.amount, debt->second.principal);
    auto const released = std::min(repaid, reserve->totalBorrows);
    debt->second.principal -= repaid;
    if (debt->second.principal == 0)
        target->borrows.erase(debt);
    reserve->totalBorrows -= released;
    market->totalBorrows -= released;

    // Collateral side: repaid * (1 + penalty), cut back when the bonus would
    // lower the target's health factor, and bounded by what the target holds
    // in the collateral reserve.
    auto const bonus = checkedMulDiv(
        repaid, bipsPerUnity + reserve->liquidationPenalty, bipsPerUnity);
    if (!bonus)
        return tecARITHMETIC_OVERFLOW;
    auto const owed = std::min(
        *bonus,
        healthPreservingSeizure(
            *before, repaid, collateral->liquidationThreshold));

    std::uint64_t seized = 0;
    if (auto const held = target->deposits.find(collateralID);
        held != target->deposits.end())
    {
        if (auto const ter =
                settlePosition(held->second, collateral->depositIndex))
            return ter;

        seized = std::min(owed, held->second.principal);
        held->second.principal -= seized;
        if (held->second.principal == 0)
            target->deposits.erase(held);
    }

    if (seized != 0)
    {
        auto const liquidator = peekOrCreateAccount(account_);
        if (!liquidator)
            return liquidator.error();

        auto& position = (*liquidator)->deposits[collateralID];
        if (position.principal == 0)
            position.index = collateral->depositIndex;
        else if (auto const ter =
                     settlePosition(position, collateral->depositIndex))
            return ter;

        auto const principal = checkedAdd(position.principal, seized);
        if (!principal)
            return tecARITHMETIC_OVERFLOW;
        position.principal = *principal;
    }

    auto const after = summarizeCollateral(view(), *target);
    if (!after)
        return after.error();

    // LCOV_EXCL_START
    if (!healthNotReduced(*before, *after))
    {
        JLOG(j_.fatal()) << "Liquidation lowered the health factor of "
                         << *tx.target << " from "
                         << before->healthFactor().value_or(0) << " to "
                         << after->healthFactor().value_or(0) << " bips.";
        return tecINTERNAL;
    }
    // LCOV_EXCL_STOP

    ++target->interactions;
    ctx_.deliver(seized);

    JLOG(j_.info()) << "Liquidated " << *tx.target << ": repaid " << repaid
                    << " in " << reserveID << ", seized " << seized
                    << " from " << collateralID;
    return tesSUCCESS;
}

}  // namespace tierlend
