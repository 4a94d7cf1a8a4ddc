#include <tierlendd/app/tx/detail/FlashLoan.h>
//
#include <tierlendd/app/misc/Accrual.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

FlashLoanContext::FlashLoanContext(
    ApplyContext& ctx,
    ReserveID const& reserve,
    std::uint64_t amount,
    std::uint64_t fee)
    : ctx_(ctx), reserve_(reserve), amount_(amount), fee_(fee)
{
}

ApplyResult
FlashLoanContext::submit(Transaction const& tx)
{
    if (tx.account != ctx_.tx.account)
    {
        JLOG(ctx_.journal.warn())
            << "Flash loan strategy submitted a transaction for "
            << tx.account;
        return {tecNO_PERMISSION, false, std::nullopt};
    }

    return apply(ctx_.view(), tx, ctx_.providers, tapNESTED, ctx_.journal);
}

TER
FlashLoanContext::repay(std::uint64_t amount)
{
    if (amount > due() - repaid_)
    {
        JLOG(ctx_.journal.warn()) << "Flash loan repayment of " << amount
                                  << " exceeds the " << due() - repaid_
                                  << " still due.";
        return temBAD_AMOUNT;
    }

    repaid_ += amount;
    return tesSUCCESS;
}

//------------------------------------------------------------------------------

NotTEC
FlashLoan::preflight(PreflightContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!tx.reserve || !tx.strategy)
        return temMALFORMED;

    if (!tx.amount || *tx.amount == 0)
        return temBAD_AMOUNT;

    auto const fee = tx.fee.value_or(0);
    if (fee > *tx.amount)
    {
        JLOG(ctx.j.warn()) << "Flash loan fee exceeds the amount.";
        return temBAD_FEE;
    }

    if (!checkedAdd(*tx.amount, fee))
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
FlashLoan::preclaim(PreclaimContext const& ctx)
{
    auto const& tx = ctx.tx;

    auto const reserve = ctx.view.reserve(*tx.reserve);
    if (!reserve)
        return tecNO_ENTRY;

    if (reserve->flashLoanActive)
    {
        JLOG(ctx.j.warn()) << "Flash loan already in progress on reserve "
                           << reserve->id;
        return tecREENTRANT_FLASH_LOAN;
    }

    auto const minimum = checkedMulDiv(
        *tx.amount, ctx.view.market()->parameters.minFlashLoanFee, bipsPerUnity);
    if (!minimum)
        return tecARITHMETIC_OVERFLOW;  // LCOV_EXCL_LINE

    if (tx.fee.value_or(0) < *minimum)
    {
        JLOG(ctx.j.warn()) << "Flash loan fee " << tx.fee.value_or(0)
                           << " is below the minimum " << *minimum;
        return tecINSUFFICIENT_FEE;
    }

    return tesSUCCESS;
}

TER
FlashLoan::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;
    auto const amount = *tx.amount;
    auto const fee = tx.fee.value_or(0);

    if (auto const ter = accrueReserves(view(), {reserveID}, j_))
        return ter;

    {
        auto const reserve = view().peekReserve(reserveID);
        if (!reserve)
            return tefBAD_LEDGER;  // LCOV_EXCL_LINE

        auto available = checkedSub(reserve->totalDeposits, reserve->totalBorrows);
        if (available)
            available = checkedSub(*available, reserve->flashLoanOutstanding);
        if (!available || amount > *available)
        {
            JLOG(j_.warn()) << "Flash loan of " << amount << " exceeds reserve "
                            << reserveID << " liquidity.";
            return tecINSUFFICIENT_LIQUIDITY;
        }

        reserve->flashLoanActive = true;
        reserve->flashLoanOutstanding += amount;
    }

    FlashLoanContext loan(ctx_, reserveID, amount, fee);
    if (auto const ter = tx.strategy(loan))
    {
        JLOG(j_.warn()) << "Flash loan strategy failed: " << transToken(ter);
        return ter;
    }

    if (loan.repaid() != loan.due())
    {
        JLOG(j_.warn()) << "Flash loan repaid " << loan.repaid() << " of "
                        << loan.due();
        return tecFLASH_LOAN_NOT_REPAID;
    }

    // Nested transactions replace entries in the view, so look them up
    // again rather than reusing earlier pointers.
    auto const reserve = view().peekReserve(reserveID);
    auto const market = view().peekMarket();
    if (!reserve || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    // The fee is depositor yield: the deposit index grows by
    // fee / totalDeposits.
    auto depositIndex = reserve->depositIndex;
    if (reserve->totalDeposits != 0)
    {
        auto const growth =
            checkedMulDiv(reserve->depositIndex, fee, reserve->totalDeposits);
        if (!growth)
            return tecARITHMETIC_OVERFLOW;
        auto const index = checkedAdd(reserve->depositIndex, *growth);
        if (!index)
            return tecARITHMETIC_OVERFLOW;
        depositIndex = *index;
    }

    auto const reserveDeposits = checkedAdd(reserve->totalDeposits, fee);
    auto const marketDeposits = checkedAdd(market->totalDeposits, fee);
    if (!reserveDeposits || !marketDeposits)
        return tecARITHMETIC_OVERFLOW;

    reserve->flashLoanActive = false;
    reserve->flashLoanOutstanding -= amount;
    reserve->depositIndex = depositIndex;
    reserve->totalDeposits = *reserveDeposits;
    market->totalDeposits = *marketDeposits;

    ctx_.deliver(amount);

    JLOG(j_.debug()) << "Flash loan of " << amount << " from " << reserveID
                     << " repaid with fee " << fee;
    return tesSUCCESS;
}

}  // namespace tierlend
