#include <tierlendd/app/tx/detail/Withdraw.h>
//
#include <tierlendd/app/misc/Accrual.h>
#include <tierlendd/app/misc/Collateral.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
Withdraw::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.reserve)
        return temMALFORMED;

    if (!ctx.tx.amount || *ctx.tx.amount == 0)
        return temBAD_AMOUNT;

    return tesSUCCESS;
}

TER
Withdraw::preclaim(PreclaimContext const& ctx)
{
    auto const account = ctx.view.account(ctx.tx.account);
    if (!account || !account->deposits.contains(*ctx.tx.reserve))
    {
        JLOG(ctx.j.warn()) << "No deposit found in reserve.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

TER
Withdraw::doApply()
{
    auto const& tx = ctx_.tx;
    auto const& reserveID = *tx.reserve;
    auto const amount = *tx.amount;

    auto const account = view().peekAccount(account_);
    if (!account)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    if (auto const ter =
            accrueReserves(view(), touchedReserves(*account), j_))
        return ter;

    auto const reserve = view().peekReserve(reserveID);
    auto const market = view().peekMarket();
    if (!reserve || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const iter = account->deposits.find(reserveID);
    if (iter == account->deposits.end())
        return tecNO_ENTRY;  // LCOV_EXCL_LINE

    auto& position = iter->second;
    if (auto const ter = settlePosition(position, reserve->depositIndex))
        return ter;

    if (amount > position.principal)
    {
        JLOG(j_.warn()) << "Withdrawal of " << amount
                        << " exceeds deposit of " << position.principal;
        return tecINSUFFICIENT_BALANCE;
    }

    auto const reserveDeposits = checkedSub(reserve->totalDeposits, amount);
    auto const marketDeposits = checkedSub(market->totalDeposits, amount);
    if (!reserveDeposits || !marketDeposits)
        return tecINSUFFICIENT_LIQUIDITY;

    position.principal -= amount;
    if (position.principal == 0)
        account->deposits.erase(iter);
    reserve->totalDeposits = *reserveDeposits;
    market->totalDeposits = *marketDeposits;

    auto const summary = summarizeCollateral(view(), *account);
    if (!summary)
        return summary.error();

    if (!summary->withinBorrowLimit())
    {
        JLOG(j_.warn()) << "Withdrawal of " << amount
                        << " would leave borrow value "
                        << summary->borrowValue << " uncovered.";
        return tecINSUFFICIENT_BALANCE;
    }

    auto const lent =
        checkedAdd(reserve->totalBorrows, reserve->flashLoanOutstanding);
    if (!lent || *lent > reserve->totalDeposits)
    {
        JLOG(j_.warn()) << "Withdrawal of " << amount << " exceeds reserve "
                        << reserveID << " liquidity.";
        return tecINSUFFICIENT_LIQUIDITY;
    }

    ctx_.deliver(amount);

    JLOG(j_.debug()) << "Withdrew " << amount << " from " << reserveID;
    return tesSUCCESS;
}

}  // namespace tierlend
