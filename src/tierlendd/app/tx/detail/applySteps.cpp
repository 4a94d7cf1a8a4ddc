#include <tierlendd/app/tx/applySteps.h>
//
#include <tierlendd/app/tx/detail/ApplyContext.h>
#include <tierlendd/app/tx/detail/Borrow.h>
#include <tierlendd/app/tx/detail/Deposit.h>
#include <tierlendd/app/tx/detail/FlashLoan.h>
#include <tierlendd/app/tx/detail/InvariantCheck.h>
#include <tierlendd/app/tx/detail/Liquidate.h>
#include <tierlendd/app/tx/detail/MarketSet.h>
#include <tierlendd/app/tx/detail/Repay.h>
#include <tierlendd/app/tx/detail/ReserveSet.h>
#include <tierlendd/app/tx/detail/RewardDistribute.h>
#include <tierlendd/app/tx/detail/RewardPreferencesSet.h>
#include <tierlendd/app/tx/detail/StakeSet.h>
#include <tierlendd/app/tx/detail/StakeWithdraw.h>
#include <tierlendd/app/tx/detail/TierRedistribute.h>
#include <tierlendd/app/tx/detail/Withdraw.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace tierlend {

namespace {

/** Call `f` with the transactor class handling `txnType`.

    `f` is a lambda with a single class template parameter, invoked as
    `f.template operator()<T>()`.
*/
template <class F>
auto
with_txn_type(TxType txnType, F&& f)
{
    switch (txnType)
    {
        case ttMARKET_SET:
            return f.template operator()<MarketSet>();
        case ttRESERVE_SET:
            return f.template operator()<ReserveSet>();
        case ttDEPOSIT:
            return f.template operator()<Deposit>();
        case ttBORROW:
            return f.template operator()<Borrow>();
        case ttREPAY:
            return f.template operator()<Repay>();
        case ttWITHDRAW:
            return f.template operator()<Withdraw>();
        case ttLIQUIDATE:
            return f.template operator()<Liquidate>();
        case ttFLASH_LOAN:
            return f.template operator()<FlashLoan>();
        case ttSTAKE_SET:
            return f.template operator()<StakeSet>();
        case ttSTAKE_WITHDRAW:
            return f.template operator()<StakeWithdraw>();
        case ttREWARD_PREFERENCES_SET:
            return f.template operator()<RewardPreferencesSet>();
        case ttREWARD_DISTRIBUTE:
            return f.template operator()<RewardDistribute>();
        case ttTIER_REDISTRIBUTE:
            return f.template operator()<TierRedistribute>();
    }

    // LCOV_EXCL_START
    ripple::Throw<std::logic_error>(
        "Unknown transaction type " + std::to_string(txnType));
    // LCOV_EXCL_STOP
}

bool
isKnownType(TxType txnType)
{
    return txnType <= ttTIER_REDISTRIBUTE;
}

}  // namespace

NotTEC
preflight(Transaction const& tx, ApplyFlags flags, beast::Journal j)
{
    if (!isKnownType(tx.type))
    {
        JLOG(j.warn()) << "Unknown transaction type " << tx.type;
        return temUNKNOWN;
    }

    PreflightContext const ctx(tx, flags, j);
    return with_txn_type(tx.type, [&]<typename T>() -> NotTEC {
        if (auto const ter = Transactor::preflight0(ctx))
            return ter;
        return T::preflight(ctx);
    });
}

TER
preclaim(
    ReadView const& view,
    Transaction const& tx,
    ApplyFlags flags,
    beast::Journal j)
{
    PreclaimContext const ctx(view, tx, flags, j);
    return with_txn_type(tx.type, [&]<typename T>() -> TER {
        // Only MarketSet may run before the market exists.
        if (tx.type != ttMARKET_SET)
        {
            if (auto const ter = Transactor::checkMarket(ctx))
                return ter;
        }
        return T::preclaim(ctx);
    });
}

ApplyResult
apply(
    ApplyView& view,
    Transaction const& tx,
    ProviderSet& providers,
    ApplyFlags flags,
    beast::Journal j)
{
    if (auto const ter = preflight(tx, flags, j); !isTesSuccess(ter))
        return {ter, false, std::nullopt};

    if (auto const ter = preclaim(view, tx, flags, j); !isTesSuccess(ter))
    {
        JLOG(j.debug()) << to_string(tx.type) << " rejected: "
                        << transToken(ter);
        return {ter, false, std::nullopt};
    }

    ApplyContext ctx(view, tx, providers, flags, j);

    TER ter = with_txn_type(tx.type, [&]<typename T>() -> TER {
        T p(ctx);
        return p();
    });

    if (isTesSuccess(ter))
        ter = checkInvariants(ctx.base(), ctx.view(), tx, flags, j);

    if (!isTesSuccess(ter))
    {
        JLOG(j.warn()) << to_string(tx.type) << " by " << tx.account
                       << " failed: " << transToken(ter) << " ("
                       << transHuman(ter) << ")";
        ctx.discard();
        return {ter, false, std::nullopt};
    }

    if (flags & tapDRY_RUN)
        return {ter, false, ctx.delivered()};

    ctx.apply();
    JLOG(j.debug()) << to_string(tx.type) << " by " << tx.account
                    << " applied";
    return {ter, true, ctx.delivered()};
}

}  // namespace tierlend
