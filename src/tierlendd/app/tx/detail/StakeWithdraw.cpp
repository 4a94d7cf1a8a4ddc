#include <tierlendd/app/tx/detail/StakeWithdraw.h>
//
#include <tierlendd/app/misc/StakingHelpers.h>
#include <tierlendd/app/misc/TierEngine.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

TER
StakeWithdraw::preclaim(PreclaimContext const& ctx)
{
    auto const account = ctx.view.account(ctx.tx.account);
    if (!account || !account->hasStake())
    {
        JLOG(ctx.j.warn()) << "No open stake.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

TER
StakeWithdraw::doApply()
{
    auto const account = view().peekAccount(account_);
    auto const market = view().peekMarket();
    auto const permanent = view().peekPermanent();
    if (!account || !market || !permanent)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const& params = market->parameters;

    std::uint64_t derivative = account->liquidDerivativeAmount;
    if (account->leveragePosition)
    {
        auto const proceeds =
            ctx_.providers.leverage.close(*account->leveragePosition);
        if (!proceeds)
        {
            JLOG(j_.warn()) << "Closing leverage position "
                            << *account->leveragePosition
                            << " failed: " << proceeds.error();
            return tecEXTERNAL_CALL_FAILED;
        }
        auto const total = checkedAdd(derivative, *proceeds);
        if (!total)
            return tecARITHMETIC_OVERFLOW;
        derivative = *total;
    }

    auto const principal = ctx_.providers.converter.redeem(derivative);
    if (!principal)
    {
        JLOG(j_.warn()) << "Redeeming " << derivative
                        << " failed: " << principal.error();
        return tecEXTERNAL_CALL_FAILED;
    }

    auto const tier = evaluateTier(*account, params.stakeUnit, now());
    if (!tier)
        return tier.error();
    account->tier = *tier;

    auto const quote =
        quoteWithdrawal(*account, *principal, params.baseRewardRate, now());
    if (!quote)
        return quote.error();

    if (quote->early)
    {
        auto const penalties =
            checkedAdd(permanent->totalPenalties, quote->penalty);
        if (!penalties)
            return tecARITHMETIC_OVERFLOW;

        permanent->totalPenalties = *penalties;
        if (quote->penalty != 0)
            permanent->lastCredit = now();

        JLOG(j_.info()) << "Early exit by " << account_ << ": penalty "
                        << quote->penalty << ", forfeited "
                        << account->accumulatedRewards << " pending rewards";
    }
    else
    {
        auto const received =
            checkedAdd(account->totalRewardsReceived, quote->reward);
        auto const paid = checkedAdd(market->totalRewardsPaid, quote->reward);
        if (!received || !paid)
            return tecARITHMETIC_OVERFLOW;

        account->totalRewardsReceived = *received;
        market->totalRewardsPaid = *paid;
        if (quote->reward != 0)
            account->lastPayoutTime = now();
    }

    auto const staked = checkedSub(market->totalStaked, account->stakeAmount);
    if (!staked)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE
    market->totalStaked = *staked;

    closeStake(*account);
    ctx_.deliver(quote->payout);

    JLOG(j_.debug()) << "Stake withdrawn by " << account_ << ", paid "
                     << quote->payout;
    return tesSUCCESS;
}

}  // namespace tierlend
