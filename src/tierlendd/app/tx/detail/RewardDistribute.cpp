#include <tierlendd/app/tx/detail/RewardDistribute.h>
//
#include <tierlendd/app/misc/StakingHelpers.h>
#include <tierlendd/app/misc/TierEngine.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

#include <algorithm>

namespace tierlend {

TER
RewardDistribute::preclaim(PreclaimContext const& ctx)
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
RewardDistribute::doApply()
{
    auto const account = view().peekAccount(account_);
    auto const market = view().peekMarket();
    if (!account || !market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const& params = market->parameters;

    auto const tier = evaluateTier(*account, params.stakeUnit, now());
    if (!tier)
        return tier.error();
    account->tier = *tier;

    std::uint64_t accrued = 0;
    if (auto const ter = accrueStakingRewards(
            *account, params.baseRewardRate, now(), accrued))
        return ter;

    auto const available = account->accumulatedRewards;
    std::uint64_t payout = 0;
    std::uint64_t reinvest = 0;
    bool restartCommitment = false;

    if (!account->rewardPreferences)
    {
        payout = available;
    }
    else if (
        auto const& prefs = *account->rewardPreferences;
        prefs.mode == RewardMode::recurringInvestment)
    {
        auto const share = checkedMulDiv(
            available, prefs.reinvestmentPercentage, percentPerUnity);
        if (!share)
            return tecARITHMETIC_OVERFLOW;  // LCOV_EXCL_LINE

        reinvest = *share;
        payout = available - reinvest;
        restartCommitment =
            prefs.compoundStrategy == CompoundStrategy::compound;
    }
    else
    {
        auto const threshold = std::max(prefs.batchSize, prefs.payoutThreshold);
        auto const cadence = batchCadence(prefs.batchFrequency);
        bool const due = now() - account->lastPayoutTime >= cadence;

        if (available == 0 || available < threshold || !due)
        {
            JLOG(j_.debug()) << "Batch of " << available
                             << " held, threshold " << threshold;
            return tesSUCCESS;
        }

        if (prefs.autoCompound)
            reinvest = available;
        else
            payout = available;
        account->lastPayoutTime = now();
    }

    account->accumulatedRewards = 0;

    if (reinvest != 0)
    {
        auto const derivative = ctx_.providers.converter.convert(reinvest);
        if (!derivative)
        {
            JLOG(j_.warn()) << "Reinvesting " << reinvest
                            << " failed: " << derivative.error();
            return tecEXTERNAL_CALL_FAILED;
        }

        auto const stake = checkedAdd(account->stakeAmount, reinvest);
        auto const held =
            checkedAdd(account->liquidDerivativeAmount, *derivative);
        auto const staked = checkedAdd(market->totalStaked, reinvest);
        if (!stake || !held || !staked)
            return tecARITHMETIC_OVERFLOW;

        account->stakeAmount = *stake;
        account->liquidDerivativeAmount = *held;
        market->totalStaked = *staked;

        if (restartCommitment)
        {
            auto const days = account->rewardPreferences->lockDurationDays;
            account->stakeStartTime = now();
            account->lockDurationDays = days;
            account->intendedEndTime = now() + days * secondsInDay;
        }
    }

    if (payout != 0)
    {
        auto const received = checkedAdd(account->totalRewardsReceived, payout);
        auto const paid = checkedAdd(market->totalRewardsPaid, payout);
        if (!received || !paid)
            return tecARITHMETIC_OVERFLOW;

        account->totalRewardsReceived = *received;
        account->lastPayoutTime = now();
        market->totalRewardsPaid = *paid;
    }

    ctx_.deliver(payout);

    JLOG(j_.debug()) << "Distributed rewards to " << account_ << ": accrued "
                     << accrued << ", paid " << payout << ", reinvested "
                     << reinvest;
    return tesSUCCESS;
}

}  // namespace tierlend
