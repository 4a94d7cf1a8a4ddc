#include <tierlendd/app/misc/StakingHelpers.h>
//
#include <tierlendd/app/misc/TierEngine.h>

#include <tierlend/basics/CheckedMath.h>

#include <algorithm>

namespace tierlend {

using ripple::Unexpected;

ripple::Expected<std::uint64_t, TER>
stakingReward(
    std::uint64_t stake,
    std::uint32_t baseRewardRate,
    std::uint64_t elapsedSeconds,
    Tier tier)
{
    if (stake == 0 || elapsedSeconds == 0)
        return std::uint64_t{0};

    auto const reward = checkedProductDiv(
        {stake, baseRewardRate, elapsedSeconds, tierMultiplier(tier)},
        std::uint64_t{bipsPerUnity} * percentPerUnity * secondsInYear);
    if (!reward)
        return Unexpected(tecARITHMETIC_OVERFLOW);
    return *reward;
}

ripple::Expected<std::uint64_t, TER>
earlyExitPenalty(UserAccount const& account, std::uint32_t baseRewardRate)
{
    auto const commitment = account.intendedEndTime > account.stakeStartTime
        ? static_cast<std::uint64_t>(
              account.intendedEndTime - account.stakeStartTime)
        : 0;
    return stakingReward(
        account.stakeAmount, baseRewardRate, commitment, account.tier);
}

TER
accrueStakingRewards(
    UserAccount& account,
    std::uint32_t baseRewardRate,
    Timestamp now,
    std::uint64_t& accrued)
{
    accrued = 0;

    if (now < account.rewardsAccruedThrough)
        return tefBAD_CLOCK;

    auto const elapsed =
        static_cast<std::uint64_t>(now - account.rewardsAccruedThrough);
    auto const reward = stakingReward(
        account.stakeAmount, baseRewardRate, elapsed, account.tier);
    if (!reward)
        return reward.error();

    auto const total = checkedAdd(account.accumulatedRewards, *reward);
    if (!total)
        return tecARITHMETIC_OVERFLOW;

    account.accumulatedRewards = *total;
    account.rewardsAccruedThrough = now;
    accrued = *reward;
    return tesSUCCESS;
}

ripple::Expected<WithdrawalQuote, TER>
quoteWithdrawal(
    UserAccount& account,
    std::uint64_t principal,
    std::uint32_t baseRewardRate,
    Timestamp now)
{
    WithdrawalQuote quote;

    if (isEarlyExit(account, now))
    {
        auto const penalty = earlyExitPenalty(account, baseRewardRate);
        if (!penalty)
            return Unexpected(penalty.error());

        quote.early = true;
        quote.penalty = std::min(principal, *penalty);
        quote.payout = principal - quote.penalty;
        return quote;
    }

    std::uint64_t accrued = 0;
    if (auto const ter =
            accrueStakingRewards(account, baseRewardRate, now, accrued))
        return Unexpected(ter);

    auto const payout = checkedAdd(principal, account.accumulatedRewards);
    if (!payout)
        return Unexpected(tecARITHMETIC_OVERFLOW);

    quote.reward = account.accumulatedRewards;
    quote.payout = *payout;
    return quote;
}

std::int64_t
batchCadence(BatchFrequency frequency)
{
    switch (frequency)
    {
        case BatchFrequency::instant:
            return 0;
        case BatchFrequency::hourly:
            return secondsInHour;
        case BatchFrequency::daily:
            return secondsInDay;
    }
    return 0;  // LCOV_EXCL_LINE
}

void
closeStake(UserAccount& account)
{
    account.stakeAmount = 0;
    account.stakeStartTime = 0;
    account.lockDurationDays = 0;
    account.intendedEndTime = 0;
    account.accumulatedRewards = 0;
    account.rewardsAccruedThrough = 0;
    account.liquidDerivativeAmount = 0;
    account.leveragePosition.reset();
    account.rewardPreferences.reset();
}

}  // namespace tierlend
