#include <tierlendd/app/tx/detail/TierRedistribute.h>
//
#include <tierlendd/app/misc/StakingHelpers.h>
#include <tierlendd/app/misc/TierEngine.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

#include <vector>

namespace tierlend {

TER
TierRedistribute::preclaim(PreclaimContext const& ctx)
{
    return checkAuthority(ctx);
}

TER
TierRedistribute::doApply()
{
    auto const market = view().peekMarket();
    if (!market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const& params = market->parameters;

    // Bring every stake up to date and collect what each earned since the
    // last accrual. That is the epoch yield being redistributed. The pool
    // is sized from the same period at the base rate.
    std::vector<StakerYield> stakers;
    std::vector<std::shared_ptr<UserAccount>> accounts;
    for (auto const& owner : view().owners())
    {
        auto const account = view().peekAccount(owner);
        if (!account || !account->hasStake())
            continue;

        auto const tier = evaluateTier(*account, params.stakeUnit, now());
        if (!tier)
            return tier.error();
        account->tier = *tier;

        auto const since = account->rewardsAccruedThrough;
        std::uint64_t accrued = 0;
        if (auto const ter = accrueStakingRewards(
                *account, params.baseRewardRate, now(), accrued))
            return ter;

        auto const base = stakingReward(
            account->stakeAmount,
            params.baseRewardRate,
            static_cast<std::uint64_t>(now() - since),
            Tier::silver);
        if (!base)
            return base.error();

        stakers.push_back({owner, account->tier, accrued, *base});
        accounts.push_back(account);
    }

    auto const result = computeRedistribution(stakers);
    if (!result)
        return result.error();

    for (auto const& account : accounts)
    {
        if (auto const it = result->debits.find(account->owner);
            it != result->debits.end())
        {
            auto const remaining =
                checkedSub(account->accumulatedRewards, it->second);
            if (!remaining)
                return tecINTERNAL;  // LCOV_EXCL_LINE
            account->accumulatedRewards = *remaining;
        }

        if (auto const it = result->credits.find(account->owner);
            it != result->credits.end())
        {
            auto const total =
                checkedAdd(account->accumulatedRewards, it->second);
            if (!total)
                return tecARITHMETIC_OVERFLOW;
            account->accumulatedRewards = *total;
        }
    }

    market->lastRedistribution = now();

    JLOG(j_.info()) << "Redistributed " << result->transferred << " of a pool of "
                    << result->pool << " across " << stakers.size()
                    << " stakers";
    return tesSUCCESS;
}

}  // namespace tierlend
