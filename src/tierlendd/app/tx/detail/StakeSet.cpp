#include <tierlendd/app/tx/detail/StakeSet.h>
//
#include <tierlendd/app/misc/TierEngine.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
StakeSet::preflight(PreflightContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!tx.amount || *tx.amount == 0)
        return temBAD_AMOUNT;

    auto const days = tx.lockDurationDays.value_or(defaultLockDurationDays);
    if (days < minLockDurationDays || days > maxLockDurationDays)
    {
        JLOG(ctx.j.warn()) << "Lock duration of " << days
                           << " days is out of range.";
        return temINVALID_PARAMETER;
    }

    return tesSUCCESS;
}

TER
StakeSet::preclaim(PreclaimContext const& ctx)
{
    auto const account = ctx.view.account(ctx.tx.account);
    if (!account)
        return checkNewAccount(ctx.view, ctx.tx.account, ctx.j);

    if (account->hasStake())
    {
        JLOG(ctx.j.warn()) << "Account already has an open stake.";
        return tecDUPLICATE;
    }

    return tesSUCCESS;
}

TER
StakeSet::doApply()
{
    auto const& tx = ctx_.tx;
    auto const amount = *tx.amount;
    auto const days = tx.lockDurationDays.value_or(defaultLockDurationDays);

    auto const derivative = ctx_.providers.converter.convert(amount);
    if (!derivative)
    {
        JLOG(j_.warn()) << "Liquidity conversion of " << amount
                        << " failed: " << derivative.error();
        return tecEXTERNAL_CALL_FAILED;
    }

    std::optional<std::string> leverage;
    if (tx.enableLeverage)
    {
        auto const position = ctx_.providers.leverage.open(*derivative);
        if (!position)
        {
            JLOG(j_.warn()) << "Opening leverage position failed: "
                            << position.error();
            return tecEXTERNAL_CALL_FAILED;
        }
        leverage = *position;
    }

    auto const market = view().peekMarket();
    if (!market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto const staked = checkedAdd(market->totalStaked, amount);
    if (!staked)
        return tecARITHMETIC_OVERFLOW;

    auto const account = peekOrCreateAccount(account_);
    if (!account)
        return account.error();
    auto const& sle = *account;

    sle->stakeAmount = amount;
    sle->stakeStartTime = now();
    sle->lockDurationDays = days;
    sle->intendedEndTime = now() + days * secondsInDay;
    sle->rewardsAccruedThrough = now();
    sle->accumulatedRewards = 0;
    // Derivative posted to a leverage position is not held directly.
    sle->liquidDerivativeAmount = leverage ? 0 : *derivative;
    sle->leveragePosition = leverage;
    if (!sle->rewardPreferences)
        sle->rewardPreferences = RewardPreferences{};

    auto const tier =
        evaluateTier(*sle, market->parameters.stakeUnit, now());
    if (!tier)
        return tier.error();
    sle->tier = *tier;

    market->totalStaked = *staked;

    JLOG(j_.info()) << "Staked " << amount << " for " << days
                    << " days, tier " << to_string(sle->tier)
                    << (leverage ? ", leveraged" : "");
    return tesSUCCESS;
}

}  // namespace tierlend
