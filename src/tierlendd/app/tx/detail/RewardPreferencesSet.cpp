#include <tierlendd/app/tx/detail/RewardPreferencesSet.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
RewardPreferencesSet::preflight(PreflightContext const& ctx)
{
    if (!ctx.tx.preferences)
        return temMALFORMED;

    auto const& prefs = *ctx.tx.preferences;

    if (prefs.reinvestmentPercentage > percentPerUnity)
    {
        JLOG(ctx.j.warn()) << "Reinvestment percentage "
                           << unsigned(prefs.reinvestmentPercentage)
                           << " is above 100.";
        return temINVALID_PARAMETER;
    }

    if (prefs.lockDurationDays < minLockDurationDays ||
        prefs.lockDurationDays > maxLockDurationDays)
    {
        JLOG(ctx.j.warn()) << "Lock duration of " << prefs.lockDurationDays
                           << " days is out of range.";
        return temINVALID_PARAMETER;
    }

    return tesSUCCESS;
}

TER
RewardPreferencesSet::preclaim(PreclaimContext const& ctx)
{
    if (!ctx.view.account(ctx.tx.account))
    {
        JLOG(ctx.j.warn()) << "Account does not exist.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

TER
RewardPreferencesSet::doApply()
{
    auto const account = view().peekAccount(account_);
    if (!account)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    account->rewardPreferences = ctx_.tx.preferences;

    JLOG(j_.debug()) << "Reward preferences of " << account_ << " set to "
                     << to_string(account->rewardPreferences->mode);
    return tesSUCCESS;
}

}  // namespace tierlend
