#ifndef TIERLEND_APP_MISC_STAKINGHELPERS_H_INCLUDED
#define TIERLEND_APP_MISC_STAKINGHELPERS_H_INCLUDED

#include <tierlend/ledger/Entries.h>
#include <tierlend/protocol/TER.h>

#include <xrpl/basics/Expected.h>

#include <cstdint>

namespace tierlend {

/* Staking rewards and penalties.
 *
 * A stake earns, over `elapsed` seconds,
 *
 *   reward = stake * baseRewardRate * elapsed * tierMultiplier
 *            / (10000 * 100 * secondsInYear)
 *
 * computed with a single checked 128-bit product so nothing is rounded
 * until the final division.
 *
 * Leaving before the intended end of the commitment forfeits the pending
 * rewards and costs a penalty equal to the reward the whole commitment
 * would have earned at the current tier. The penalty comes out of the
 * redeemed principal and is credited to the permanent account.
 */

ripple::Expected<std::uint64_t, TER>
stakingReward(
    std::uint64_t stake,
    std::uint32_t baseRewardRate,
    std::uint64_t elapsedSeconds,
    Tier tier);

/** True if the commitment has not yet reached its intended end. */
inline bool
isEarlyExit(UserAccount const& account, Timestamp now)
{
    return now < account.intendedEndTime;
}

ripple::Expected<std::uint64_t, TER>
earlyExitPenalty(UserAccount const& account, std::uint32_t baseRewardRate);

/** Move rewards earned since rewardsAccruedThrough into accumulatedRewards.

    Returns the amount accrued by this call through `accrued`.
*/
[[nodiscard]] TER
accrueStakingRewards(
    UserAccount& account,
    std::uint32_t baseRewardRate,
    Timestamp now,
    std::uint64_t& accrued);

/** What a staker receives when closing a stake. */
struct WithdrawalQuote
{
    std::uint64_t payout = 0;
    // Penalty actually taken from the principal.
    std::uint64_t penalty = 0;
    // Rewards included in the payout.
    std::uint64_t reward = 0;
    bool early = false;
};

/** Price a withdrawal of `principal` redeemed from the liquidity provider.

    On-time exits accrue the remaining rewards into the account first.
*/
ripple::Expected<WithdrawalQuote, TER>
quoteWithdrawal(
    UserAccount& account,
    std::uint64_t principal,
    std::uint32_t baseRewardRate,
    Timestamp now);

/** Seconds that must pass between batch payouts. */
std::int64_t
batchCadence(BatchFrequency frequency);

/** Reset every staking field, leaving lending positions alone. */
void
closeStake(UserAccount& account);

}  // namespace tierlend

#endif
