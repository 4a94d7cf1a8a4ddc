#ifndef TIERLEND_APP_MISC_TIERENGINE_H_INCLUDED
#define TIERLEND_APP_MISC_TIERENGINE_H_INCLUDED

#include <tierlend/ledger/Entries.h>
#include <tierlend/protocol/TER.h>

#include <xrpl/basics/Expected.h>

#include <cstdint>
#include <map>
#include <vector>

namespace tierlend {

/* Staking tiers.
 *
 * A staker's loyalty score combines four components, each a whole number:
 *
 *   amount    = stakeAmount / stakeUnit
 *   time      = whole days since the stake started
 *   frequency = successful operations by or against the account
 *   rewards   = totalRewardsReceived / stakeUnit
 *
 *   loyalty   = 2 * amount + 3 * time + frequency + 2 * rewards
 *
 * and maps onto a tier:
 *
 *   [0, 100]    Bronze    75%
 *   (100, 250]  Silver   100%
 *   (250, 500]  Gold     125%
 *   (500, inf)  Diamond  150%
 *
 * The percentage multiplies the market's base reward rate.
 */

/** Reward multiplier of a tier, in percent. */
std::uint32_t
tierMultiplier(Tier tier);

Tier
tierForScore(std::uint64_t loyaltyScore);

ripple::Expected<std::uint64_t, TER>
loyaltyScore(UserAccount const& account, std::uint64_t stakeUnit, Timestamp now);

ripple::Expected<Tier, TER>
evaluateTier(UserAccount const& account, std::uint64_t stakeUnit, Timestamp now);

/* Yield redistribution between tiers.
 *
 * Each epoch a pool of 20% of the stakers' aggregate base yield (what they
 * would have earned at the base rate, multiplier 100) moves from the lower
 * tiers to the upper ones. The debit side is Bronze (weight 40)
 * and Silver (weight 30); the credit side is Gold (weight 20) and Diamond
 * (weight 10). A tier takes part only if its members earned a non-zero
 * yield in the epoch.
 *
 *   debit(tier)  = min(pool * w / sum(w of debit tiers taking part),
 *                      aggregate yield of the tier)
 *   credit(tier) = debited * w / sum(w of credit tiers taking part)
 *
 * Within a tier the amount is split pro rata by epoch yield. Units lost to
 * rounding are handed out one at a time in AccountID order. The sum of all
 * debits equals the sum of all credits, and no account is debited more than
 * it earned in the epoch. If either side has no tier taking part nothing
 * moves.
 */
struct StakerYield
{
    AccountID account;
    Tier tier = Tier::bronze;
    std::uint64_t yield = 0;
    std::uint64_t baseYield = 0;
};

struct Redistribution
{
    std::uint64_t pool = 0;
    std::uint64_t transferred = 0;
    std::map<AccountID, std::uint64_t> debits;
    std::map<AccountID, std::uint64_t> credits;
};

ripple::Expected<Redistribution, TER>
computeRedistribution(std::vector<StakerYield> const& stakers);

}  // namespace tierlend

#endif
