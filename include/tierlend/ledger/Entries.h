#ifndef TIERLEND_LEDGER_ENTRIES_H_INCLUDED
#define TIERLEND_LEDGER_ENTRIES_H_INCLUDED

#include <tierlend/protocol/MarketTypes.h>
#include <tierlend/protocol/Protocol.h>

#include <xrpl/json/json_value.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tierlend {

/** The singleton describing the market and its aggregate totals.

    totalDeposits and totalBorrows always equal the sums over the reserves
    listed in `reserves`. Staked principal is tracked separately in
    totalStaked and never enters the reserve totals.
*/
struct Market
{
    AccountID authority;
    MarketParameters parameters;

    std::uint64_t totalDeposits = 0;
    std::uint64_t totalBorrows = 0;
    std::uint64_t totalStaked = 0;
    std::uint64_t totalRewardsPaid = 0;

    std::uint32_t currentUsers = 0;

    // Reserves in creation order. The market owns them.
    std::vector<ReserveID> reserves;

    Timestamp lastRedistribution = 0;

    Json::Value
    getJson() const;
};

/** Liquidity pool for one asset. */
struct Reserve
{
    ReserveID id;
    AccountID mint;

    std::uint32_t ltvRatio = 0;
    std::uint32_t liquidationThreshold = 0;
    std::uint32_t liquidationPenalty = 0;

    std::uint64_t totalDeposits = 0;
    std::uint64_t totalBorrows = 0;

    // Fixed point with indexOne representing 1.0. Neither ever decreases.
    std::uint64_t borrowIndex = indexOne;
    std::uint64_t depositIndex = indexOne;

    Timestamp lastAccrualTime = 0;

    // Reserve factor share of interest, counted inside totalDeposits.
    std::uint64_t protocolFees = 0;

    // Set only while a flash loan against this reserve is being applied.
    bool flashLoanActive = false;
    std::uint64_t flashLoanOutstanding = 0;

    Json::Value
    getJson() const;
};

/** A deposit or borrow balance. The current value is
    principal * currentIndex / index.
*/
struct Position
{
    std::uint64_t principal = 0;
    std::uint64_t index = indexOne;

    bool
    operator==(Position const&) const = default;
};

/** Per-owner lending positions and staking state. */
struct UserAccount
{
    AccountID owner;

    std::map<ReserveID, Position> deposits;
    std::map<ReserveID, Position> borrows;

    std::uint64_t stakeAmount = 0;
    Timestamp stakeStartTime = 0;
    std::uint32_t lockDurationDays = 0;
    Timestamp intendedEndTime = 0;
    Tier tier = Tier::bronze;

    // Rewards earned but not yet paid.
    std::uint64_t accumulatedRewards = 0;
    Timestamp rewardsAccruedThrough = 0;

    std::uint64_t totalRewardsReceived = 0;
    Timestamp lastPayoutTime = 0;

    std::optional<RewardPreferences> rewardPreferences;

    // Derivative held directly. What is posted to the leverage position is
    // returned by closing it.
    std::uint64_t liquidDerivativeAmount = 0;
    std::optional<std::string> leveragePosition;

    // Successful operations by or against this account.
    std::uint32_t interactions = 0;

    bool
    hasStake() const
    {
        return stakeAmount != 0;
    }

    Json::Value
    getJson() const;
};

/** Protocol sink. Nothing ever withdraws from it. */
struct PermanentAccount
{
    std::uint64_t totalPenalties = 0;
    std::uint64_t protocolFees = 0;
    Timestamp lastCredit = 0;

    Json::Value
    getJson() const;
};

}  // namespace tierlend

#endif
