#ifndef TIERLEND_PROTOCOL_MARKETTYPES_H_INCLUDED
#define TIERLEND_PROTOCOL_MARKETTYPES_H_INCLUDED

#include <tierlend/protocol/Protocol.h>

#include <xrpl/json/json_value.h>

#include <cstdint>
#include <optional>
#include <string>

namespace tierlend {

/** Kinked utilization curve. All members are annualized basis points. */
struct InterestRateModel
{
    std::uint32_t baseRate = 500;
    std::uint32_t multiplier = 2000;
    std::uint32_t jumpMultiplier = 5000;
    // Utilization above which jumpMultiplier applies.
    std::uint32_t kink = 8000;

    bool
    operator==(InterestRateModel const&) const = default;
};

/** Everything MarketSet fixes for the lifetime of a market. */
struct MarketParameters
{
    InterestRateModel interestModel;

    // Share of borrow interest routed to the permanent account.
    std::uint32_t reserveFactor = 1000;

    std::uint32_t maxUsers = 10'000;

    // Lowest flash loan fee accepted, in basis points of the amount.
    std::uint32_t minFlashLoanFee = 0;

    // Annual staking reward at the 100% tier multiplier, 1700 is 17% APY.
    std::uint32_t baseRewardRate = 1700;

    // Base units in one whole staked asset unit, used by loyalty scoring.
    std::uint64_t stakeUnit = 1'000'000'000;

    bool
    operator==(MarketParameters const&) const = default;
};

enum class Tier : std::uint8_t { bronze, silver, gold, diamond };

enum class RewardMode : std::uint8_t { recurringInvestment, realTimeBatch };

enum class CompoundStrategy : std::uint8_t { simple, compound };

enum class BatchFrequency : std::uint8_t { instant, hourly, daily };

/** How an account wants its staking rewards handled by RewardDistribute. */
struct RewardPreferences
{
    RewardMode mode = RewardMode::recurringInvestment;

    // Percent of each distribution added back to the stake. Only consulted
    // in recurring investment mode.
    std::uint8_t reinvestmentPercentage = 80;

    CompoundStrategy compoundStrategy = CompoundStrategy::compound;

    // Batch mode pays only once this much has accumulated.
    std::uint64_t batchSize = 0;

    BatchFrequency batchFrequency = BatchFrequency::instant;

    std::uint64_t payoutThreshold = 0;

    // Batch mode adds the batch to the stake instead of paying it.
    bool autoCompound = false;

    // Commitment length used when a compounding reinvestment restarts the
    // lock.
    std::uint32_t lockDurationDays = defaultLockDurationDays;

    bool
    operator==(RewardPreferences const&) const = default;
};

std::string
to_string(Tier tier);

std::string
to_string(RewardMode mode);

std::string
to_string(CompoundStrategy strategy);

std::string
to_string(BatchFrequency frequency);

Json::Value
getJson(InterestRateModel const& model);

Json::Value
getJson(MarketParameters const& parameters);

Json::Value
getJson(RewardPreferences const& preferences);

}  // namespace tierlend

#endif
