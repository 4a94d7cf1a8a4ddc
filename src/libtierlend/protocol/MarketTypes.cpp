#include <tierlend/protocol/MarketTypes.h>

namespace tierlend {

std::string
to_string(Tier tier)
{
    switch (tier)
    {
        case Tier::bronze:
            return "Bronze";
        case Tier::silver:
            return "Silver";
        case Tier::gold:
            return "Gold";
        case Tier::diamond:
            return "Diamond";
    }
    return "Unknown";  // LCOV_EXCL_LINE
}

std::string
to_string(RewardMode mode)
{
    switch (mode)
    {
        case RewardMode::recurringInvestment:
            return "RecurringInvestment";
        case RewardMode::realTimeBatch:
            return "RealTimeBatch";
    }
    return "Unknown";  // LCOV_EXCL_LINE
}

std::string
to_string(CompoundStrategy strategy)
{
    switch (strategy)
    {
        case CompoundStrategy::simple:
            return "Simple";
        case CompoundStrategy::compound:
            return "Compound";
    }
    return "Unknown";  // LCOV_EXCL_LINE
}

std::string
to_string(BatchFrequency frequency)
{
    switch (frequency)
    {
        case BatchFrequency::instant:
            return "Instant";
        case BatchFrequency::hourly:
            return "Hourly";
        case BatchFrequency::daily:
            return "Daily";
    }
    return "Unknown";  // LCOV_EXCL_LINE
}

Json::Value
getJson(InterestRateModel const& model)
{
    Json::Value ret(Json::objectValue);
    ret["base_rate"] = Json::UInt(model.baseRate);
    ret["multiplier"] = Json::UInt(model.multiplier);
    ret["jump_multiplier"] = Json::UInt(model.jumpMultiplier);
    ret["kink"] = Json::UInt(model.kink);
    return ret;
}

Json::Value
getJson(MarketParameters const& parameters)
{
    Json::Value ret(Json::objectValue);
    ret["interest_model"] = getJson(parameters.interestModel);
    ret["reserve_factor"] = Json::UInt(parameters.reserveFactor);
    ret["max_users"] = Json::UInt(parameters.maxUsers);
    ret["min_flash_loan_fee"] = Json::UInt(parameters.minFlashLoanFee);
    ret["base_reward_rate"] = Json::UInt(parameters.baseRewardRate);
    // 64-bit amounts are rendered as strings
    ret["stake_unit"] = std::to_string(parameters.stakeUnit);
    return ret;
}

Json::Value
getJson(RewardPreferences const& preferences)
{
    Json::Value ret(Json::objectValue);
    ret["mode"] = to_string(preferences.mode);
    ret["reinvestment_percentage"] =
        Json::UInt(preferences.reinvestmentPercentage);
    ret["compound_strategy"] = to_string(preferences.compoundStrategy);
    ret["batch_size"] = std::to_string(preferences.batchSize);
    ret["batch_frequency"] = to_string(preferences.batchFrequency);
    ret["payout_threshold"] = std::to_string(preferences.payoutThreshold);
    ret["auto_compound"] = preferences.autoCompound;
    ret["lock_duration_days"] = Json::UInt(preferences.lockDurationDays);
    return ret;
}

}  // namespace tierlend
