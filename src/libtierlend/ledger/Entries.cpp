#include <tierlend/ledger/Entries.h>
//
#include <xrpl/basics/base_uint.h>

namespace tierlend {

namespace {

Json::Value
positionsJson(std::map<ReserveID, Position> const& positions)
{
    Json::Value ret(Json::objectValue);
    for (auto const& [reserve, position] : positions)
    {
        auto& entry = ret[ripple::to_string(reserve)];
        entry["principal"] = std::to_string(position.principal);
        entry["index"] = std::to_string(position.index);
    }
    return ret;
}

}  // namespace

Json::Value
Market::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["authority"] = ripple::toBase58(authority);
    ret["parameters"] = tierlend::getJson(parameters);
    ret["total_deposits"] = std::to_string(totalDeposits);
    ret["total_borrows"] = std::to_string(totalBorrows);
    ret["total_staked"] = std::to_string(totalStaked);
    ret["total_rewards_paid"] = std::to_string(totalRewardsPaid);
    ret["current_users"] = Json::UInt(currentUsers);
    ret["last_redistribution"] = std::to_string(lastRedistribution);

    Json::Value& ids = (ret["reserves"] = Json::arrayValue);
    for (auto const& id : reserves)
        ids.append(ripple::to_string(id));

    return ret;
}

Json::Value
Reserve::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["id"] = ripple::to_string(id);
    ret["mint"] = ripple::toBase58(mint);
    ret["ltv_ratio"] = Json::UInt(ltvRatio);
    ret["liquidation_threshold"] = Json::UInt(liquidationThreshold);
    ret["liquidation_penalty"] = Json::UInt(liquidationPenalty);
    ret["total_deposits"] = std::to_string(totalDeposits);
    ret["total_borrows"] = std::to_string(totalBorrows);
    ret["borrow_index"] = std::to_string(borrowIndex);
    ret["deposit_index"] = std::to_string(depositIndex);
    ret["last_accrual_time"] = std::to_string(lastAccrualTime);
    ret["protocol_fees"] = std::to_string(protocolFees);
    if (flashLoanActive)
    {
        ret["flash_loan_active"] = true;
        ret["flash_loan_outstanding"] = std::to_string(flashLoanOutstanding);
    }
    return ret;
}

Json::Value
UserAccount::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["owner"] = ripple::toBase58(owner);
    ret["deposits"] = positionsJson(deposits);
    ret["borrows"] = positionsJson(borrows);
    ret["interactions"] = Json::UInt(interactions);

    if (hasStake())
    {
        auto& stake = ret["stake"];
        stake["amount"] = std::to_string(stakeAmount);
        stake["start_time"] = std::to_string(stakeStartTime);
        stake["lock_duration_days"] = Json::UInt(lockDurationDays);
        stake["intended_end_time"] = std::to_string(intendedEndTime);
        stake["tier"] = to_string(tier);
        stake["accumulated_rewards"] = std::to_string(accumulatedRewards);
        stake["rewards_accrued_through"] =
            std::to_string(rewardsAccruedThrough);
        stake["liquid_derivative_amount"] =
            std::to_string(liquidDerivativeAmount);
        if (leveragePosition)
            stake["leverage_position"] = *leveragePosition;
    }

    ret["total_rewards_received"] = std::to_string(totalRewardsReceived);
    ret["last_payout_time"] = std::to_string(lastPayoutTime);
    if (rewardPreferences)
        ret["reward_preferences"] = tierlend::getJson(*rewardPreferences);

    return ret;
}

Json::Value
PermanentAccount::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["total_penalties"] = std::to_string(totalPenalties);
    ret["protocol_fees"] = std::to_string(protocolFees);
    ret["last_credit"] = std::to_string(lastCredit);
    return ret;
}

}  // namespace tierlend
