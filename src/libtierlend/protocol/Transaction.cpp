#include <tierlend/protocol/Transaction.h>
//
#include <xrpl/basics/base_uint.h>

namespace tierlend {

std::string
to_string(TxType type)
{
    switch (type)
    {
        case ttMARKET_SET:
            return "MarketSet";
        case ttRESERVE_SET:
            return "ReserveSet";
        case ttDEPOSIT:
            return "Deposit";
        case ttBORROW:
            return "Borrow";
        case ttREPAY:
            return "Repay";
        case ttWITHDRAW:
            return "Withdraw";
        case ttLIQUIDATE:
            return "Liquidate";
        case ttFLASH_LOAN:
            return "FlashLoan";
        case ttSTAKE_SET:
            return "StakeSet";
        case ttSTAKE_WITHDRAW:
            return "StakeWithdraw";
        case ttREWARD_PREFERENCES_SET:
            return "RewardPreferencesSet";
        case ttREWARD_DISTRIBUTE:
            return "RewardDistribute";
        case ttTIER_REDISTRIBUTE:
            return "TierRedistribute";
    }
    return "Unknown";
}

Json::Value
Transaction::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["TransactionType"] = to_string(type);
    ret["Account"] = ripple::toBase58(account);

    if (reserve)
        ret["Reserve"] = ripple::to_string(*reserve);
    if (collateralReserve)
        ret["CollateralReserve"] = ripple::to_string(*collateralReserve);
    if (target)
        ret["Target"] = ripple::toBase58(*target);
    if (mint)
        ret["Mint"] = ripple::toBase58(*mint);
    if (amount)
        ret["Amount"] = std::to_string(*amount);
    if (fee)
        ret["Fee"] = std::to_string(*fee);
    if (ltvRatio)
        ret["LtvRatio"] = Json::UInt(*ltvRatio);
    if (liquidationThreshold)
        ret["LiquidationThreshold"] = Json::UInt(*liquidationThreshold);
    if (liquidationPenalty)
        ret["LiquidationPenalty"] = Json::UInt(*liquidationPenalty);
    if (marketParameters)
        ret["MarketParameters"] = tierlend::getJson(*marketParameters);
    if (lockDurationDays)
        ret["LockDurationDays"] = Json::UInt(*lockDurationDays);
    if (enableLeverage)
        ret["EnableLeverage"] = true;
    if (preferences)
        ret["RewardPreferences"] = tierlend::getJson(*preferences);
    if (strategy)
        ret["HasStrategy"] = true;

    return ret;
}

}  // namespace tierlend
