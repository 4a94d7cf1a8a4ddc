#ifndef TIERLEND_PROTOCOL_TRANSACTION_H_INCLUDED
#define TIERLEND_PROTOCOL_TRANSACTION_H_INCLUDED

#include <tierlend/protocol/MarketTypes.h>
#include <tierlend/protocol/Protocol.h>
#include <tierlend/protocol/TER.h>

#include <xrpl/json/json_value.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tierlend {

enum TxType : std::uint16_t {
    ttMARKET_SET = 0,
    ttRESERVE_SET = 1,
    ttDEPOSIT = 2,
    ttBORROW = 3,
    ttREPAY = 4,
    ttWITHDRAW = 5,
    ttLIQUIDATE = 6,
    ttFLASH_LOAN = 7,
    ttSTAKE_SET = 8,
    ttSTAKE_WITHDRAW = 9,
    ttREWARD_PREFERENCES_SET = 10,
    ttREWARD_DISTRIBUTE = 11,
    ttTIER_REDISTRIBUTE = 12,
};

class FlashLoanContext;

/** Caller supplied logic run while a flash loan is outstanding.

    The strategy may submit further transactions through the context and
    must repay the principal plus fee before returning tesSUCCESS.
*/
using FlashLoanStrategy = std::function<TER(FlashLoanContext&)>;

/** A single operation submitted against the market.

    Which optional fields are required depends on `type`; preflight for the
    matching transactor rejects a transaction that lacks one.
*/
struct Transaction
{
    TxType type = ttDEPOSIT;

    // The signing account.
    AccountID account;

    std::optional<ReserveID> reserve;

    // Liquidate: where the seized collateral comes from.
    std::optional<ReserveID> collateralReserve;

    // Liquidate: the account being liquidated.
    std::optional<AccountID> target;

    // ReserveSet: the asset the reserve holds.
    std::optional<AccountID> mint;

    std::optional<std::uint64_t> amount;

    // FlashLoan: the fee owed on top of the amount.
    std::optional<std::uint64_t> fee;

    std::optional<std::uint32_t> ltvRatio;
    std::optional<std::uint32_t> liquidationThreshold;
    std::optional<std::uint32_t> liquidationPenalty;

    std::optional<MarketParameters> marketParameters;

    std::optional<std::uint32_t> lockDurationDays;
    bool enableLeverage = false;

    std::optional<RewardPreferences> preferences;

    FlashLoanStrategy strategy;

    Json::Value
    getJson() const;
};

std::string
to_string(TxType type);

}  // namespace tierlend

#endif
