#ifndef TIERLEND_TEST_JTX_OPS_H_INCLUDED
#define TIERLEND_TEST_JTX_OPS_H_INCLUDED

#include <test/jtx/Account.h>

#include <tierlend/protocol/Indexes.h>
#include <tierlend/protocol/MarketTypes.h>
#include <tierlend/protocol/Transaction.h>

#include <cstdint>
#include <optional>

namespace tierlend {
namespace test {
namespace jtx {

/** One whole unit of an asset, in base units. */
std::uint64_t constexpr ONE = 1'000'000'000;

/** Market operations. */
namespace market {

Transaction
set(Account const& authority, MarketParameters const& params = {});

Transaction
addReserve(
    Account const& authority,
    Account const& mint,
    std::uint32_t ltv,
    std::uint32_t liquidationThreshold,
    std::uint32_t liquidationPenalty);

Transaction
redistribute(Account const& authority);

}  // namespace market

/** Lending operations. */
namespace lend {

inline ReserveID
reserve(Account const& mint)
{
    return reserveIndex(mint.id());
}

Transaction
deposit(Account const& account, ReserveID const& reserve, std::uint64_t amount);

Transaction
borrow(Account const& account, ReserveID const& reserve, std::uint64_t amount);

Transaction
repay(Account const& account, ReserveID const& reserve, std::uint64_t amount);

Transaction
withdraw(
    Account const& account,
    ReserveID const& reserve,
    std::uint64_t amount);

Transaction
liquidate(
    Account const& liquidator,
    Account const& target,
    ReserveID const& debtReserve,
    std::uint64_t amount,
    std::optional<ReserveID> const& collateralReserve = std::nullopt);

Transaction
flashLoan(
    Account const& account,
    ReserveID const& reserve,
    std::uint64_t amount,
    std::uint64_t fee,
    FlashLoanStrategy strategy);

}  // namespace lend

/** Staking operations. */
namespace stake {

Transaction
set(Account const& account,
    std::uint64_t amount,
    std::optional<std::uint32_t> lockDurationDays = std::nullopt,
    bool enableLeverage = false);

Transaction
withdraw(Account const& account);

Transaction
preferences(Account const& account, RewardPreferences const& prefs);

Transaction
distribute(Account const& account);

}  // namespace stake

}  // namespace jtx
}  // namespace test
}  // namespace tierlend

#endif
