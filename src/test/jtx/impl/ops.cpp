#include <test/jtx/ops.h>

#include <utility>

namespace tierlend {
namespace test {
namespace jtx {

namespace {

Transaction
make(TxType type, Account const& account)
{
    Transaction tx;
    tx.type = type;
    tx.account = account.id();
    return tx;
}

Transaction
make(
    TxType type,
    Account const& account,
    ReserveID const& reserve,
    std::uint64_t amount)
{
    auto tx = make(type, account);
    tx.reserve = reserve;
    tx.amount = amount;
    return tx;
}

}  // namespace

namespace market {

Transaction
set(Account const& authority, MarketParameters const& params)
{
    auto tx = make(ttMARKET_SET, authority);
    tx.marketParameters = params;
    return tx;
}

Transaction
addReserve(
    Account const& authority,
    Account const& mint,
    std::uint32_t ltv,
    std::uint32_t liquidationThreshold,
    std::uint32_t liquidationPenalty)
{
    auto tx = make(ttRESERVE_SET, authority);
    tx.mint = mint.id();
    tx.ltvRatio = ltv;
    tx.liquidationThreshold = liquidationThreshold;
    tx.liquidationPenalty = liquidationPenalty;
    return tx;
}

Transaction
redistribute(Account const& authority)
{
    return make(ttTIER_REDISTRIBUTE, authority);
}

}  // namespace market

namespace lend {

Transaction
deposit(Account const& account, ReserveID const& reserve, std::uint64_t amount)
{
    return make(ttDEPOSIT, account, reserve, amount);
}

Transaction
borrow(Account const& account, ReserveID const& reserve, std::uint64_t amount)
{
    return make(ttBORROW, account, reserve, amount);
}

Transaction
repay(Account const& account, ReserveID const& reserve, std::uint64_t amount)
{
    return make(ttREPAY, account, reserve, amount);
}

Transaction
withdraw(Account const& account, ReserveID const& reserve, std::uint64_t amount)
{
    return make(ttWITHDRAW, account, reserve, amount);
}

Transaction
liquidate(
    Account const& liquidator,
    Account const& target,
    ReserveID const& debtReserve,
    std::uint64_t amount,
    std::optional<ReserveID> const& collateralReserve)
{
    auto tx = make(ttLIQUIDATE, liquidator, debtReserve, amount);
    tx.target = target.id();
    tx.collateralReserve = collateralReserve;
    return tx;
}

Transaction
flashLoan(
    Account const& account,
    ReserveID const& reserve,
    std::uint64_t amount,
    std::uint64_t fee,
    FlashLoanStrategy strategy)
{
    auto tx = make(ttFLASH_LOAN, account, reserve, amount);
    tx.fee = fee;
    tx.strategy = std::move(strategy);
    return tx;
}

}  // namespace lend

namespace stake {

Transaction
set(Account const& account,
    std::uint64_t amount,
    std::optional<std::uint32_t> lockDurationDays,
    bool enableLeverage)
{
    auto tx = make(ttSTAKE_SET, account);
    tx.amount = amount;
    tx.lockDurationDays = lockDurationDays;
    tx.enableLeverage = enableLeverage;
    return tx;
}

Transaction
withdraw(Account const& account)
{
    return make(ttSTAKE_WITHDRAW, account);
}

Transaction
preferences(Account const& account, RewardPreferences const& prefs)
{
    auto tx = make(ttREWARD_PREFERENCES_SET, account);
    tx.preferences = prefs;
    return tx;
}

Transaction
distribute(Account const& account)
{
    return make(ttREWARD_DISTRIBUTE, account);
}

}  // namespace stake

}  // namespace jtx
}  // namespace test
}  // namespace tierlend
