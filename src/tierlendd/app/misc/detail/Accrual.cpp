#include <tierlendd/app/misc/Accrual.h>
//
#include <tierlendd/app/misc/InterestRate.h>

#include <tierlend/basics/CheckedMath.h>

#include <xrpl/basics/Log.h>

#include <algorithm>
#include <set>

namespace tierlend {

namespace {

// index + index * rate * dt / (10000 * secondsInYear)
std::optional<std::uint64_t>
grownIndex(std::uint64_t index, std::uint64_t rate, std::uint64_t dt)
{
    auto const growth = checkedProductDiv(
        {index, rate, dt}, std::uint64_t{bipsPerUnity} * secondsInYear);
    if (!growth)
        return std::nullopt;
    return checkedAdd(index, *growth);
}

// total * newIndex / oldIndex - total
std::optional<std::uint64_t>
interestOn(std::uint64_t total, std::uint64_t newIndex, std::uint64_t oldIndex)
{
    auto const grown = checkedMulDiv(total, newIndex, oldIndex);
    if (!grown)
        return std::nullopt;
    return checkedSub(*grown, total);
}

}  // namespace

TER
accrueInterest(
    Reserve& reserve,
    Market& market,
    PermanentAccount& permanent,
    Timestamp now,
    beast::Journal j)
{
    if (now < reserve.lastAccrualTime)
    {
        JLOG(j.fatal()) << "Accrual time " << now
                        << " precedes last accrual "
                        << reserve.lastAccrualTime << " for reserve "
                        << reserve.id;
        return tefBAD_CLOCK;
    }

    auto const dt = static_cast<std::uint64_t>(now - reserve.lastAccrualTime);
    if (dt == 0)
        return tesSUCCESS;

    auto const& model = market.parameters.interestModel;
    auto const u = utilization(reserve.totalBorrows, reserve.totalDeposits);
    auto const bRate = borrowRate(model, u);
    auto const dRate = depositRate(model, u, market.parameters.reserveFactor);

    auto const newBorrowIndex = grownIndex(reserve.borrowIndex, bRate, dt);
    auto const newDepositIndex = grownIndex(reserve.depositIndex, dRate, dt);
    if (!newBorrowIndex || !newDepositIndex)
    {
        JLOG(j.warn()) << "Index overflow accruing reserve " << reserve.id;
        return tecARITHMETIC_OVERFLOW;
    }

    auto const borrowInterest = interestOn(
        reserve.totalBorrows, *newBorrowIndex, reserve.borrowIndex);
    auto const depositorInterest = interestOn(
        reserve.totalDeposits, *newDepositIndex, reserve.depositIndex);
    if (!borrowInterest || !depositorInterest)
        return tecARITHMETIC_OVERFLOW;

    auto const credited = std::min(*depositorInterest, *borrowInterest);
    auto const protocolShare = *borrowInterest - credited;

    auto const reserveBorrows =
        checkedAdd(reserve.totalBorrows, *borrowInterest);
    auto const reserveDeposits =
        checkedAdd(reserve.totalDeposits, *borrowInterest);
    auto const marketBorrows = checkedAdd(market.totalBorrows, *borrowInterest);
    auto const marketDeposits =
        checkedAdd(market.totalDeposits, *borrowInterest);
    auto const reserveFees = checkedAdd(reserve.protocolFees, protocolShare);
    auto const permanentFees =
        checkedAdd(permanent.protocolFees, protocolShare);
    if (!reserveBorrows || !reserveDeposits || !marketBorrows ||
        !marketDeposits || !reserveFees || !permanentFees)
        return tecARITHMETIC_OVERFLOW;

    reserve.borrowIndex = *newBorrowIndex;
    reserve.depositIndex = *newDepositIndex;
    reserve.totalBorrows = *reserveBorrows;
    reserve.totalDeposits = *reserveDeposits;
    reserve.protocolFees = *reserveFees;
    reserve.lastAccrualTime = now;

    market.totalBorrows = *marketBorrows;
    market.totalDeposits = *marketDeposits;

    if (protocolShare != 0)
    {
        permanent.protocolFees = *permanentFees;
        permanent.lastCredit = now;
    }

    JLOG(j.trace()) << "Accrued reserve " << reserve.id << " over " << dt
                    << "s: utilization " << u << " borrow rate " << bRate
                    << " interest " << *borrowInterest << " protocol share "
                    << protocolShare;

    return tesSUCCESS;
}

TER
accrueReserves(
    ApplyView& view,
    std::vector<ReserveID> const& reserves,
    beast::Journal j)
{
    auto const market = view.peekMarket();
    auto const permanent = view.peekPermanent();
    if (!market || !permanent)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    for (auto const& id : reserves)
    {
        auto const reserve = view.peekReserve(id);
        if (!reserve)
        {
            // LCOV_EXCL_START
            JLOG(j.fatal()) << "Position refers to missing reserve " << id;
            return tefBAD_LEDGER;
            // LCOV_EXCL_STOP
        }

        if (auto const ter = accrueInterest(
                *reserve, *market, *permanent, view.closeTime(), j))
            return ter;
    }

    return tesSUCCESS;
}

std::vector<ReserveID>
touchedReserves(UserAccount const& account)
{
    std::set<ReserveID> ids;
    for (auto const& entry : account.deposits)
        ids.insert(entry.first);
    for (auto const& entry : account.borrows)
        ids.insert(entry.first);
    return {ids.begin(), ids.end()};
}

Expected<std::uint64_t, TER>
positionValue(Position const& position, std::uint64_t currentIndex)
{
    if (position.index == currentIndex)
        return position.principal;

    auto const value =
        checkedMulDiv(position.principal, currentIndex, position.index);
    if (!value)
        return Unexpected(tecARITHMETIC_OVERFLOW);
    return *value;
}

TER
settlePosition(Position& position, std::uint64_t currentIndex)
{
    auto const value = positionValue(position, currentIndex);
    if (!value)
        return value.error();

    position.principal = *value;
    position.index = currentIndex;
    return tesSUCCESS;
}

}  // namespace tierlend
