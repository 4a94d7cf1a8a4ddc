#include <tierlendd/app/misc/InterestRate.h>
//
#include <tierlend/basics/CheckedMath.h>
#include <tierlend/protocol/Protocol.h>

#include <algorithm>

namespace tierlend {

std::uint32_t
utilization(std::uint64_t totalBorrows, std::uint64_t totalDeposits)
{
    if (totalDeposits == 0)
        return 0;

    if (totalBorrows >= totalDeposits)
        return bipsPerUnity;

    // totalBorrows < totalDeposits, so the quotient is below 10000 and
    // always fits.
    auto const u = checkedMulDiv(totalBorrows, bipsPerUnity, totalDeposits);
    return static_cast<std::uint32_t>(u.value_or(bipsPerUnity));
}

std::uint64_t
borrowRate(InterestRateModel const& model, std::uint32_t utilization)
{
    auto const u = std::min(utilization, bipsPerUnity);
    auto const kink = std::min(model.kink, bipsPerUnity);

    std::uint64_t rate = model.baseRate;
    rate += std::uint64_t{std::min(u, kink)} * model.multiplier / bipsPerUnity;
    if (u > kink)
        rate += std::uint64_t{u - kink} * model.jumpMultiplier / bipsPerUnity;
    return rate;
}

std::uint64_t
depositRate(
    InterestRateModel const& model,
    std::uint32_t utilization,
    std::uint32_t reserveFactor)
{
    auto const u = std::min(utilization, bipsPerUnity);
    auto const rf = std::min(reserveFactor, bipsPerUnity);

    return borrowRate(model, u) * u / bipsPerUnity * (bipsPerUnity - rf) /
        bipsPerUnity;
}

}  // namespace tierlend
