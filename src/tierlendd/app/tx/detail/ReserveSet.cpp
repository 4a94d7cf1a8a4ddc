#include <tierlendd/app/tx/detail/ReserveSet.h>

#include <tierlend/protocol/Indexes.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
ReserveSet::preflight(PreflightContext const& ctx)
{
    auto const& tx = ctx.tx;

    if (!tx.mint || *tx.mint == beast::zero)
        return temMALFORMED;

    if (!tx.ltvRatio || !tx.liquidationThreshold || !tx.liquidationPenalty)
        return temMALFORMED;

    auto const ltv = *tx.ltvRatio;
    auto const threshold = *tx.liquidationThreshold;
    auto const penalty = *tx.liquidationPenalty;

    // 0 < ltv < threshold < 100%
    if (ltv == 0 || ltv >= threshold || threshold >= bipsPerUnity)
    {
        JLOG(ctx.j.warn()) << "Invalid collateral ratios: ltv " << ltv
                           << " threshold " << threshold;
        return temINVALID_PARAMETER;
    }

    if (penalty >= bipsPerUnity)
    {
        JLOG(ctx.j.warn()) << "Invalid liquidation penalty " << penalty;
        return temINVALID_PARAMETER;
    }

    return tesSUCCESS;
}

TER
ReserveSet::preclaim(PreclaimContext const& ctx)
{
    if (auto const ter = checkAuthority(ctx))
        return ter;

    if (ctx.view.reserve(reserveIndex(*ctx.tx.mint)))
    {
        JLOG(ctx.j.warn()) << "Reserve for " << *ctx.tx.mint
                           << " already exists.";
        return tecDUPLICATE;
    }

    return tesSUCCESS;
}

TER
ReserveSet::doApply()
{
    auto const& tx = ctx_.tx;

    auto const market = view().peekMarket();
    if (!market)
        return tefBAD_LEDGER;  // LCOV_EXCL_LINE

    auto reserve = std::make_shared<Reserve>();
    reserve->id = reserveIndex(*tx.mint);
    reserve->mint = *tx.mint;
    reserve->ltvRatio = *tx.ltvRatio;
    reserve->liquidationThreshold = *tx.liquidationThreshold;
    reserve->liquidationPenalty = *tx.liquidationPenalty;
    reserve->lastAccrualTime = now();
    view().insert(reserve);

    market->reserves.push_back(reserve->id);

    JLOG(j_.info()) << "Added reserve " << reserve->id << " for mint "
                    << reserve->mint;
    return tesSUCCESS;
}

}  // namespace tierlend
