#include <tierlendd/app/tx/detail/MarketSet.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

NotTEC
MarketSet::preflight(PreflightContext const& ctx)
{
    MarketParameters const params =
        ctx.tx.marketParameters.value_or(MarketParameters{});

    if (params.interestModel.kink > bipsPerUnity)
    {
        JLOG(ctx.j.warn()) << "Kink " << params.interestModel.kink
                           << " is above 100%.";
        return temINVALID_PARAMETER;
    }

    if (params.reserveFactor > bipsPerUnity ||
        params.minFlashLoanFee > bipsPerUnity ||
        params.baseRewardRate > bipsPerUnity)
    {
        JLOG(ctx.j.warn()) << "Market rate parameter is above 100%.";
        return temINVALID_PARAMETER;
    }

    if (params.maxUsers == 0 || params.stakeUnit == 0)
        return temINVALID_PARAMETER;

    return tesSUCCESS;
}

TER
MarketSet::preclaim(PreclaimContext const& ctx)
{
    if (ctx.view.market())
    {
        JLOG(ctx.j.warn()) << "Market is already initialized.";
        return tecDUPLICATE;
    }

    return tesSUCCESS;
}

TER
MarketSet::doApply()
{
    auto market = std::make_shared<Market>();
    market->authority = account_;
    market->parameters =
        ctx_.tx.marketParameters.value_or(MarketParameters{});
    market->lastRedistribution = now();
    view().insert(market);

    auto permanent = std::make_shared<PermanentAccount>();
    permanent->lastCredit = now();
    view().insert(permanent);

    JLOG(j_.info()) << "Market initialized by " << account_;
    return tesSUCCESS;
}

}  // namespace tierlend
