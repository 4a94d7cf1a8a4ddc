#ifndef TIERLEND_APP_TX_REPAY_H_INCLUDED
#define TIERLEND_APP_TX_REPAY_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class Repay : public Transactor
{
public:
    explicit Repay(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static NotTEC
    preflight(PreflightContext const& ctx);

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace tierlend

#endif
