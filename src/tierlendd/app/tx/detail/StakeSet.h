#ifndef TIERLEND_APP_TX_STAKESET_H_INCLUDED
#define TIERLEND_APP_TX_STAKESET_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class StakeSet : public Transactor
{
public:
    explicit StakeSet(ApplyContext& ctx) : Transactor(ctx)
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
