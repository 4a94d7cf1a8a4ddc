#ifndef TIERLEND_APP_TX_TIERREDISTRIBUTE_H_INCLUDED
#define TIERLEND_APP_TX_TIERREDISTRIBUTE_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class TierRedistribute : public Transactor
{
public:
    explicit TierRedistribute(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace tierlend

#endif
