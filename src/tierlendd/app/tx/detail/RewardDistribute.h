#ifndef TIERLEND_APP_TX_REWARDDISTRIBUTE_H_INCLUDED
#define TIERLEND_APP_TX_REWARDDISTRIBUTE_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class RewardDistribute : public Transactor
{
public:
    explicit RewardDistribute(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace tierlend

#endif
