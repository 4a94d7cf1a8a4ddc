#ifndef TIERLEND_APP_TX_STAKEWITHDRAW_H_INCLUDED
#define TIERLEND_APP_TX_STAKEWITHDRAW_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class StakeWithdraw : public Transactor
{
public:
    explicit StakeWithdraw(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace tierlend

#endif
