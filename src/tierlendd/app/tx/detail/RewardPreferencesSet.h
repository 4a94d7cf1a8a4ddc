#ifndef TIERLEND_APP_TX_REWARDPREFERENCESSET_H_INCLUDED
#define TIERLEND_APP_TX_REWARDPREFERENCESSET_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class RewardPreferencesSet : public Transactor
{
public:
    explicit RewardPreferencesSet(ApplyContext& ctx) : Transactor(ctx)
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
