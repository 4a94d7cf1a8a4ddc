#ifndef TIERLEND_APP_TX_BORROW_H_INCLUDED
#define TIERLEND_APP_TX_BORROW_H_INCLUDED

#include <tierlendd/app/tx/detail/Transactor.h>

namespace tierlend {

class Borrow : public Transactor
{
public:
    explicit Borrow(ApplyContext& ctx) : Transactor(ctx)
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
