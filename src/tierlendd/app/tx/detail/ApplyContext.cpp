#include <tierlendd/app/tx/detail/ApplyContext.h>

namespace tierlend {

ApplyContext::ApplyContext(
    ApplyView& base,
    Transaction const& tx_,
    ProviderSet& providers_,
    ApplyFlags flags_,
    beast::Journal journal_)
    : tx(tx_)
    , providers(providers_)
    , flags(flags_)
    , journal(journal_)
    , base_(base)
    , view_(base)
{
}

void
ApplyContext::apply()
{
    view_.apply();
}

void
ApplyContext::discard()
{
    view_.discard();
    delivered_.reset();
}

}  // namespace tierlend
