#ifndef TIERLEND_APP_TX_APPLYCONTEXT_H_INCLUDED
#define TIERLEND_APP_TX_APPLYCONTEXT_H_INCLUDED

#include <tierlendd/app/misc/ExternalProviders.h>

#include <tierlend/ledger/Sandbox.h>
#include <tierlend/protocol/Transaction.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <optional>

namespace tierlend {

/** State used while applying one transaction.

    Every change is made in a Sandbox over `base`, and only reaches `base`
    when apply() is called.
*/
class ApplyContext
{
public:
    ApplyContext(
        ApplyView& base,
        Transaction const& tx,
        ProviderSet& providers,
        ApplyFlags flags,
        beast::Journal journal);

    Transaction const& tx;
    ProviderSet& providers;
    ApplyFlags const flags;
    beast::Journal const journal;

    ApplyView&
    view()
    {
        return view_;
    }

    ApplyView const&
    view() const
    {
        return view_;
    }

    /** The state before the transaction. */
    ReadView const&
    base() const
    {
        return base_;
    }

    /** Record the amount paid out to the signing account. */
    void
    deliver(std::uint64_t amount)
    {
        delivered_ = amount;
    }

    std::optional<std::uint64_t> const&
    delivered() const
    {
        return delivered_;
    }

    /** Write the transaction's changes to the base view. */
    void
    apply();

    /** Drop every change made so far. */
    void
    discard();

private:
    ApplyView& base_;
    Sandbox view_;
    std::optional<std::uint64_t> delivered_;
};

}  // namespace tierlend

#endif
