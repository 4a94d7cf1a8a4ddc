#ifndef TIERLEND_APP_TX_APPLYSTEPS_H_INCLUDED
#define TIERLEND_APP_TX_APPLYSTEPS_H_INCLUDED

#include <tierlendd/app/misc/ExternalProviders.h>

#include <tierlend/ledger/ReadView.h>
#include <tierlend/protocol/TER.h>
#include <tierlend/protocol/Transaction.h>

#include <xrpl/beast/utility/Journal.h>

#include <cstdint>
#include <optional>

namespace tierlend {

/** The outcome of applying a transaction. */
struct ApplyResult
{
    TER ter;

    // The transaction's changes were written to the view.
    bool applied = false;

    // Amount paid out to the signing account, if any.
    std::optional<std::uint64_t> delivered;
};

/** Check a transaction in isolation.

    @return tesSUCCESS or a tem code.
*/
NotTEC
preflight(Transaction const& tx, ApplyFlags flags, beast::Journal j);

/** Check a transaction against the current state without changing it. */
TER
preclaim(
    ReadView const& view,
    Transaction const& tx,
    ApplyFlags flags,
    beast::Journal j);

/** Apply a transaction to `view` as one atomic unit.

    The transaction runs preflight, preclaim and then its transactor against
    a sandbox over `view`. The sandbox is written to `view` only when every
    step and every invariant check succeeds, and tapDRY_RUN is not set.
*/
ApplyResult
apply(
    ApplyView& view,
    Transaction const& tx,
    ProviderSet& providers,
    ApplyFlags flags,
    beast::Journal j);

}  // namespace tierlend

#endif
