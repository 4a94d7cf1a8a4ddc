#ifndef TIERLEND_APP_MAIN_MARKETENGINE_H_INCLUDED
#define TIERLEND_APP_MAIN_MARKETENGINE_H_INCLUDED

#include <tierlendd/app/misc/ExternalProviders.h>
#include <tierlendd/app/tx/applySteps.h>

#include <tierlend/ledger/OpenLedger.h>
#include <tierlend/protocol/MarketTypes.h>
#include <tierlend/protocol/Transaction.h>

#include <xrpl/basics/Log.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>

#include <atomic>
#include <mutex>
#include <thread>

namespace tierlend {

/** Hosts one market.

    Owns the open ledger and applies transactions to it one at a time.
    Submissions from different threads are serialized, so each transaction
    observes the complete effects of the one before it.
*/
class MarketEngine
{
    beast::Journal const j_;
    beast::Journal const applyJournal_;

    ProviderSet providers_;

    mutable std::mutex mutex_;
    OpenLedger ledger_;

    // The thread inside apply, which already holds mutex_. Flash loan
    // strategies run on that thread and may call back into the engine.
    std::atomic<std::thread::id> applyingThread_;

    bool
    applying() const;

    std::unique_lock<std::mutex>
    lockUnlessApplying() const;

    ApplyResult
    applyLocked(Transaction const& tx, ApplyFlags flags);

public:
    MarketEngine(
        ProviderSet providers,
        ripple::Logs& logs,
        Timestamp closeTime = 0);

    MarketEngine(MarketEngine const&) = delete;
    MarketEngine&
    operator=(MarketEngine const&) = delete;

    /** Create the market with `authority` and `parameters`. */
    ApplyResult
    initialize(AccountID const& authority, MarketParameters const& parameters);

    /** Apply `tx` to the open ledger.

        A call made while a transaction is being applied, from a flash loan
        strategy for instance, is refused with tefREENTRANT_SUBMIT. Nested
        transactions go through FlashLoanContext::submit instead.
    */
    ApplyResult
    submit(Transaction const& tx);

    /** Run `tx` against the open ledger and report the outcome without
        keeping its changes.
    */
    ApplyResult
    simulate(Transaction const& tx);

    Timestamp
    closeTime() const;

    /** Advance the ledger clock. Times before the current one are refused,
        as are calls made while a transaction is being applied.
    */
    bool
    setCloseTime(Timestamp closeTime);

    /** The configured parameters, if the market exists. */
    std::optional<MarketParameters>
    parameters() const;

    Json::Value
    getJson() const;

    /** Direct access to the ledger. Not synchronized with submit. */
    OpenLedger&
    ledger()
    {
        return ledger_;
    }
};

}  // namespace tierlend

#endif
