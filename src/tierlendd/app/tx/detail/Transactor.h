#ifndef TIERLEND_APP_TX_TRANSACTOR_H_INCLUDED
#define TIERLEND_APP_TX_TRANSACTOR_H_INCLUDED

#include <tierlendd/app/tx/detail/ApplyContext.h>

#include <tierlend/ledger/ReadView.h>
#include <tierlend/protocol/TER.h>
#include <tierlend/protocol/Transaction.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>

#include <map>
#include <memory>

namespace tierlend {

/** State information when preflighting a tx. */
struct PreflightContext
{
public:
    Transaction const& tx;
    ApplyFlags flags;
    beast::Journal const j;

    PreflightContext(
        Transaction const& tx_,
        ApplyFlags flags_,
        beast::Journal j_)
        : tx(tx_), flags(flags_), j(j_)
    {
    }

    PreflightContext&
    operator=(PreflightContext const&) = delete;
};

/** State information when determining if a tx is likely to claim a fee. */
struct PreclaimContext
{
public:
    ReadView const& view;
    Transaction const& tx;
    ApplyFlags flags;
    beast::Journal const j;

    PreclaimContext(
        ReadView const& view_,
        Transaction const& tx_,
        ApplyFlags flags_,
        beast::Journal j_)
        : view(view_), tx(tx_), flags(flags_), j(j_)
    {
    }

    PreclaimContext&
    operator=(PreclaimContext const&) = delete;
};

class Transactor
{
protected:
    ApplyContext& ctx_;
    beast::Journal const j_;

    AccountID const account_;

public:
    virtual ~Transactor() = default;
    Transactor(Transactor const&) = delete;
    Transactor&
    operator=(Transactor const&) = delete;

    /** Process the transaction. */
    TER
    operator()();

    ApplyView&
    view()
    {
        return ctx_.view();
    }

    ApplyView const&
    view() const
    {
        return ctx_.view();
    }

    /////////////////////////////////////////////////////
    /*
    These static functions are called from invoke_preflight
    and invoke_preclaim via templates. Derived classes
    override them as needed.
    */

    // Checks common to every transaction: a signing account is present.
    static NotTEC
    preflight0(PreflightContext const& ctx);

    static NotTEC
    preflight(PreflightContext const& ctx)
    {
        // Most transactors only need
        // preflight0.
        return tesSUCCESS;
    }

    static TER
    preclaim(PreclaimContext const& ctx)
    {
        // Most transactors do nothing
        // after checkMarket.
        return tesSUCCESS;
    }

    /** The market has been initialized. */
    static TER
    checkMarket(PreclaimContext const& ctx);

    /** The signing account is the market authority. */
    static TER
    checkAuthority(PreclaimContext const& ctx);

    /** A new account for `owner` would fit within the market's capacity. */
    static TER
    checkNewAccount(ReadView const& view, AccountID const& owner, beast::Journal j);

    /** `positions` already holds `reserve` or has a free slot for it. */
    static bool
    hasPositionSlot(
        std::map<ReserveID, Position> const& positions,
        ReserveID const& reserve);

    /////////////////////////////////////////////////////

protected:
    explicit Transactor(ApplyContext& ctx);

    virtual TER
    doApply() = 0;

    Timestamp
    now() const
    {
        return ctx_.view().closeTime();
    }

    /** Peek `owner`'s account, opening a new one if none exists.

        Opening an account counts against the market's user capacity and
        fails with tecMARKET_FULL once it is reached.
    */
    ripple::Expected<std::shared_ptr<UserAccount>, TER>
    peekOrCreateAccount(AccountID const& owner);
};

}  // namespace tierlend

#endif
