#include <tierlendd/app/tx/detail/Transactor.h>

#include <xrpl/basics/Log.h>

namespace tierlend {

using ripple::Unexpected;

Transactor::Transactor(ApplyContext& ctx)
    : ctx_(ctx), j_(ctx.journal), account_(ctx.tx.account)
{
}

NotTEC
Transactor::preflight0(PreflightContext const& ctx)
{
    if (ctx.tx.account == beast::zero)
    {
        JLOG(ctx.j.warn()) << "preflight0: missing signing account";
        return temMALFORMED;
    }

    return tesSUCCESS;
}

TER
Transactor::checkMarket(PreclaimContext const& ctx)
{
    if (!ctx.view.market() || !ctx.view.permanent())
    {
        JLOG(ctx.j.warn()) << "Market has not been initialized.";
        return tecNO_ENTRY;
    }

    return tesSUCCESS;
}

TER
Transactor::checkAuthority(PreclaimContext const& ctx)
{
    auto const market = ctx.view.market();
    if (!market)
        return tecNO_ENTRY;  // LCOV_EXCL_LINE

    if (market->authority != ctx.tx.account)
    {
        JLOG(ctx.j.warn()) << "Account " << ctx.tx.account
                           << " is not the market authority.";
        return tecNO_PERMISSION;
    }

    return tesSUCCESS;
}

TER
Transactor::checkNewAccount(
    ReadView const& view,
    AccountID const& owner,
    beast::Journal j)
{
    if (view.account(owner))
        return tesSUCCESS;

    auto const market = view.market();
    if (!market)
        return tecNO_ENTRY;  // LCOV_EXCL_LINE

    if (market->currentUsers >= market->parameters.maxUsers)
    {
        JLOG(j.warn()) << "Market is full: " << market->currentUsers
                       << " users.";
        return tecMARKET_FULL;
    }

    return tesSUCCESS;
}

bool
Transactor::hasPositionSlot(
    std::map<ReserveID, Position> const& positions,
    ReserveID const& reserve)
{
    return positions.contains(reserve) ||
        positions.size() < maxPositionsPerAccount;
}

ripple::Expected<std::shared_ptr<UserAccount>, TER>
Transactor::peekOrCreateAccount(AccountID const& owner)
{
    if (auto const existing = view().peekAccount(owner))
        return existing;

    auto const market = view().peekMarket();
    if (!market)
        return Unexpected(tefBAD_LEDGER);  // LCOV_EXCL_LINE

    if (market->currentUsers >= market->parameters.maxUsers)
    {
        JLOG(j_.warn()) << "Market is full, cannot open account " << owner;
        return Unexpected(tecMARKET_FULL);
    }

    auto account = std::make_shared<UserAccount>();
    account->owner = owner;
    view().insert(account);
    ++market->currentUsers;

    JLOG(j_.debug()) << "Opened account " << owner;
    return account;
}

TER
Transactor::operator()()
{
    JLOG(j_.trace()) << "apply: " << to_string(ctx_.tx.type) << " by "
                     << account_;

    auto const result = doApply();
    if (!isTesSuccess(result))
        return result;

    if (auto const account = view().peekAccount(account_))
        ++account->interactions;

    return result;
}

}  // namespace tierlend
