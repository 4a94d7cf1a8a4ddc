#include <tierlend/ledger/Sandbox.h>

#include <set>

namespace tierlend {

namespace {

// Copy the parent's entry into `staged` the first time it is peeked.
template <class Key, class Entry, class Fetch>
std::shared_ptr<Entry>
stage(
    std::map<Key, std::shared_ptr<Entry>>& staged,
    Key const& key,
    Fetch&& fetch)
{
    if (auto const iter = staged.find(key); iter != staged.end())
        return iter->second;

    auto const original = fetch();
    if (!original)
        return nullptr;

    auto copy = std::make_shared<Entry>(*original);
    staged.emplace(key, copy);
    return copy;
}

}  // namespace

Sandbox::Sandbox(ApplyView& parent) : parent_(parent)
{
}

void
Sandbox::apply()
{
    if (market_)
        parent_.insert(market_);
    if (permanent_)
        parent_.insert(permanent_);
    for (auto const& entry : reserves_)
        parent_.insert(entry.second);
    for (auto const& entry : accounts_)
        parent_.insert(entry.second);
    discard();
}

void
Sandbox::discard()
{
    market_.reset();
    permanent_.reset();
    reserves_.clear();
    accounts_.clear();
}

Timestamp
Sandbox::closeTime() const
{
    return parent_.closeTime();
}

std::shared_ptr<Market const>
Sandbox::market() const
{
    if (market_)
        return market_;
    return parent_.market();
}

std::shared_ptr<PermanentAccount const>
Sandbox::permanent() const
{
    if (permanent_)
        return permanent_;
    return parent_.permanent();
}

std::shared_ptr<Reserve const>
Sandbox::reserve(ReserveID const& id) const
{
    if (auto const iter = reserves_.find(id); iter != reserves_.end())
        return iter->second;
    return parent_.reserve(id);
}

std::shared_ptr<UserAccount const>
Sandbox::account(AccountID const& owner) const
{
    if (auto const iter = accounts_.find(owner); iter != accounts_.end())
        return iter->second;
    return parent_.account(owner);
}

std::vector<AccountID>
Sandbox::owners() const
{
    auto const inherited = parent_.owners();
    std::set<AccountID> all(inherited.begin(), inherited.end());
    for (auto const& entry : accounts_)
        all.insert(entry.first);
    return {all.begin(), all.end()};
}

std::shared_ptr<Market>
Sandbox::peekMarket()
{
    if (!market_)
    {
        auto const original = parent_.market();
        if (!original)
            return nullptr;
        market_ = std::make_shared<Market>(*original);
    }
    return market_;
}

std::shared_ptr<PermanentAccount>
Sandbox::peekPermanent()
{
    if (!permanent_)
    {
        auto const original = parent_.permanent();
        if (!original)
            return nullptr;
        permanent_ = std::make_shared<PermanentAccount>(*original);
    }
    return permanent_;
}

std::shared_ptr<Reserve>
Sandbox::peekReserve(ReserveID const& id)
{
    return stage(reserves_, id, [&] { return parent_.reserve(id); });
}

std::shared_ptr<UserAccount>
Sandbox::peekAccount(AccountID const& owner)
{
    return stage(accounts_, owner, [&] { return parent_.account(owner); });
}

void
Sandbox::insert(std::shared_ptr<Market> const& market)
{
    market_ = market;
}

void
Sandbox::insert(std::shared_ptr<PermanentAccount> const& permanent)
{
    permanent_ = permanent;
}

void
Sandbox::insert(std::shared_ptr<Reserve> const& reserve)
{
    reserves_[reserve->id] = reserve;
}

void
Sandbox::insert(std::shared_ptr<UserAccount> const& account)
{
    accounts_[account->owner] = account;
}

}  // namespace tierlend
