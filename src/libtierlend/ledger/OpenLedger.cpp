#include <tierlend/ledger/OpenLedger.h>
//
#include <xrpl/basics/base_uint.h>

namespace tierlend {

OpenLedger::OpenLedger(Timestamp closeTime) : closeTime_(closeTime)
{
}

void
OpenLedger::setCloseTime(Timestamp closeTime)
{
    closeTime_ = closeTime;
}

Json::Value
OpenLedger::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["close_time"] = std::to_string(closeTime_);
    if (market_)
        ret["market"] = market_->getJson();
    if (permanent_)
        ret["permanent"] = permanent_->getJson();

    Json::Value& reserves = (ret["reserves"] = Json::arrayValue);
    for (auto const& [id, reserve] : reserves_)
        reserves.append(reserve->getJson());

    Json::Value& accounts = (ret["accounts"] = Json::arrayValue);
    for (auto const& [owner, account] : accounts_)
        accounts.append(account->getJson());

    return ret;
}

Timestamp
OpenLedger::closeTime() const
{
    return closeTime_;
}

std::shared_ptr<Market const>
OpenLedger::market() const
{
    return market_;
}

std::shared_ptr<PermanentAccount const>
OpenLedger::permanent() const
{
    return permanent_;
}

std::shared_ptr<Reserve const>
OpenLedger::reserve(ReserveID const& id) const
{
    auto const iter = reserves_.find(id);
    if (iter == reserves_.end())
        return nullptr;
    return iter->second;
}

std::shared_ptr<UserAccount const>
OpenLedger::account(AccountID const& owner) const
{
    auto const iter = accounts_.find(owner);
    if (iter == accounts_.end())
        return nullptr;
    return iter->second;
}

std::vector<AccountID>
OpenLedger::owners() const
{
    std::vector<AccountID> ret;
    ret.reserve(accounts_.size());
    for (auto const& entry : accounts_)
        ret.push_back(entry.first);
    return ret;
}

std::shared_ptr<Market>
OpenLedger::peekMarket()
{
    return market_;
}

std::shared_ptr<PermanentAccount>
OpenLedger::peekPermanent()
{
    return permanent_;
}

std::shared_ptr<Reserve>
OpenLedger::peekReserve(ReserveID const& id)
{
    auto const iter = reserves_.find(id);
    if (iter == reserves_.end())
        return nullptr;
    return iter->second;
}

std::shared_ptr<UserAccount>
OpenLedger::peekAccount(AccountID const& owner)
{
    auto const iter = accounts_.find(owner);
    if (iter == accounts_.end())
        return nullptr;
    return iter->second;
}

void
OpenLedger::insert(std::shared_ptr<Market> const& market)
{
    market_ = market;
}

void
OpenLedger::insert(std::shared_ptr<PermanentAccount> const& permanent)
{
    permanent_ = permanent;
}

void
OpenLedger::insert(std::shared_ptr<Reserve> const& reserve)
{
    reserves_[reserve->id] = reserve;
}

void
OpenLedger::insert(std::shared_ptr<UserAccount> const& account)
{
    accounts_[account->owner] = account;
}

}  // namespace tierlend
