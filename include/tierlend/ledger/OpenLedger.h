#ifndef TIERLEND_LEDGER_OPENLEDGER_H_INCLUDED
#define TIERLEND_LEDGER_OPENLEDGER_H_INCLUDED

#include <tierlend/ledger/ReadView.h>

#include <xrpl/json/json_value.h>

#include <map>
#include <memory>

namespace tierlend {

/** The authoritative in-memory market state.

    Transactions never modify it directly; they run in a Sandbox layered on
    top of it which is applied only when the transaction succeeds.
*/
class OpenLedger final : public ApplyView
{
    Timestamp closeTime_;
    std::shared_ptr<Market> market_;
    std::shared_ptr<PermanentAccount> permanent_;
    std::map<ReserveID, std::shared_ptr<Reserve>> reserves_;
    std::map<AccountID, std::shared_ptr<UserAccount>> accounts_;

public:
    explicit OpenLedger(Timestamp closeTime = 0);

    void
    setCloseTime(Timestamp closeTime);

    Json::Value
    getJson() const;

    // ReadView

    Timestamp
    closeTime() const override;

    std::shared_ptr<Market const>
    market() const override;

    std::shared_ptr<PermanentAccount const>
    permanent() const override;

    std::shared_ptr<Reserve const>
    reserve(ReserveID const& id) const override;

    std::shared_ptr<UserAccount const>
    account(AccountID const& owner) const override;

    std::vector<AccountID>
    owners() const override;

    // ApplyView

    std::shared_ptr<Market>
    peekMarket() override;

    std::shared_ptr<PermanentAccount>
    peekPermanent() override;

    std::shared_ptr<Reserve>
    peekReserve(ReserveID const& id) override;

    std::shared_ptr<UserAccount>
    peekAccount(AccountID const& owner) override;

    void
    insert(std::shared_ptr<Market> const& market) override;

    void
    insert(std::shared_ptr<PermanentAccount> const& permanent) override;

    void
    insert(std::shared_ptr<Reserve> const& reserve) override;

    void
    insert(std::shared_ptr<UserAccount> const& account) override;
};

}  // namespace tierlend

#endif
