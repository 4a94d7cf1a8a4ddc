#ifndef TIERLEND_LEDGER_SANDBOX_H_INCLUDED
#define TIERLEND_LEDGER_SANDBOX_H_INCLUDED

#include <tierlend/ledger/ReadView.h>

#include <map>
#include <memory>

namespace tierlend {

/** Discardable changes to an ApplyView.

    Reads fall through to the parent until an entry is peeked or inserted,
    at which point the sandbox holds its own copy. apply() writes the copies
    into the parent; destroying the sandbox without calling apply() leaves
    the parent untouched. Sandboxes nest, so a change made in a child is
    only kept if every enclosing sandbox is applied too.
*/
class Sandbox final : public ApplyView
{
    ApplyView& parent_;
    std::shared_ptr<Market> market_;
    std::shared_ptr<PermanentAccount> permanent_;
    std::map<ReserveID, std::shared_ptr<Reserve>> reserves_;
    std::map<AccountID, std::shared_ptr<UserAccount>> accounts_;

public:
    explicit Sandbox(ApplyView& parent);

    /** Push every modified entry to the parent. */
    void
    apply();

    /** Forget every modification. */
    void
    discard();

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
