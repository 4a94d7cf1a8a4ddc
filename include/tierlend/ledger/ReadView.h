#ifndef TIERLEND_LEDGER_READVIEW_H_INCLUDED
#define TIERLEND_LEDGER_READVIEW_H_INCLUDED

#include <tierlend/ledger/Entries.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace tierlend {

enum ApplyFlags : std::uint32_t {
    tapNONE = 0x00,

    // Applied inside another transaction, e.g. by a flash loan strategy.
    tapNESTED = 0x01,

    // Run every check but never keep the result.
    tapDRY_RUN = 0x02,
};

constexpr ApplyFlags
operator|(ApplyFlags const& lhs, ApplyFlags const& rhs)
{
    return static_cast<ApplyFlags>(
        static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
}

constexpr ApplyFlags
operator&(ApplyFlags const& lhs, ApplyFlags const& rhs)
{
    return static_cast<ApplyFlags>(
        static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
}

/** A read-only view of the market state.

    Lookups return nullptr when the entry does not exist.
*/
class ReadView
{
public:
    virtual ~ReadView() = default;

    ReadView() = default;
    ReadView(ReadView const&) = delete;
    ReadView&
    operator=(ReadView const&) = delete;

    /** The time operations applied against this view execute at. */
    virtual Timestamp
    closeTime() const = 0;

    virtual std::shared_ptr<Market const>
    market() const = 0;

    virtual std::shared_ptr<PermanentAccount const>
    permanent() const = 0;

    virtual std::shared_ptr<Reserve const>
    reserve(ReserveID const& id) const = 0;

    virtual std::shared_ptr<UserAccount const>
    account(AccountID const& owner) const = 0;

    /** Every account owner, in ascending AccountID order. */
    virtual std::vector<AccountID>
    owners() const = 0;
};

//------------------------------------------------------------------------------

/** A view that can be modified.

    peek returns a mutable entry that belongs to this view; changes made
    through it are visible to later reads of the same view. insert creates
    the entry or replaces the one with the same key.
*/
class ApplyView : public ReadView
{
public:
    virtual std::shared_ptr<Market>
    peekMarket() = 0;

    virtual std::shared_ptr<PermanentAccount>
    peekPermanent() = 0;

    virtual std::shared_ptr<Reserve>
    peekReserve(ReserveID const& id) = 0;

    virtual std::shared_ptr<UserAccount>
    peekAccount(AccountID const& owner) = 0;

    virtual void
    insert(std::shared_ptr<Market> const& market) = 0;

    virtual void
    insert(std::shared_ptr<PermanentAccount> const& permanent) = 0;

    virtual void
    insert(std::shared_ptr<Reserve> const& reserve) = 0;

    virtual void
    insert(std::shared_ptr<UserAccount> const& account) = 0;
};

}  // namespace tierlend

#endif
