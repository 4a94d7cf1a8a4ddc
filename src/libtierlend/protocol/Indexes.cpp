#include <tierlend/protocol/Indexes.h>

#include <xrpl/protocol/digest.h>

namespace tierlend {

ReserveID
reserveIndex(AccountID const& mint)
{
    return ripple::sha512Half(
        static_cast<std::uint16_t>(LedgerNameSpace::reserve), mint);
}

}  // namespace tierlend
