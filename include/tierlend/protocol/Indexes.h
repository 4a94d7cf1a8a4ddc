#ifndef TIERLEND_PROTOCOL_INDEXES_H_INCLUDED
#define TIERLEND_PROTOCOL_INDEXES_H_INCLUDED

#include <tierlend/protocol/Protocol.h>

#include <cstdint>

namespace tierlend {

/** Namespace prefixes mixed into every derived identifier. */
enum class LedgerNameSpace : std::uint16_t {
    reserve = 'r',
};

/** The identifier of the reserve holding the asset issued as `mint`.

    Two ReserveSet transactions naming the same mint derive the same id, so
    a market never carries two reserves for one asset.
*/
ReserveID
reserveIndex(AccountID const& mint);

}  // namespace tierlend

#endif
