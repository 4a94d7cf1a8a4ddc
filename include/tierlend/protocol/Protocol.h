#ifndef TIERLEND_PROTOCOL_PROTOCOL_H_INCLUDED
#define TIERLEND_PROTOCOL_PROTOCOL_H_INCLUDED

#include <xrpl/basics/base_uint.h>
#include <xrpl/protocol/AccountID.h>

#include <cstddef>
#include <cstdint>

namespace tierlend {

using ripple::AccountID;
using ripple::uint256;

/** Identifies a reserve. Derived from the mint of the reserve asset. */
using ReserveID = uint256;

/** Seconds since the host epoch. */
using Timestamp = std::int64_t;

/** Rates and ratios are expressed in basis points; this is 100%. */
std::uint32_t constexpr bipsPerUnity = 10'000;

std::uint32_t constexpr percentPerUnity = 100;

std::int64_t constexpr secondsInDay = 24 * 60 * 60;

std::int64_t constexpr secondsInHour = 60 * 60;

std::int64_t constexpr secondsInYear = 365 * secondsInDay;

/** Fixed-point scale of the borrow and deposit indices; this is 1.0. */
std::uint64_t constexpr indexOne = 1'000'000'000;

/** Bounds of a staking commitment, in days. */
std::uint32_t constexpr minLockDurationDays = 1;
std::uint32_t constexpr maxLockDurationDays = 3650;
std::uint32_t constexpr defaultLockDurationDays = 1;

/** Capacity of each of an account's deposit and borrow maps. */
std::size_t constexpr maxPositionsPerAccount = 8;

/** Share of the aggregate epoch yield moved between tiers, in percent. */
std::uint32_t constexpr redistributionPoolPercent = 20;

}  // namespace tierlend

#endif
