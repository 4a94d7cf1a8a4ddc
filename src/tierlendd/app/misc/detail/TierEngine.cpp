#include <tierlendd/app/misc/TierEngine.h>
//
#include <tierlend/basics/CheckedMath.h>

#include <algorithm>
#include <array>
#include <utility>

namespace tierlend {

using ripple::Unexpected;

std::uint32_t
tierMultiplier(Tier tier)
{
    switch (tier)
    {
        case Tier::bronze:
            return 75;
        case Tier::silver:
            return 100;
        case Tier::gold:
            return 125;
        case Tier::diamond:
            return 150;
    }
    return 100;  // LCOV_EXCL_LINE
}

Tier
tierForScore(std::uint64_t loyaltyScore)
{
    if (loyaltyScore <= 100)
        return Tier::bronze;
    if (loyaltyScore <= 250)
        return Tier::silver;
    if (loyaltyScore <= 500)
        return Tier::gold;
    return Tier::diamond;
}

ripple::Expected<std::uint64_t, TER>
loyaltyScore(UserAccount const& account, std::uint64_t stakeUnit, Timestamp now)
{
    if (stakeUnit == 0)
        return Unexpected(tefBAD_LEDGER);  // LCOV_EXCL_LINE

    std::uint64_t const amountScore = account.stakeAmount / stakeUnit;
    std::uint64_t const timeScore = now > account.stakeStartTime
        ? static_cast<std::uint64_t>(now - account.stakeStartTime) /
            secondsInDay
        : 0;
    std::uint64_t const frequencyScore = account.interactions;
    std::uint64_t const rewardsScore = account.totalRewardsReceived / stakeUnit;

    auto const a = checkedMul(amountScore, 2);
    auto const t = checkedMul(timeScore, 3);
    auto const r = checkedMul(rewardsScore, 2);
    if (!a || !t || !r)
        return Unexpected(tecARITHMETIC_OVERFLOW);

    auto score = checkedAdd(*a, *t);
    if (score)
        score = checkedAdd(*score, frequencyScore);
    if (score)
        score = checkedAdd(*score, *r);
    if (!score)
        return Unexpected(tecARITHMETIC_OVERFLOW);

    return *score;
}

ripple::Expected<Tier, TER>
evaluateTier(UserAccount const& account, std::uint64_t stakeUnit, Timestamp now)
{
    auto const score = loyaltyScore(account, stakeUnit, now);
    if (!score)
        return Unexpected(score.error());
    return tierForScore(*score);
}

//------------------------------------------------------------------------------

namespace {

struct TierWeight
{
    Tier tier;
    std::uint32_t weight;
};

std::array<TierWeight, 2> constexpr debitWeights{
    {{Tier::bronze, 40}, {Tier::silver, 30}}};

std::array<TierWeight, 2> constexpr creditWeights{
    {{Tier::gold, 20}, {Tier::diamond, 10}}};

using Members = std::vector<StakerYield const*>;

// Split `amount` across members pro rata by yield. When `capped`, no member
// receives more than its yield; the caller guarantees amount <= groupYield.
TER
splitProRata(
    Members const& members,
    std::uint64_t amount,
    std::uint64_t groupYield,
    bool capped,
    std::map<AccountID, std::uint64_t>& out)
{
    if (amount == 0 || groupYield == 0)
        return tesSUCCESS;

    std::vector<std::uint64_t> shares;
    shares.reserve(members.size());
    std::uint64_t assigned = 0;
    for (auto const* member : members)
    {
        auto const share = checkedMulDiv(amount, member->yield, groupYield);
        if (!share)
            return tecARITHMETIC_OVERFLOW;
        shares.push_back(*share);
        assigned += *share;
    }

    // Fewer units remain than members with a non-zero yield, and each of
    // those has room below its cap unless the whole yield is taken.
    auto remainder = amount - assigned;
    for (std::size_t i = 0; i < members.size() && remainder != 0; ++i)
    {
        if (members[i]->yield == 0)
            continue;
        if (capped && shares[i] >= members[i]->yield)
            continue;
        ++shares[i];
        --remainder;
    }

    if (remainder != 0)
        return tecINTERNAL;  // LCOV_EXCL_LINE

    for (std::size_t i = 0; i < members.size(); ++i)
    {
        if (shares[i] != 0)
            out[members[i]->account] += shares[i];
    }

    return tesSUCCESS;
}

}  // namespace

ripple::Expected<Redistribution, TER>
computeRedistribution(std::vector<StakerYield> const& stakers)
{
    Redistribution result;

    std::array<Members, 4> members;
    std::array<std::uint64_t, 4> tierYield{};
    std::uint64_t aggregate = 0;

    std::vector<StakerYield const*> ordered;
    ordered.reserve(stakers.size());
    for (auto const& staker : stakers)
        ordered.push_back(&staker);
    std::sort(ordered.begin(), ordered.end(), [](auto const* a, auto const* b) {
        return a->account < b->account;
    });

    for (auto const* staker : ordered)
    {
        auto const index = static_cast<std::size_t>(staker->tier);
        members[index].push_back(staker);

        auto const group = checkedAdd(tierYield[index], staker->yield);
        auto const total = checkedAdd(aggregate, staker->baseYield);
        if (!group || !total)
            return Unexpected(tecARITHMETIC_OVERFLOW);
        tierYield[index] = *group;
        aggregate = *total;
    }

    auto const pool =
        checkedMulDiv(aggregate, redistributionPoolPercent, percentPerUnity);
    if (!pool)
        return Unexpected(tecARITHMETIC_OVERFLOW);
    result.pool = *pool;

    auto const presentWeight = [&](auto const& weights) {
        std::uint64_t sum = 0;
        for (auto const& w : weights)
        {
            if (tierYield[static_cast<std::size_t>(w.tier)] != 0)
                sum += w.weight;
        }
        return sum;
    };

    auto const debitWeight = presentWeight(debitWeights);
    auto const creditWeight = presentWeight(creditWeights);
    if (result.pool == 0 || debitWeight == 0 || creditWeight == 0)
        return result;

    std::uint64_t debited = 0;
    for (auto const& w : debitWeights)
    {
        auto const index = static_cast<std::size_t>(w.tier);
        if (tierYield[index] == 0)
            continue;

        auto const target = checkedMulDiv(result.pool, w.weight, debitWeight);
        if (!target)
            return Unexpected(tecARITHMETIC_OVERFLOW);
        auto const amount = std::min(*target, tierYield[index]);

        if (auto const ter = splitProRata(
                members[index], amount, tierYield[index], true, result.debits))
            return Unexpected(ter);
        debited += amount;
    }

    // The first credit tier taking part absorbs the rounding remainder.
    std::uint64_t credited = 0;
    std::vector<std::pair<std::size_t, std::uint64_t>> creditShares;
    for (auto const& w : creditWeights)
    {
        auto const index = static_cast<std::size_t>(w.tier);
        if (tierYield[index] == 0)
            continue;

        auto const share = checkedMulDiv(debited, w.weight, creditWeight);
        if (!share)
            return Unexpected(tecARITHMETIC_OVERFLOW);
        creditShares.emplace_back(index, *share);
        credited += *share;
    }
    creditShares.front().second += debited - credited;

    for (auto const& [index, amount] : creditShares)
    {
        if (auto const ter = splitProRata(
                members[index], amount, tierYield[index], false, result.credits))
            return Unexpected(ter);
    }

    result.transferred = debited;
    return result;
}

}  // namespace tierlend
