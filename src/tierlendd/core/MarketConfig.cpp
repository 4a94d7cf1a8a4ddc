#include <tierlendd/core/MarketConfig.h>
//
#include <tierlend/protocol/Protocol.h>

#include <xrpl/beast/core/LexicalCast.h>

#include <boost/algorithm/string.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace tierlend {

using ripple::Unexpected;

ripple::IniFileSections
splitSections(std::string const& text, bool trim)
{
    ripple::IniFileSections sections{{"", {}}};
    auto* current = &sections[""];

    // CR, LF and CRLF all end a line. The empty pieces they leave behind
    // are blank lines.
    std::vector<std::string> lines;
    boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\r\n"));

    for (auto& line : lines)
    {
        if (trim)
            boost::algorithm::trim(line);

        if (line.empty() || line.front() == '#')
            continue;

        if (line.size() >= 2 && line.front() == '[' && line.back() == ']')
            current = &sections[line.substr(1, line.size() - 2)];
        else
            current->push_back(std::move(line));
    }

    return sections;
}

void
MarketConfig::loadFromString(std::string const& fileContents)
{
    build(splitSections(fileContents, true));
}

namespace {

// Reads `key` from `section` into `out`, leaving `out` alone when the key
// is absent. Returns a message when the value is not a number of type T
// within [lo, hi].
template <class T>
std::optional<std::string>
readValue(
    ripple::Section const& section,
    std::string const& key,
    T& out,
    T lo = std::numeric_limits<T>::min(),
    T hi = std::numeric_limits<T>::max())
{
    auto const text = section.get<std::string>(key);
    if (!text)
        return std::nullopt;

    T value{};
    if (!beast::lexicalCastChecked(value, *text))
        return "[" + section.name() + "] " + key + ": '" + *text +
            "' is not a valid number";

    if (value < lo || value > hi)
        return "[" + section.name() + "] " + key + ": " +
            std::to_string(value) + " is out of range [" + std::to_string(lo) +
            ", " + std::to_string(hi) + "]";

    out = value;
    return std::nullopt;
}

}  // namespace

ripple::Expected<MarketParameters, std::string>
MarketConfig::marketParameters() const
{
    MarketParameters params;
    auto& model = params.interestModel;

    auto const& rates = section(SECTION_INTEREST_MODEL);
    auto const& market = section(SECTION_MARKET);
    auto const& staking = section(SECTION_STAKING);

    std::uint32_t const bips = bipsPerUnity;

    for (auto const& error :
         {readValue(rates, "base_rate", model.baseRate),
          readValue(rates, "multiplier", model.multiplier),
          readValue(rates, "jump_multiplier", model.jumpMultiplier),
          readValue(rates, "kink", model.kink, 0u, bips),
          readValue(market, "reserve_factor", params.reserveFactor, 0u, bips),
          readValue(market, "max_users", params.maxUsers, 1u),
          readValue(
              market, "min_flash_loan_fee", params.minFlashLoanFee, 0u, bips),
          readValue(
              staking, "base_reward_rate", params.baseRewardRate, 0u, bips),
          readValue(staking, "stake_unit", params.stakeUnit, std::uint64_t{1})})
    {
        if (error)
            return Unexpected(*error);
    }

    return params;
}

}  // namespace tierlend
