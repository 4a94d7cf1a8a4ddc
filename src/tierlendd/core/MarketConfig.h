#ifndef TIERLEND_CORE_MARKETCONFIG_H_INCLUDED
#define TIERLEND_CORE_MARKETCONFIG_H_INCLUDED

#include <tierlend/protocol/MarketTypes.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/basics/Expected.h>

#include <string>

namespace tierlend {

// Section names of the market configuration file.
char const* const SECTION_INTEREST_MODEL = "interest_model";
char const* const SECTION_MARKET = "market";
char const* const SECTION_STAKING = "staking";

/** Split ini text into its sections.

    Blank lines and lines starting with '#' are dropped. Lines before the
    first section header land in the unnamed section "". A repeated header
    appends to the section already read. With trim set, lines lose their
    surrounding whitespace.
*/
ripple::IniFileSections
splitSections(std::string const& text, bool trim);

/** Market parameters read from an ini style file:

    @code
    [interest_model]
    base_rate=500
    multiplier=2000
    jump_multiplier=5000
    kink=8000

    [market]
    reserve_factor=1000
    max_users=10000
    min_flash_loan_fee=9

    [staking]
    base_reward_rate=1700
    stake_unit=1000000000
    @endcode

    Every key is optional and falls back to the default parameters.
    Unknown keys and sections are ignored.
*/
class MarketConfig : public ripple::BasicConfig
{
public:
    MarketConfig() = default;

    void
    loadFromString(std::string const& fileContents);

    /** The configured parameters, or a message naming the offending key. */
    ripple::Expected<MarketParameters, std::string>
    marketParameters() const;
};

}  // namespace tierlend

#endif
