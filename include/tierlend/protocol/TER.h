#ifndef TIERLEND_PROTOCOL_TER_H_INCLUDED
#define TIERLEND_PROTOCOL_TER_H_INCLUDED

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace tierlend {

using TERUnderlyingType = int;

//------------------------------------------------------------------------------

enum TEMcodes : TERUnderlyingType {
    // Note: Range is stable.
    // Exact numbers are used in test vectors. Don't renumber.
    //
    // -299 .. -200: M Malformed (bad signature)
    //
    // The transaction cannot be applied in any ledger state.

    temMALFORMED = -299,

    temBAD_AMOUNT,
    temBAD_FEE,
    temINVALID,
    temINVALID_PARAMETER,
    temUNKNOWN,
};

//------------------------------------------------------------------------------

enum TEFcodes : TERUnderlyingType {
    // -199 .. -100: F
    //    Failure (ledger is inconsistent, the clock moved backwards, or the
    //    host was re-entered)
    //
    // The transaction is never applied and the ledger is left untouched.

    tefFAILURE = -199,
    tefBAD_LEDGER,
    tefBAD_CLOCK,
    tefREENTRANT_SUBMIT,
};

//------------------------------------------------------------------------------

enum TEScodes : TERUnderlyingType {
    // 0: S Success (success)
    tesSUCCESS = 0
};

//------------------------------------------------------------------------------

enum TECcodes : TERUnderlyingType {
    // 100 .. 255 C
    //   Claimed failure.
    //
    // The transaction was well formed but an invariant of the market rejected
    // it. None of the mutations it performed are kept.

    tecCLAIM = 100,
    tecINSUFFICIENT_COLLATERAL = 101,
    tecINSUFFICIENT_BALANCE = 102,
    tecNOT_LIQUIDATABLE = 103,
    tecARITHMETIC_OVERFLOW = 104,
    tecNO_PERMISSION = 105,
    tecREENTRANT_FLASH_LOAN = 106,
    tecEXTERNAL_CALL_FAILED = 107,
    tecINSUFFICIENT_LIQUIDITY = 108,
    tecNO_ENTRY = 109,
    tecDUPLICATE = 110,
    tecFLASH_LOAN_NOT_REPAID = 111,
    tecINSUFFICIENT_FEE = 112,
    tecMARKET_FULL = 113,
    tecPOSITIONS_FULL = 114,
    tecINVARIANT_FAILED = 115,
    tecINTERNAL = 116,
};

//------------------------------------------------------------------------------

/** A result code from one of the classes above.

    Converts to `true` when the code is anything but tesSUCCESS so that
    helpers can be chained with

        if (auto const ter = step())
            return ter;
*/
class TER
{
    TERUnderlyingType code_;

    constexpr explicit TER(TERUnderlyingType code, int) : code_(code)
    {
    }

public:
    constexpr TER() : code_(tesSUCCESS)
    {
    }

    constexpr TER(TEMcodes code) : code_(code)
    {
    }

    constexpr TER(TEFcodes code) : code_(code)
    {
    }

    constexpr TER(TEScodes code) : code_(code)
    {
    }

    constexpr TER(TECcodes code) : code_(code)
    {
    }

    static constexpr TER
    fromInt(TERUnderlyingType from)
    {
        return TER(from, 0);
    }

    constexpr TERUnderlyingType
    value() const
    {
        return code_;
    }

    explicit constexpr
    operator bool() const
    {
        return code_ != tesSUCCESS;
    }

    friend constexpr bool
    operator==(TER const& lhs, TER const& rhs)
    {
        return lhs.code_ == rhs.code_;
    }
};

// preflight only ever produces malformed or success codes.
using NotTEC = TER;

inline constexpr TERUnderlyingType
TERtoInt(TER v)
{
    return v.value();
}

inline bool
isTemMalformed(TER x)
{
    return (x.value() >= temMALFORMED && x.value() < tefFAILURE);
}

inline bool
isTefFailure(TER x)
{
    return (x.value() >= tefFAILURE && x.value() < tesSUCCESS);
}

inline bool
isTesSuccess(TER x)
{
    return (x.value() == tesSUCCESS);
}

inline bool
isTecClaim(TER x)
{
    return (x.value() >= tecCLAIM);
}

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

inline std::ostream&
operator<<(std::ostream& os, TER const& ter)
{
    return os << transToken(ter);
}

}  // namespace tierlend

#endif
