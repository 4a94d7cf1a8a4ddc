#include <tierlend/protocol/TER.h>

#include <unordered_map>
#include <utility>

namespace tierlend {

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macro to reduce typos
#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(tecCLAIM,                   "Failure, the operation was rejected."),
        MAKE_ERROR(tecINSUFFICIENT_COLLATERAL, "Borrow value would exceed the loan-to-value limit of the collateral."),
        MAKE_ERROR(tecINSUFFICIENT_BALANCE,    "Amount exceeds the recorded position or would leave outstanding borrows uncovered."),
        MAKE_ERROR(tecNOT_LIQUIDATABLE,        "Position health factor is not below one."),
        MAKE_ERROR(tecARITHMETIC_OVERFLOW,     "A checked arithmetic operation would overflow."),
        MAKE_ERROR(tecNO_PERMISSION,           "No permission to perform requested operation."),
        MAKE_ERROR(tecREENTRANT_FLASH_LOAN,    "The reserve already has a flash loan in progress."),
        MAKE_ERROR(tecEXTERNAL_CALL_FAILED,    "An external liquidity or leverage provider returned an error."),
        MAKE_ERROR(tecINSUFFICIENT_LIQUIDITY,  "The reserve does not hold enough unborrowed funds."),
        MAKE_ERROR(tecNO_ENTRY,                "No matching entry found."),
        MAKE_ERROR(tecDUPLICATE,               "The entry already exists."),
        MAKE_ERROR(tecFLASH_LOAN_NOT_REPAID,   "The flash loan strategy did not return the principal plus fee."),
        MAKE_ERROR(tecINSUFFICIENT_FEE,        "The flash loan fee is below the market minimum."),
        MAKE_ERROR(tecMARKET_FULL,             "The market has reached its user capacity."),
        MAKE_ERROR(tecPOSITIONS_FULL,          "The account has no free position slot."),
        MAKE_ERROR(tecINVARIANT_FAILED,        "One or more invariants for the operation were not satisfied."),
        MAKE_ERROR(tecINTERNAL,                "An internal error has occurred during processing."),

        MAKE_ERROR(tefFAILURE,                 "Failed to apply."),
        MAKE_ERROR(tefBAD_LEDGER,              "Ledger in unexpected state."),
        MAKE_ERROR(tefBAD_CLOCK,               "Operation time precedes the last accrual time."),
        MAKE_ERROR(tefREENTRANT_SUBMIT,        "Submitted while another transaction is being applied."),

        MAKE_ERROR(temMALFORMED,               "Malformed operation."),
        MAKE_ERROR(temBAD_AMOUNT,              "Malformed: Bad amount."),
        MAKE_ERROR(temBAD_FEE,                 "Malformed: Bad fee."),
        MAKE_ERROR(temINVALID,                 "The operation is ill-formed."),
        MAKE_ERROR(temINVALID_PARAMETER,       "Malformed: A parameter is outside its permitted range."),
        MAKE_ERROR(temUNKNOWN,                 "The operation type is unknown."),

        MAKE_ERROR(tesSUCCESS,                 "The operation was applied."),
    };

    // clang-format on

#undef MAKE_ERROR

    return results;
}

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = transResults();
        std::unordered_map<std::string, TERUnderlyingType> byToken;
        byToken.reserve(byTer.size());
        for (auto const& r : byTer)
            byToken.emplace(r.second.first, r.first);
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return TER::fromInt(r->second);
}

}  // namespace tierlend
