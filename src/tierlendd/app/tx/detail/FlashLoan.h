#ifndef TIERLEND_APP_TX_FLASHLOAN_H_INCLUDED
#define TIERLEND_APP_TX_FLASHLOAN_H_INCLUDED

#include <tierlendd/app/tx/applySteps.h>
#include <tierlendd/app/tx/detail/Transactor.h>

#include <cstdint>

namespace tierlend {

/** What a flash loan strategy can do while the loan is outstanding.

    Transactions submitted through the context are applied inside the flash
    loan's own sandbox, so they are kept only if the loan itself succeeds.
    They must be signed by the borrower of the flash loan.
*/
class FlashLoanContext
{
    ApplyContext& ctx_;
    ReserveID const reserve_;
    std::uint64_t const amount_;
    std::uint64_t const fee_;
    std::uint64_t repaid_ = 0;

public:
    FlashLoanContext(
        ApplyContext& ctx,
        ReserveID const& reserve,
        std::uint64_t amount,
        std::uint64_t fee);

    FlashLoanContext(FlashLoanContext const&) = delete;
    FlashLoanContext&
    operator=(FlashLoanContext const&) = delete;

    ReserveID const&
    reserve() const
    {
        return reserve_;
    }

    std::uint64_t
    amount() const
    {
        return amount_;
    }

    std::uint64_t
    fee() const
    {
        return fee_;
    }

    /** Principal plus fee. */
    std::uint64_t
    due() const
    {
        return amount_ + fee_;
    }

    std::uint64_t
    repaid() const
    {
        return repaid_;
    }

    /** The state as the strategy currently sees it. */
    ReadView const&
    view() const
    {
        return ctx_.view();
    }

    AccountID const&
    borrower() const
    {
        return ctx_.tx.account;
    }

    /** Apply a transaction as part of the flash loan. */
    ApplyResult
    submit(Transaction const& tx);

    /** Return funds to the reserve. Fails with temBAD_AMOUNT if the total
        returned would exceed what is due.
    */
    TER
    repay(std::uint64_t amount);
};

class FlashLoan : public Transactor
{
public:
    explicit FlashLoan(ApplyContext& ctx) : Transactor(ctx)
    {
    }

    static NotTEC
    preflight(PreflightContext const& ctx);

    static TER
    preclaim(PreclaimContext const& ctx);

    TER
    doApply() override;
};

}  // namespace tierlend

#endif
