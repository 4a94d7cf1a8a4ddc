#include <xrpl/beast/unit_test/suite.h>
//
#include <test/jtx.h>

#include <tierlendd/app/tx/detail/FlashLoan.h>

namespace tierlend {
namespace test {

class FlashLoan_test : public beast::unit_test::suite
{
    static std::uint64_t constexpr fee = 100'000'000;

    static TER
    repayAll(FlashLoanContext& loan)
    {
        return loan.repay(loan.due() - loan.repaid());
    }

    // A USD reserve holding 75 deposited by alice.
    static ReserveID
    setup(jtx::Env& env, jtx::Account const& alice)
    {
        using namespace jtx;
        Account const usd{"USD"};
        env(market::addReserve(env.authority, usd, 7500, 8000, 500));
        env(lend::deposit(alice, lend::reserve(usd), 75 * ONE));
        return lend::reserve(usd);
    }

    void
    testRepaid()
    {
        testcase("Repaid loan");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        auto const id = setup(env, alice);
        auto const interactions = env.account(alice)->interactions;

        bool ran = false;
        env(lend::flashLoan(
            alice, id, 10 * ONE, fee, [&](FlashLoanContext& loan) {
                ran = true;
                auto const reserve = loan.view().reserve(id);
                BEAST_EXPECT(reserve->flashLoanActive);
                BEAST_EXPECT(reserve->flashLoanOutstanding == 10 * ONE);
                BEAST_EXPECT(loan.due() == 10 * ONE + fee);
                BEAST_EXPECT(loan.borrower() == alice.id());

                // Repayment may come in pieces.
                if (auto const ter = loan.repay(5 * ONE))
                    return ter;
                BEAST_EXPECT(loan.repaid() == 5 * ONE);
                return repayAll(loan);
            }));
        BEAST_EXPECT(ran);
        BEAST_EXPECT(env.delivered() == 10 * ONE);

        // The fee stays in the reserve; nothing is borrowed.
        auto const reserve = env.reserve(id);
        BEAST_EXPECT(reserve->totalDeposits == 75'100'000'000);
        BEAST_EXPECT(reserve->totalBorrows == 0);
        BEAST_EXPECT(!reserve->flashLoanActive);
        BEAST_EXPECT(reserve->flashLoanOutstanding == 0);
        BEAST_EXPECT(reserve->borrowIndex == indexOne);
        BEAST_EXPECT(env.market()->totalDeposits == 75'100'000'000);
        BEAST_EXPECT(env.account(alice)->interactions == interactions + 1);

        // The fee is depositor yield: 75 * (1 + 0.1 / 75) at the index's
        // precision.
        BEAST_EXPECT(reserve->depositIndex == 1'001'333'333);

        // The whole reserve can be lent out at once.
        env(lend::flashLoan(alice, id, reserve->totalDeposits, 0, repayAll));
        BEAST_EXPECT(env.reserve(id)->depositIndex == 1'001'333'333);

        // alice withdraws her deposit together with the fee.
        env(lend::withdraw(alice, id, 75'099'999'976),
            ter(tecINSUFFICIENT_BALANCE));
        env(lend::withdraw(alice, id, 75'099'999'975));
        BEAST_EXPECT(env.delivered() == 75'099'999'975);
        BEAST_EXPECT(!env.account(alice)->deposits.contains(id));
    }

    void
    testNotRepaid()
    {
        testcase("Unpaid loans roll back");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        auto const id = setup(env, alice);
        auto const before = env.ledger().getJson();

        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [](FlashLoanContext& loan) { return loan.repay(10 * ONE); }),
            ter(tecFLASH_LOAN_NOT_REPAID));
        BEAST_EXPECT(env.ledger().getJson() == before);
        BEAST_EXPECT(!env.result().applied);

        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [](FlashLoanContext&) { return TER{tesSUCCESS}; }),
            ter(tecFLASH_LOAN_NOT_REPAID));

        // Returning more than is due is refused outright.
        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [](FlashLoanContext& loan) {
                    return loan.repay(loan.due() + 1);
                }),
            ter(temBAD_AMOUNT));

        // The strategy's own failure is the result.
        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [](FlashLoanContext& loan) {
                    if (auto const ter = repayAll(loan))
                        return ter;
                    return TER{tecINTERNAL};
                }),
            ter(tecINTERNAL));

        BEAST_EXPECT(env.ledger().getJson() == before);
        BEAST_EXPECT(!env.reserve(id)->flashLoanActive);
    }

    void
    testReentrancy()
    {
        testcase("Reentrancy");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        auto const id = setup(env, alice);

        env(lend::flashLoan(
            alice, id, 10 * ONE, fee, [&](FlashLoanContext& loan) {
                auto const inner =
                    loan.submit(lend::flashLoan(alice, id, ONE, 0, repayAll));
                BEAST_EXPECT(inner.ter == tecREENTRANT_FLASH_LOAN);
                BEAST_EXPECT(!inner.applied);
                return repayAll(loan);
            }));
        BEAST_EXPECT(env.reserve(id)->totalDeposits == 75'100'000'000);

        // A strategy that propagates the nested failure fails the loan.
        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [&](FlashLoanContext& loan) {
                    auto const inner = loan.submit(
                        lend::flashLoan(alice, id, ONE, 0, repayAll));
                    return inner.ter;
                }),
            ter(tecREENTRANT_FLASH_LOAN));
        BEAST_EXPECT(env.reserve(id)->totalDeposits == 75'100'000'000);
    }

    void
    testNested()
    {
        testcase("Nested transactions");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};
        auto const id = setup(env, alice);

        // Kept when the loan succeeds.
        env(lend::flashLoan(
            alice, id, 10 * ONE, fee, [&](FlashLoanContext& loan) {
                auto const deposit =
                    loan.submit(lend::deposit(alice, id, 5 * ONE));
                BEAST_EXPECT(deposit.ter == tesSUCCESS);
                BEAST_EXPECT(deposit.applied);
                BEAST_EXPECT(
                    loan.view().reserve(id)->totalDeposits == 80 * ONE);
                return repayAll(loan);
            }));
        BEAST_EXPECT(env.account(alice)->deposits.at(id).principal == 80 * ONE);
        BEAST_EXPECT(env.reserve(id)->totalDeposits == 80'100'000'000);

        // Discarded with it when it fails.
        env(lend::flashLoan(
                alice,
                id,
                10 * ONE,
                fee,
                [&](FlashLoanContext& loan) {
                    loan.submit(lend::deposit(alice, id, 5 * ONE));
                    return TER{tesSUCCESS};
                }),
            ter(tecFLASH_LOAN_NOT_REPAID));
        BEAST_EXPECT(env.account(alice)->deposits.at(id).principal == 80 * ONE);
        BEAST_EXPECT(env.reserve(id)->totalDeposits == 80'100'000'000);

        // Only the borrower's own transactions are accepted.
        env(lend::flashLoan(
            alice, id, 10 * ONE, fee, [&](FlashLoanContext& loan) {
                auto const other = loan.submit(lend::deposit(bob, id, ONE));
                BEAST_EXPECT(other.ter == tecNO_PERMISSION);
                BEAST_EXPECT(!other.applied);
                return repayAll(loan);
            }));
        BEAST_EXPECT(!env.account(bob));
    }

    void
    testMalformed()
    {
        testcase("Malformed");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        auto const id = setup(env, alice);

        env(lend::flashLoan(alice, id, 0, 0, repayAll), ter(temBAD_AMOUNT));
        env(lend::flashLoan(alice, id, ONE, ONE + 1, repayAll),
            ter(temBAD_FEE));

        auto noStrategy = lend::flashLoan(alice, id, ONE, 0, repayAll);
        noStrategy.strategy = nullptr;
        env(noStrategy, ter(temMALFORMED));

        auto noReserve = lend::flashLoan(alice, id, ONE, 0, repayAll);
        noReserve.reserve.reset();
        env(noReserve, ter(temMALFORMED));

        env(lend::flashLoan(
                alice, lend::reserve(Account("EUR")), ONE, 0, repayAll),
            ter(tecNO_ENTRY));
    }

    void
    testLiquidity()
    {
        testcase("Liquidity");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};
        Account const eur{"EUR"};
        auto const id = setup(env, alice);

        env(lend::flashLoan(alice, id, 75 * ONE + 1, 0, repayAll),
            ter(tecINSUFFICIENT_LIQUIDITY));

        // Borrowed funds are not available to flash loans.
        env(market::addReserve(env.authority, eur, 7500, 8000, 500));
        env(lend::deposit(bob, lend::reserve(eur), 100 * ONE));
        env(lend::borrow(bob, id, 50 * ONE));
        env(lend::flashLoan(alice, id, 25 * ONE + 1, 0, repayAll),
            ter(tecINSUFFICIENT_LIQUIDITY));
        env(lend::flashLoan(alice, id, 25 * ONE, 0, repayAll));
    }

    void
    testMinimumFee()
    {
        testcase("Minimum fee");
        using namespace jtx;

        MarketParameters params;
        params.minFlashLoanFee = 9;
        Env env(*this, params);
        Account const alice{"alice"};
        auto const id = setup(env, alice);

        // 0.09% of 10 is 0.009.
        env(lend::flashLoan(alice, id, 10 * ONE, 8'999'999, repayAll),
            ter(tecINSUFFICIENT_FEE));
        env(lend::flashLoan(alice, id, 10 * ONE, 9'000'000, repayAll));
        BEAST_EXPECT(env.reserve(id)->totalDeposits == 75'009'000'000);
    }

public:
    void
    run() override
    {
        testRepaid();
        testNotRepaid();
        testReentrancy();
        testNested();
        testMalformed();
        testLiquidity();
        testMinimumFee();
    }
};

BEAST_DEFINE_TESTSUITE(FlashLoan, app, tierlend);

}  // namespace test
}  // namespace tierlend
