#include <xrpl/beast/unit_test/suite.h>
//
#include <test/jtx.h>

#include <tierlendd/app/tx/detail/InvariantCheck.h>

#include <tierlend/ledger/OpenLedger.h>

namespace tierlend {
namespace test {

class Invariants_test : public beast::unit_test::suite
{
    beast::Journal const j{beast::Journal::getNullSink()};

    // A ledger with one reserve whose totals agree with the market.
    static std::unique_ptr<OpenLedger>
    makeLedger(std::uint64_t deposits, std::uint64_t borrows)
    {
        auto ledger = std::make_unique<OpenLedger>(jtx::Env::startTime);

        auto reserve = std::make_shared<Reserve>();
        reserve->id = jtx::lend::reserve(jtx::Account("USD"));
        reserve->totalDeposits = deposits;
        reserve->totalBorrows = borrows;
        reserve->lastAccrualTime = jtx::Env::startTime;

        auto market = std::make_shared<Market>();
        market->totalDeposits = deposits;
        market->totalBorrows = borrows;
        market->reserves.push_back(reserve->id);

        ledger->insert(market);
        ledger->insert(std::make_shared<PermanentAccount>());
        ledger->insert(reserve);
        return ledger;
    }

    void
    testCheckers()
    {
        testcase("Checkers");
        using namespace jtx;

        Transaction const tx{};
        auto const id = lend::reserve(Account("USD"));

        auto const before = makeLedger(100, 50);
        {
            auto const after = makeLedger(100, 50);
            BEAST_EXPECT(
                checkInvariants(*before, *after, tx, tapNONE, j) ==
                tesSUCCESS);
        }
        {
            auto const after = makeLedger(100, 101);
            BEAST_EXPECT(
                !ReserveSolvency{}.finalize(*before, *after, tx, tapNONE, j));
            BEAST_EXPECT(
                checkInvariants(*before, *after, tx, tapNONE, j) ==
                tecINVARIANT_FAILED);
        }
        {
            auto const after = makeLedger(100, 50);
            after->peekMarket()->totalDeposits = 99;
            BEAST_EXPECT(!MarketTotalsMatch{}.finalize(
                *before, *after, tx, tapNONE, j));
        }
        {
            auto const after = makeLedger(100, 50);
            after->peekMarket()->reserves.push_back(
                lend::reserve(Account("EUR")));
            BEAST_EXPECT(
                !ReserveSolvency{}.finalize(*before, *after, tx, tapNONE, j));
        }
        {
            auto const after = makeLedger(100, 50);
            before->peekReserve(id)->borrowIndex = indexOne + 1;
            BEAST_EXPECT(!IndicesNeverDecrease{}.finalize(
                *before, *after, tx, tapNONE, j));
            before->peekReserve(id)->borrowIndex = indexOne;

            after->peekReserve(id)->lastAccrualTime = Env::startTime - 1;
            BEAST_EXPECT(!IndicesNeverDecrease{}.finalize(
                *before, *after, tx, tapNONE, j));
        }
        {
            auto const after = makeLedger(100, 50);
            after->peekReserve(id)->flashLoanActive = true;
            BEAST_EXPECT(!FlashLoanSettled{}.finalize(
                *before, *after, tx, tapNONE, j));
            // Outstanding loans are expected while a nested transaction runs.
            BEAST_EXPECT(FlashLoanSettled{}.finalize(
                *before, *after, tx, tapNESTED, j));
        }
        {
            auto const after = makeLedger(100, 50);
            before->peekPermanent()->totalPenalties = 10;
            after->peekPermanent()->totalPenalties = 9;
            BEAST_EXPECT(!PermanentAccountOnlyGrows{}.finalize(
                *before, *after, tx, tapNONE, j));
        }
    }

    void
    testFailedInvariantRollsBack()
    {
        testcase("Failed invariant rolls back");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        Account const usd{"USD"};
        env(market::addReserve(env.authority, usd, 7500, 8000, 500));
        env(lend::deposit(alice, lend::reserve(usd), 10 * ONE));

        // Corrupt the committed state behind the engine's back.
        env.ledger().peekMarket()->totalDeposits += 1;
        auto const before = env.ledger().getJson();

        env(lend::deposit(alice, lend::reserve(usd), ONE),
            ter(tecINVARIANT_FAILED));
        env(stake::set(alice, 10 * ONE), ter(tecINVARIANT_FAILED));
        BEAST_EXPECT(env.ledger().getJson() == before);
        BEAST_EXPECT(!env.result().applied);

        env.ledger().peekMarket()->totalDeposits -= 1;
        env(lend::deposit(alice, lend::reserve(usd), ONE));
    }

public:
    void
    run() override
    {
        testCheckers();
        testFailedInvariantRollsBack();
    }
};

BEAST_DEFINE_TESTSUITE(Invariants, app, tierlend);

}  // namespace test
}  // namespace tierlend
