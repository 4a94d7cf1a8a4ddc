#include <xrpl/beast/unit_test/suite.h>
//
#include <test/jtx.h>

#include <tierlendd/app/misc/StakingHelpers.h>

#include <limits>

namespace tierlend {
namespace test {

class Staking_test : public beast::unit_test::suite
{
    void
    testStake()
    {
        testcase("Stake");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};

        env(stake::set(alice, 100 * ONE, 30));

        auto const a = env.account(alice);
        if (!BEAST_EXPECT(a))
            return;
        BEAST_EXPECT(a->stakeAmount == 100 * ONE);
        BEAST_EXPECT(a->stakeStartTime == env.now());
        BEAST_EXPECT(a->lockDurationDays == 30);
        BEAST_EXPECT(a->intendedEndTime == env.now() + 30 * secondsInDay);
        BEAST_EXPECT(a->rewardsAccruedThrough == env.now());
        BEAST_EXPECT(a->accumulatedRewards == 0);
        BEAST_EXPECT(a->liquidDerivativeAmount == 100 * ONE);
        BEAST_EXPECT(!a->leveragePosition);
        BEAST_EXPECT(a->rewardPreferences == RewardPreferences{});
        BEAST_EXPECT(a->interactions == 1);
        // 2 * 100 units
        BEAST_EXPECT(a->tier == Tier::silver);

        BEAST_EXPECT(env.converter().converts == 1);
        BEAST_EXPECT(env.converter().outstanding == 100 * ONE);

        // Staked funds never reach the lending totals.
        BEAST_EXPECT(env.market()->totalStaked == 100 * ONE);
        BEAST_EXPECT(env.market()->totalDeposits == 0);
        BEAST_EXPECT(env.market()->currentUsers == 1);

        // One day by default.
        env(stake::set(bob, 10 * ONE));
        auto const b = env.account(bob);
        BEAST_EXPECT(b->lockDurationDays == defaultLockDurationDays);
        BEAST_EXPECT(b->intendedEndTime == env.now() + secondsInDay);
        BEAST_EXPECT(b->tier == Tier::bronze);
        BEAST_EXPECT(env.market()->totalStaked == 110 * ONE);
    }

    void
    testInvalid()
    {
        testcase("Invalid stakes");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};

        env(stake::set(alice, 0), ter(temBAD_AMOUNT));
        env(stake::set(alice, ONE, 0), ter(temINVALID_PARAMETER));
        env(stake::set(alice, ONE, maxLockDurationDays + 1),
            ter(temINVALID_PARAMETER));
        BEAST_EXPECT(!env.account(alice));
        BEAST_EXPECT(env.converter().converts == 0);

        env(stake::set(alice, ONE, maxLockDurationDays));
        env(stake::set(alice, ONE), ter(tecDUPLICATE));
        BEAST_EXPECT(env.account(alice)->stakeAmount == ONE);

        // Nothing to withdraw or distribute without a stake.
        Account const bob{"bob"};
        env(stake::withdraw(bob), ter(tecNO_ENTRY));
        env(stake::distribute(bob), ter(tecNO_ENTRY));

        Account const usd{"USD"};
        env(market::addReserve(env.authority, usd, 7500, 8000, 500));
        env(lend::deposit(bob, lend::reserve(usd), ONE));
        env(stake::withdraw(bob), ter(tecNO_ENTRY));
    }

    void
    testProviderFailures()
    {
        testcase("Provider failures");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};

        env.converter().failConvert = true;
        env(stake::set(alice, 100 * ONE), ter(tecEXTERNAL_CALL_FAILED));
        BEAST_EXPECT(!env.account(alice));
        BEAST_EXPECT(env.market()->totalStaked == 0);
        env.converter().failConvert = false;

        env.leverage().failOpen = true;
        env(stake::set(alice, 100 * ONE, 1, true),
            ter(tecEXTERNAL_CALL_FAILED));
        BEAST_EXPECT(!env.account(alice));
        BEAST_EXPECT(env.market()->totalStaked == 0);
        env.leverage().failOpen = false;

        env(stake::set(alice, 100 * ONE));
        env.close(secondsInDay);

        auto const before = env.ledger().getJson();
        env.converter().failRedeem = true;
        env(stake::withdraw(alice), ter(tecEXTERNAL_CALL_FAILED));
        BEAST_EXPECT(env.ledger().getJson() == before);
        env.converter().failRedeem = false;

        env(stake::withdraw(alice));
        BEAST_EXPECT(!env.account(alice)->hasStake());
    }

    void
    testLeverage()
    {
        testcase("Leverage");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};

        env(stake::set(alice, 100 * ONE, 1, true));

        auto const a = env.account(alice);
        BEAST_EXPECT(a->leveragePosition == "position-1");
        BEAST_EXPECT(a->liquidDerivativeAmount == 0);
        BEAST_EXPECT(env.leverage().positions.at("position-1") == 100 * ONE);

        env.close(secondsInDay);

        env.leverage().failClose = true;
        env(stake::withdraw(alice), ter(tecEXTERNAL_CALL_FAILED));
        BEAST_EXPECT(env.account(alice)->hasStake());
        env.leverage().failClose = false;

        env(stake::withdraw(alice));
        BEAST_EXPECT(env.leverage().positions.empty());
        BEAST_EXPECT(env.converter().outstanding == 0);

        // Silver for one day: 100 * 17% / 365
        BEAST_EXPECT(env.delivered() == 100 * ONE + 46'575'342);
        auto const after = env.account(alice);
        BEAST_EXPECT(!after->leveragePosition);
        BEAST_EXPECT(after->liquidDerivativeAmount == 0);
    }

    void
    testOnTimeWithdrawal()
    {
        testcase("On-time withdrawal");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};

        env(stake::set(alice, 10 * ONE));
        env.close(secondsInDay);
        env(stake::withdraw(alice));

        // Bronze for one day: 10 * 17% * 75% / 365
        std::uint64_t const reward = 3'493'150;
        BEAST_EXPECT(env.delivered() == 10 * ONE + reward);

        auto const a = env.account(alice);
        BEAST_EXPECT(!a->hasStake());
        BEAST_EXPECT(a->accumulatedRewards == 0);
        BEAST_EXPECT(a->stakeStartTime == 0);
        BEAST_EXPECT(a->intendedEndTime == 0);
        BEAST_EXPECT(!a->rewardPreferences);
        BEAST_EXPECT(a->totalRewardsReceived == reward);
        BEAST_EXPECT(a->lastPayoutTime == env.now());

        BEAST_EXPECT(env.market()->totalStaked == 0);
        BEAST_EXPECT(env.market()->totalRewardsPaid == reward);
        BEAST_EXPECT(env.permanent()->totalPenalties == 0);

        // A closed stake can be opened again.
        env(stake::set(alice, 10 * ONE));
        BEAST_EXPECT(env.account(alice)->hasStake());
    }

    void
    testEarlyExit()
    {
        testcase("Early exit");
        using namespace jtx;

        Env env(*this);
        Account const alice{"alice"};
        Account const bob{"bob"};
        Account const carol{"carol"};

        // The penalty is what the whole commitment would earn, here a year
        // at Bronze: 10 * 17% * 75%.
        env(stake::set(alice, 10 * ONE, 365));
        env(stake::withdraw(alice));
        BEAST_EXPECT(env.delivered() == 10 * ONE - 1'275'000'000);
        BEAST_EXPECT(env.permanent()->totalPenalties == 1'275'000'000);
        BEAST_EXPECT(env.permanent()->lastCredit == env.now());
        BEAST_EXPECT(env.market()->totalStaked == 0);

        // Time served does not reduce it, and pending rewards are forfeit.
        // After 30 days the score is 20 + 90 + 1, which is Silver.
        env(stake::set(bob, 10 * ONE, 365));
        env.close(30 * secondsInDay);
        env(stake::withdraw(bob));
        BEAST_EXPECT(env.delivered() == 10 * ONE - 1'700'000'000);
        BEAST_EXPECT(env.account(bob)->totalRewardsReceived == 0);
        BEAST_EXPECT(env.market()->totalRewardsPaid == 0);
        BEAST_EXPECT(
            env.permanent()->totalPenalties == 1'275'000'000 + 1'700'000'000);

        // A penalty larger than the stake takes all of it.
        env(stake::set(carol, 10 * ONE, maxLockDurationDays));
        env(stake::withdraw(carol));
        BEAST_EXPECT(env.delivered() == 0);
        BEAST_EXPECT(
            env.permanent()->totalPenalties ==
            1'275'000'000 + 1'700'000'000 + 10 * ONE);
    }

    void
    testRewards()
    {
        testcase("Reward arithmetic");

        std::uint64_t constexpr ONE = jtx::ONE;

        BEAST_EXPECT(*stakingReward(0, 1700, secondsInYear, Tier::gold) == 0);
        BEAST_EXPECT(*stakingReward(100 * ONE, 1700, 0, Tier::gold) == 0);
        BEAST_EXPECT(
            *stakingReward(100 * ONE, 1700, secondsInYear, Tier::silver) ==
            17 * ONE);
        BEAST_EXPECT(
            *stakingReward(100 * ONE, 1700, secondsInYear, Tier::diamond) ==
            25'500'000'000);
        BEAST_EXPECT(
            *stakingReward(100 * ONE, 1700, secondsInYear, Tier::bronze) ==
            12'750'000'000);

        auto const overflow = stakingReward(
            std::numeric_limits<std::uint64_t>::max(),
            1700,
            secondsInYear * 100,
            Tier::diamond);
        BEAST_EXPECT(!overflow && overflow.error() == tecARITHMETIC_OVERFLOW);

        UserAccount account;
        account.stakeAmount = 100 * ONE;
        account.stakeStartTime = 1'000;
        account.rewardsAccruedThrough = 1'000;
        account.intendedEndTime = 1'000 + secondsInYear;
        account.tier = Tier::silver;

        BEAST_EXPECT(isEarlyExit(account, 1'000));
        BEAST_EXPECT(!isEarlyExit(account, 1'000 + secondsInYear));
        BEAST_EXPECT(*earlyExitPenalty(account, 1700) == 17 * ONE);

        std::uint64_t accrued = 0;
        BEAST_EXPECT(
            accrueStakingRewards(account, 1700, 999, accrued) == tefBAD_CLOCK);
        BEAST_EXPECT(
            accrueStakingRewards(
                account, 1700, 1'000 + secondsInYear / 2, accrued) ==
            tesSUCCESS);
        BEAST_EXPECT(accrued == 8'500'000'000);
        BEAST_EXPECT(account.accumulatedRewards == 8'500'000'000);
        BEAST_EXPECT(
            accrueStakingRewards(
                account, 1700, 1'000 + secondsInYear / 2, accrued) ==
            tesSUCCESS);
        BEAST_EXPECT(accrued == 0);
        BEAST_EXPECT(account.accumulatedRewards == 8'500'000'000);

        BEAST_EXPECT(batchCadence(BatchFrequency::instant) == 0);
        BEAST_EXPECT(batchCadence(BatchFrequency::hourly) == secondsInHour);
        BEAST_EXPECT(batchCadence(BatchFrequency::daily) == secondsInDay);
    }

public:
    void
    run() override
    {
        testStake();
        testInvalid();
        testProviderFailures();
        testLeverage();
        testOnTimeWithdrawal();
        testEarlyExit();
        testRewards();
    }
};

BEAST_DEFINE_TESTSUITE(Staking, app, tierlend);

}  // namespace test
}  // namespace tierlend
