#include <xrpl/beast/unit_test/suite.h>
//
#include <tierlendd/core/MarketConfig.h>

#include <string>

namespace tierlend {
namespace test {

class MarketConfig_test : public beast::unit_test::suite
{
    void
    testSplitSections()
    {
        testcase("Split sections");

        auto const sections = splitSections(
            "orphan=1\r\n"
            "# comment\r\n"
            "\r\n"
            "[market]\r"
            "  reserve_factor = 500  \n"
            "[empty]\n"
            "[market]\n"
            "max_users=3\n",
            true);

        BEAST_EXPECT(sections.size() == 3);
        BEAST_EXPECT(sections.at("").size() == 1);
        BEAST_EXPECT(sections.at("empty").empty());

        auto const& market = sections.at("market");
        if (BEAST_EXPECT(market.size() == 2))
        {
            BEAST_EXPECT(market[0] == "reserve_factor = 500");
            BEAST_EXPECT(market[1] == "max_users=3");
        }

        auto const untrimmed = splitSections("[a]\n  x=1\n", false);
        BEAST_EXPECT(untrimmed.at("a").front() == "  x=1");

        // A lone bracket is a value, and the last line needs no newline.
        auto const tail = splitSections("[b]\n[\ny=2", true);
        if (BEAST_EXPECT(tail.at("b").size() == 2))
        {
            BEAST_EXPECT(tail.at("b")[0] == "[");
            BEAST_EXPECT(tail.at("b")[1] == "y=2");
        }
    }

    void
    testDefaults()
    {
        testcase("Defaults");

        MarketConfig config;
        auto const params = config.marketParameters();
        BEAST_EXPECT(params && *params == MarketParameters{});

        // Unknown keys and sections change nothing.
        config.loadFromString(
            "[rpc]\n"
            "port=5005\n"
            "[market]\n"
            "colour=blue\n");
        BEAST_EXPECT(config.exists("rpc"));
        auto const same = config.marketParameters();
        BEAST_EXPECT(same && *same == MarketParameters{});
    }

    void
    testValues()
    {
        testcase("Values");

        MarketConfig config;
        config.loadFromString(
            "# lending market\n"
            "[interest_model]\n"
            "base_rate=200\n"
            "multiplier=1000\n"
            "jump_multiplier=8000\n"
            "kink=9000\n"
            "\n"
            "[market]\n"
            "reserve_factor=1500\n"
            "max_users=250\n"
            "min_flash_loan_fee=9\n"
            "\n"
            "[staking]\n"
            "base_reward_rate=1200\n"
            "stake_unit=1000000\n");

        auto const params = config.marketParameters();
        if (!BEAST_EXPECT(params))
            return;

        BEAST_EXPECT(params->interestModel.baseRate == 200);
        BEAST_EXPECT(params->interestModel.multiplier == 1000);
        BEAST_EXPECT(params->interestModel.jumpMultiplier == 8000);
        BEAST_EXPECT(params->interestModel.kink == 9000);
        BEAST_EXPECT(params->reserveFactor == 1500);
        BEAST_EXPECT(params->maxUsers == 250);
        BEAST_EXPECT(params->minFlashLoanFee == 9);
        BEAST_EXPECT(params->baseRewardRate == 1200);
        BEAST_EXPECT(params->stakeUnit == 1'000'000);

        // Keys left out keep their defaults.
        MarketConfig partial;
        partial.loadFromString("[market]\nmax_users=7\n");
        auto const p = partial.marketParameters();
        BEAST_EXPECT(p && p->maxUsers == 7);
        BEAST_EXPECT(p && p->reserveFactor == MarketParameters{}.reserveFactor);
    }

    void
    testErrors()
    {
        testcase("Errors");

        auto const error = [](std::string const& text) -> std::string {
            MarketConfig config;
            config.loadFromString(text);
            auto const params = config.marketParameters();
            return params ? std::string{} : params.error();
        };

        BEAST_EXPECT(
            error("[interest_model]\nkink=lots\n") ==
            "[interest_model] kink: 'lots' is not a valid number");
        BEAST_EXPECT(
            error("[interest_model]\nkink=10001\n") ==
            "[interest_model] kink: 10001 is out of range [0, 10000]");
        BEAST_EXPECT(
            error("[market]\nreserve_factor=-1\n") ==
            "[market] reserve_factor: '-1' is not a valid number");
        BEAST_EXPECT(
            error("[market]\nmax_users=0\n") ==
            "[market] max_users: 0 is out of range [1, 4294967295]");
        BEAST_EXPECT(
            error("[staking]\nstake_unit=0\n") ==
            "[staking] stake_unit: 0 is out of range [1, "
            "18446744073709551615]");
        BEAST_EXPECT(
            error("[interest_model]\nbase_rate=4294967296\n") ==
            "[interest_model] base_rate: '4294967296' is not a valid number");
        BEAST_EXPECT(!error("[staking]\nbase_reward_rate=10001\n").empty());
        BEAST_EXPECT(!error("[market]\nmin_flash_loan_fee=20000\n").empty());
    }

public:
    void
    run() override
    {
        testSplitSections();
        testDefaults();
        testValues();
        testErrors();
    }
};

BEAST_DEFINE_TESTSUITE(MarketConfig, core, tierlend);

}  // namespace test
}  // namespace tierlend
