#include <xrpl/beast/unit_test/suite.h>
//
#include <tierlendd/app/misc/JsonRpcProviders.h>

#include <xrpl/json/json_reader.h>

#include <string>
#include <vector>

namespace tierlend {
namespace test {

class JsonRpcProviders_test : public beast::unit_test::suite
{
    beast::Journal const j{beast::Journal::getNullSink()};

    // Answers every request with the queued responses in order and records
    // what was sent.
    struct Transport
    {
        std::vector<std::string> responses;
        std::vector<Json::Value> requests;
        bool fail = false;

        RpcTransport
        callback()
        {
            return [this](std::string const& body)
                       -> ripple::Expected<std::string, std::string> {
                Json::Value request;
                Json::Reader().parse(body, request);
                requests.push_back(request);

                if (fail || responses.empty())
                    return ripple::Unexpected(std::string("connection refused"));

                auto response = responses.front();
                responses.erase(responses.begin());
                return response;
            };
        }
    };

    void
    testRequests()
    {
        testcase("Requests");

        Transport transport;
        transport.responses = {
            R"({"jsonrpc":"2.0","id":1,"result":{"derivative_amount":"500"}})",
            R"({"jsonrpc":"2.0","id":2,"result":{"amount":"500"}})"};

        JsonRpcLiquidityConverter converter(transport.callback(), j);

        auto const derivative = converter.convert(500);
        BEAST_EXPECT(derivative && *derivative == 500);
        auto const redeemed = converter.redeem(500);
        BEAST_EXPECT(redeemed && *redeemed == 500);

        if (!BEAST_EXPECT(transport.requests.size() == 2))
            return;

        auto const& first = transport.requests[0];
        BEAST_EXPECT(first["jsonrpc"] == "2.0");
        BEAST_EXPECT(first["id"].asUInt() == 1);
        BEAST_EXPECT(first["method"] == "convert");
        BEAST_EXPECT(first["params"].isArray());
        BEAST_EXPECT(first["params"][0u]["amount"] == "500");

        auto const& second = transport.requests[1];
        BEAST_EXPECT(second["id"].asUInt() == 2);
        BEAST_EXPECT(second["method"] == "redeem");
        BEAST_EXPECT(second["params"][0u]["derivative_amount"] == "500");
    }

    void
    testFailures()
    {
        testcase("Failures");

        Transport transport;
        JsonRpcLiquidityConverter converter(transport.callback(), j);

        transport.fail = true;
        auto result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "connection refused");
        transport.fail = false;

        transport.responses = {
            R"({"jsonrpc":"2.0","id":2,"error":{"code":-32000,"message":"paused"}})"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "paused");

        transport.responses = {
            R"({"jsonrpc":"2.0","id":3,"result":{"status":"error","error_message":"insufficient liquidity"}})"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "insufficient liquidity");

        transport.responses = {R"({"jsonrpc":"2.0","id":4})"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "missing result");

        transport.responses = {"not json"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "malformed response");

        transport.responses = {R"({"result":{"derivative_amount":"-5"}})"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "invalid derivative_amount");

        transport.responses = {R"({"result":{"status":"ok"}})"};
        result = converter.convert(1);
        BEAST_EXPECT(!result && result.error() == "missing derivative_amount");

        // Without a transport nothing is sent.
        JsonRpcLiquidityConverter unconfigured(nullptr, j);
        BEAST_EXPECT(!unconfigured.convert(1));
    }

    void
    testAmounts()
    {
        testcase("Amounts");

        Json::Value result(Json::objectValue);
        result["big"] = "18446744073709551615";
        result["number"] = 42;
        result["negative"] = -1;
        result["fraction"] = 1.5;
        result["text"] = "12abc";

        auto const big = amountFromJson(result, "big");
        BEAST_EXPECT(big && *big == 18'446'744'073'709'551'615ull);
        auto const number = amountFromJson(result, "number");
        BEAST_EXPECT(number && *number == 42);

        BEAST_EXPECT(!amountFromJson(result, "negative"));
        BEAST_EXPECT(!amountFromJson(result, "fraction"));
        BEAST_EXPECT(!amountFromJson(result, "text"));
        BEAST_EXPECT(!amountFromJson(result, "absent"));
    }

    void
    testLeverage()
    {
        testcase("Leverage provider");

        Transport transport;
        transport.responses = {
            R"({"result":{"position":"pos-7"}})",
            R"({"result":{"proceeds":250}})",
            R"({"result":{"position":""}})"};

        JsonRpcLeverageProvider leverage(transport.callback(), j);

        auto const handle = leverage.open(250);
        BEAST_EXPECT(handle && *handle == "pos-7");
        auto const proceeds = leverage.close("pos-7");
        BEAST_EXPECT(proceeds && *proceeds == 250);
        auto const empty = leverage.open(1);
        BEAST_EXPECT(!empty && empty.error() == "missing position");

        if (!BEAST_EXPECT(transport.requests.size() == 3))
            return;
        BEAST_EXPECT(transport.requests[0]["method"] == "open_position");
        BEAST_EXPECT(
            transport.requests[0]["params"][0u]["collateral"] == "250");
        BEAST_EXPECT(transport.requests[1]["method"] == "close_position");
        BEAST_EXPECT(
            transport.requests[1]["params"][0u]["position"] == "pos-7");
    }

public:
    void
    run() override
    {
        testRequests();
        testFailures();
        testAmounts();
        testLeverage();
    }
};

BEAST_DEFINE_TESTSUITE(JsonRpcProviders, app, tierlend);

}  // namespace test
}  // namespace tierlend
