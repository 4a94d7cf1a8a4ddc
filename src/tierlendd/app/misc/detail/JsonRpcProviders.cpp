#include <tierlendd/app/misc/JsonRpcProviders.h>
//
#include <xrpl/basics/Log.h>
#include <xrpl/beast/core/LexicalCast.h>
#include <xrpl/json/json_reader.h>
#include <xrpl/json/to_string.h>

#include <utility>

namespace tierlend {

using ripple::Expected;
using ripple::Unexpected;

namespace {

std::string
errorMessage(Json::Value const& error, std::string const& fallback)
{
    if (error.isString())
        return error.asString();
    if (error.isObject())
    {
        if (error.isMember("message") && error["message"].isString())
            return error["message"].asString();
        if (error.isMember("error_message") &&
            error["error_message"].isString())
            return error["error_message"].asString();
    }
    return fallback;
}

}  // namespace

JsonRpcClient::JsonRpcClient(
    std::string service,
    RpcTransport transport,
    beast::Journal j)
    : service_(std::move(service)), transport_(std::move(transport)), j_(j)
{
}

Expected<Json::Value, std::string>
JsonRpcClient::call(std::string const& method, Json::Value const& params)
{
    Json::Value request(Json::objectValue);
    request["jsonrpc"] = "2.0";
    request["id"] = nextId_++;
    request["method"] = method;
    request["params"] = Json::arrayValue;
    request["params"].append(params);

    if (!transport_)
        return Unexpected(std::string("no transport configured"));

    auto const body = transport_(Json::to_string(request));
    if (!body)
    {
        JLOG(j_.warn()) << service_ << ": " << method
                        << " transport failure: " << body.error();
        return Unexpected(body.error());
    }

    Json::Value response;
    Json::Reader reader;
    if (!reader.parse(*body, response) || !response.isObject())
    {
        JLOG(j_.warn()) << service_ << ": " << method
                        << " returned an unparsable response";
        return Unexpected(std::string("malformed response"));
    }

    if (response.isMember("error") && !response["error"].isNull())
    {
        auto const message = errorMessage(response["error"], "rpc error");
        JLOG(j_.warn()) << service_ << ": " << method
                        << " failed: " << message;
        return Unexpected(message);
    }

    Json::Value const& result = response["result"];
    if (!result.isObject())
        return Unexpected(std::string("missing result"));

    if (result.isMember("status") && result["status"].asString() == "error")
    {
        auto const message = errorMessage(result, "provider error");
        JLOG(j_.warn()) << service_ << ": " << method
                        << " failed: " << message;
        return Unexpected(message);
    }

    JLOG(j_.debug()) << service_ << ": " << method << " succeeded";
    return result;
}

Expected<std::uint64_t, std::string>
amountFromJson(Json::Value const& result, char const* field)
{
    if (!result.isMember(field))
        return Unexpected(std::string("missing ") + field);

    Json::Value const& value = result[field];
    if (value.isString())
    {
        std::uint64_t amount = 0;
        if (!beast::lexicalCastChecked(amount, value.asString()))
            return Unexpected(std::string("invalid ") + field);
        return amount;
    }

    if (value.isUInt() || (value.isInt() && value.asInt() >= 0))
        return std::uint64_t{value.asUInt()};

    return Unexpected(std::string("invalid ") + field);
}

//------------------------------------------------------------------------------

JsonRpcLiquidityConverter::JsonRpcLiquidityConverter(
    RpcTransport transport,
    beast::Journal j)
    : client_("LiquidityConverter", std::move(transport), j)
{
}

Expected<std::uint64_t, std::string>
JsonRpcLiquidityConverter::convert(std::uint64_t amount)
{
    Json::Value params(Json::objectValue);
    params["amount"] = std::to_string(amount);

    auto const result = client_.call("convert", params);
    if (!result)
        return Unexpected(result.error());
    return amountFromJson(*result, "derivative_amount");
}

Expected<std::uint64_t, std::string>
JsonRpcLiquidityConverter::redeem(std::uint64_t derivativeAmount)
{
    Json::Value params(Json::objectValue);
    params["derivative_amount"] = std::to_string(derivativeAmount);

    auto const result = client_.call("redeem", params);
    if (!result)
        return Unexpected(result.error());
    return amountFromJson(*result, "amount");
}

//------------------------------------------------------------------------------

JsonRpcLeverageProvider::JsonRpcLeverageProvider(
    RpcTransport transport,
    beast::Journal j)
    : client_("LeverageProvider", std::move(transport), j)
{
}

Expected<std::string, std::string>
JsonRpcLeverageProvider::open(std::uint64_t collateral)
{
    Json::Value params(Json::objectValue);
    params["collateral"] = std::to_string(collateral);

    auto const result = client_.call("open_position", params);
    if (!result)
        return Unexpected(result.error());

    Json::Value const& position = (*result)["position"];
    if (!position.isString() || position.asString().empty())
        return Unexpected(std::string("missing position"));
    return position.asString();
}

Expected<std::uint64_t, std::string>
JsonRpcLeverageProvider::close(std::string const& handle)
{
    Json::Value params(Json::objectValue);
    params["position"] = handle;

    auto const result = client_.call("close_position", params);
    if (!result)
        return Unexpected(result.error());
    return amountFromJson(*result, "proceeds");
}

}  // namespace tierlend
