#ifndef TIERLEND_APP_MISC_JSONRPCPROVIDERS_H_INCLUDED
#define TIERLEND_APP_MISC_JSONRPCPROVIDERS_H_INCLUDED

#include <tierlendd/app/misc/ExternalProviders.h>

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>

#include <cstdint>
#include <functional>
#include <string>

namespace tierlend {

/** Sends one JSON-RPC request body and returns the response body.

    An error string means the request never produced a response.
*/
using RpcTransport = std::function<ripple::Expected<std::string, std::string>(
    std::string const& request)>;

/** Issues JSON-RPC 2.0 calls over an injected transport.

    Requests look like

        {"jsonrpc": "2.0", "id": 1, "method": "convert",
         "params": [{"amount": "100"}]}

    and a call succeeds when the response carries a `result` object whose
    `status`, if present, is not "error". A top level `error` member, an
    error status, an unparsable body and a transport failure all fail the
    call with a message.
*/
class JsonRpcClient
{
    std::string service_;
    RpcTransport transport_;
    beast::Journal j_;
    std::uint32_t nextId_ = 1;

public:
    JsonRpcClient(std::string service, RpcTransport transport, beast::Journal j);

    ripple::Expected<Json::Value, std::string>
    call(std::string const& method, Json::Value const& params);
};

/** Reads an unsigned 64-bit amount rendered as a string or an integer. */
ripple::Expected<std::uint64_t, std::string>
amountFromJson(Json::Value const& result, char const* field);

class JsonRpcLiquidityConverter final : public LiquidityConverter
{
    JsonRpcClient client_;

public:
    JsonRpcLiquidityConverter(RpcTransport transport, beast::Journal j);

    ripple::Expected<std::uint64_t, std::string>
    convert(std::uint64_t amount) override;

    ripple::Expected<std::uint64_t, std::string>
    redeem(std::uint64_t derivativeAmount) override;
};

class JsonRpcLeverageProvider final : public LeverageProvider
{
    JsonRpcClient client_;

public:
    JsonRpcLeverageProvider(RpcTransport transport, beast::Journal j);

    ripple::Expected<std::string, std::string>
    open(std::uint64_t collateral) override;

    ripple::Expected<std::uint64_t, std::string>
    close(std::string const& handle) override;
};

}  // namespace tierlend

#endif
