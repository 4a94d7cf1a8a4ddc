#ifndef TIERLEND_APP_MISC_HTTPRPCTRANSPORT_H_INCLUDED
#define TIERLEND_APP_MISC_HTTPRPCTRANSPORT_H_INCLUDED

#include <xrpl/basics/Expected.h>
#include <xrpl/beast/utility/Journal.h>

#include <chrono>
#include <string>

namespace tierlend {

/** Posts JSON-RPC request bodies to an http:// or https:// endpoint.

    Each call opens a connection, sends one POST with a JSON body and reads
    the response. Every network step (connect, handshake, write and read)
    is bounded by the timeout. A response with a status other than 200 is a
    failure. HTTPS peers are verified against the system's trusted
    certificates and the URL's host name.

    Converts to an RpcTransport:

        JsonRpcLiquidityConverter converter(
            HttpRpcTransport(url, std::chrono::seconds(10), j), j);
*/
class HttpRpcTransport
{
    std::string url_;
    std::chrono::milliseconds timeout_;
    beast::Journal j_;

public:
    static constexpr std::chrono::seconds defaultTimeout{30};

    HttpRpcTransport(
        std::string url,
        std::chrono::milliseconds timeout,
        beast::Journal j);

    ripple::Expected<std::string, std::string>
    operator()(std::string const& body) const;
};

}  // namespace tierlend

#endif
