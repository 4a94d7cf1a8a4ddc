#include <tierlendd/app/misc/HttpRpcTransport.h>
//
#include <xrpl/basics/Log.h>
#include <xrpl/basics/StringUtilities.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <exception>
#include <utility>

namespace tierlend {

namespace {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using error_code = boost::system::error_code;

/** One POST, driven to completion on the caller's io_context.

    Impl supplies stream() and onConnected(), which must end by calling
    write() or fail().
*/
template <class Impl>
class Exchange
{
protected:
    boost::asio::io_context& ioc_;
    std::string const host_;
    std::string const port_;
    std::chrono::milliseconds const timeout_;
    tcp::resolver resolver_;
    http::request<http::string_body> request_;
    boost::beast::flat_buffer buffer_;
    http::response<http::string_body> response_;
    std::string failure_;

    Impl&
    impl()
    {
        return *static_cast<Impl*>(this);
    }

    boost::beast::tcp_stream&
    socket()
    {
        return boost::beast::get_lowest_layer(impl().stream());
    }

    void
    fail(char const* step, error_code const& ec)
    {
        failure_ = std::string(step) + ": " + ec.message();
    }

    void
    onResolve(error_code const& ec, tcp::resolver::results_type const& results)
    {
        if (ec)
            return fail("resolve", ec);

        socket().expires_after(timeout_);
        socket().async_connect(
            results, [this](error_code const& ec, tcp::endpoint const&) {
                if (ec)
                    return fail("connect", ec);
                impl().onConnected();
            });
    }

    void
    read()
    {
        socket().expires_after(timeout_);
        http::async_read(
            impl().stream(),
            buffer_,
            response_,
            [this](error_code const& ec, std::size_t) {
                if (ec)
                    return fail("read", ec);
                error_code ignored;
                socket().socket().shutdown(tcp::socket::shutdown_both, ignored);
            });
    }

public:
    Exchange(
        boost::asio::io_context& ioc,
        std::string host,
        std::string port,
        std::string const& target,
        std::string const& body,
        std::chrono::milliseconds timeout)
        : ioc_(ioc)
        , host_(std::move(host))
        , port_(std::move(port))
        , timeout_(timeout)
        , resolver_(ioc)
    {
        request_.method(http::verb::post);
        request_.target(target);
        request_.version(11);
        request_.set(http::field::host, host_);
        request_.set(http::field::user_agent, "tierlend");
        request_.set(http::field::content_type, "application/json");
        request_.set(http::field::accept, "application/json");
        request_.body() = body;
        request_.prepare_payload();
    }

    void
    write()
    {
        socket().expires_after(timeout_);
        http::async_write(
            impl().stream(),
            request_,
            [this](error_code const& ec, std::size_t) {
                if (ec)
                    return fail("write", ec);
                read();
            });
    }

    ripple::Expected<std::string, std::string>
    run()
    {
        resolver_.async_resolve(
            host_,
            port_,
            [this](
                error_code const& ec,
                tcp::resolver::results_type const& results) {
                onResolve(ec, results);
            });
        ioc_.run();

        if (!failure_.empty())
            return ripple::Unexpected(failure_);

        if (response_.result() != http::status::ok)
            return ripple::Unexpected(
                "HTTP status " + std::to_string(response_.result_int()));

        return std::move(response_.body());
    }
};

class PlainExchange : public Exchange<PlainExchange>
{
    boost::beast::tcp_stream stream_;

public:
    PlainExchange(
        boost::asio::io_context& ioc,
        std::string host,
        std::string port,
        std::string const& target,
        std::string const& body,
        std::chrono::milliseconds timeout)
        : Exchange(ioc, std::move(host), std::move(port), target, body, timeout)
        , stream_(ioc)
    {
    }

    boost::beast::tcp_stream&
    stream()
    {
        return stream_;
    }

    void
    onConnected()
    {
        write();
    }
};

class SSLExchange : public Exchange<SSLExchange>
{
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream_;

public:
    SSLExchange(
        boost::asio::io_context& ioc,
        boost::asio::ssl::context& context,
        std::string host,
        std::string port,
        std::string const& target,
        std::string const& body,
        std::chrono::milliseconds timeout)
        : Exchange(ioc, std::move(host), std::move(port), target, body, timeout)
        , stream_(ioc, context)
    {
    }

    boost::beast::ssl_stream<boost::beast::tcp_stream>&
    stream()
    {
        return stream_;
    }

    void
    onConnected()
    {
        // SNI
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), host_.c_str()))
        {
            failure_ = "handshake: cannot set the server name";
            return;
        }
        stream_.set_verify_callback(
            boost::asio::ssl::host_name_verification(host_));

        socket().expires_after(timeout_);
        stream_.async_handshake(
            boost::asio::ssl::stream_base::client,
            [this](error_code const& ec) {
                if (ec)
                    return fail("handshake", ec);
                write();
            });
    }
};

}  // namespace

HttpRpcTransport::HttpRpcTransport(
    std::string url,
    std::chrono::milliseconds timeout,
    beast::Journal j)
    : url_(std::move(url)), timeout_(timeout), j_(j)
{
}

ripple::Expected<std::string, std::string>
HttpRpcTransport::operator()(std::string const& body) const
{
    ripple::parsedURL pUrl;
    if (!ripple::parseUrl(pUrl, url_) || pUrl.domain.empty())
    {
        JLOG(j_.warn()) << "Invalid provider URL: " << url_;
        return ripple::Unexpected("invalid URL: " + url_);
    }

    if (pUrl.scheme != "http" && pUrl.scheme != "https")
    {
        JLOG(j_.warn()) << "Unsupported provider URL scheme: " << pUrl.scheme;
        return ripple::Unexpected("unsupported scheme: " + pUrl.scheme);
    }

    bool const secure = pUrl.scheme == "https";
    auto const port = std::to_string(pUrl.port.value_or(secure ? 443 : 80));
    auto const target = pUrl.path.empty() ? std::string("/") : pUrl.path;

    JLOG(j_.debug()) << "POST " << url_ << ": " << body;

    try
    {
        boost::asio::io_context ioc;
        ripple::Expected<std::string, std::string> result =
            ripple::Unexpected(std::string("not sent"));

        if (secure)
        {
            boost::asio::ssl::context context{
                boost::asio::ssl::context::tls_client};
            context.set_default_verify_paths();
            context.set_verify_mode(boost::asio::ssl::verify_peer);

            SSLExchange exchange(
                ioc, context, pUrl.domain, port, target, body, timeout_);
            result = exchange.run();
        }
        else
        {
            PlainExchange exchange(
                ioc, pUrl.domain, port, target, body, timeout_);
            result = exchange.run();
        }

        if (!result)
            JLOG(j_.warn()) << "POST " << url_ << " failed: " << result.error();
        return result;
    }
    catch (std::exception const& e)
    {
        JLOG(j_.warn()) << "POST " << url_ << " failed: " << e.what();
        return ripple::Unexpected(std::string(e.what()));
    }
}

}  // namespace tierlend
