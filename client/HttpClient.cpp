#include <cstdint>
#include <limits>
#include <memory>
#include "Errors.hpp"
#include "HttpClient.hpp"

namespace
{
// getaddrinfo runs on the resolver's own thread and cannot be interrupted, so
// the lookup is raced against a timer and abandoned when the timer wins.
struct PendingResolve
{
    explicit PendingResolve(boost::asio::any_io_executor const& executor)
        : resolver(executor)
        , signal(executor)
    {
    }

    boost::asio::ip::tcp::resolver resolver;
    boost::asio::steady_timer signal;
    boost::system::error_code error;
    boost::asio::ip::tcp::resolver::results_type results;
    bool finished = false;
};
}

Url Url::parse(std::string const& url)
{
    Url out;

    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        throw FetchError("Malformed URL: " + url);

    out.scheme = url.substr(0, schemeEnd);
    if (out.scheme != "http" && out.scheme != "https")
        throw FetchError("Unsupported URL scheme: " + url);

    auto authorityStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", authorityStart);
    std::string authority = url.substr(authorityStart, pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);

    out.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (out.target.front() == '?')
        out.target.insert(0, "/");

    auto colon = authority.rfind(':');
    if (colon != std::string::npos)
    {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    }
    else
    {
        out.host = authority;
        out.port = out.scheme == "https" ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty())
        throw FetchError("Malformed URL: " + url);

    return out;
}

Url Url::resolve(std::string const& location) const
{
    if (location.find("://") != std::string::npos)
        return parse(location);

    Url next = *this;
    if (!location.empty() && location.front() == '/')
    {
        next.target = location;
    }
    else
    {
        auto slash = target.rfind('/');
        next.target = (slash == std::string::npos ? std::string("/") : target.substr(0, slash + 1)) + location;
    }
    return next;
}

HttpClient::HttpClient(boost::asio::io_context& ioc, std::string agent)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , userAgent(std::move(agent))
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_none);
    }

boost::asio::io_context& HttpClient::getIoContext() noexcept { return ioContext; }

void HttpClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> HttpClient::resolve(Url const& url, Deadline deadline)
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto pending = std::make_shared<PendingResolve>(executor);
    pending->signal.expires_at(deadline);

    pending->resolver.async_resolve(url.host, url.port,
        [pending](boost::system::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
        {
            pending->error = ec;
            pending->results = std::move(results);
            pending->finished = true;
            pending->signal.cancel();
        });

    boost::system::error_code waitError;
    if (!pending->finished)
        co_await pending->signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, waitError));

    if (!pending->finished)
    {
        pending->resolver.cancel();
        throw boost::system::system_error(boost::system::error_code(boost::beast::error::timeout));
    }
    if (pending->error)
        throw boost::system::system_error(pending->error);

    co_return pending->results;
}

boost::beast::http::request<boost::beast::http::string_body> HttpClient::buildGetRequest(Url const& url) const
{
    bool defaultPort = (url.scheme == "https" && url.port == "443") || (url.scheme == "http" && url.port == "80");

    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, url.target, 11);
    request.set(boost::beast::http::field::host, defaultPort ? url.host : url.host + ":" + url.port);
    request.set(boost::beast::http::field::user_agent, userAgent);
    request.set(boost::beast::http::field::accept, "*/*");

    return request;
}

template <class Stream>
boost::asio::awaitable<HttpResponse> HttpClient::exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request, Deadline deadline)
{
    boost::beast::get_lowest_layer(stream).expires_at(deadline);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());

    boost::beast::get_lowest_layer(stream).expires_at(deadline);
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);

    boost::beast::http::response<boost::beast::http::string_body> message = parser.release();

    HttpResponse response;
    response.status = message.result_int();
    auto location = message.find(boost::beast::http::field::location);
    if (location != message.end())
        response.location = std::string(location->value());
    response.body = std::move(message.body());
    co_return response;
}

boost::asio::awaitable<HttpResponse> HttpClient::fetchOnce(Url const& url, Deadline deadline)
{
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(url, deadline);
    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(url);

    if (url.scheme == "https")
    {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);
        configureTlsStream(stream, url.host);

        boost::beast::get_lowest_layer(stream).expires_at(deadline);
        co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
        boost::beast::get_lowest_layer(stream).expires_at(deadline);
        co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

        HttpResponse response = co_await exchange(stream, request, deadline);
        co_await shutdownStream(stream);
        co_return response;
    }

    boost::beast::tcp_stream stream(executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, boost::asio::use_awaitable);

    HttpResponse response = co_await exchange(stream, request, deadline);

    boost::system::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    co_return response;
}

boost::asio::awaitable<HttpResponse> HttpClient::get(std::string target, std::chrono::steady_clock::duration timeout)
{
    Url url = Url::parse(target);
    Deadline deadline = std::chrono::steady_clock::now() + timeout;

    for (int hop = 0; ; ++hop)
    {
        HttpResponse response;
        try
        {
            response = co_await fetchOnce(url, deadline);
        }
        catch (boost::system::system_error const& e)
        {
            if (e.code() == boost::beast::error::timeout)
                throw FetchError("Timeout fetching " + url.host + url.target);
            throw FetchError(url.host + ": " + e.code().message());
        }

        bool redirect = response.status == 301 || response.status == 302 || response.status == 303
                     || response.status == 307 || response.status == 308;
        if (!redirect || response.location.empty())
            co_return response;

        if (hop >= MAX_REDIRECTS)
            throw FetchError("Too many redirects fetching " + target);

        url = url.resolve(response.location);
    }
}

boost::asio::awaitable<void> HttpClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}
