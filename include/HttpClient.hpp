#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

struct HttpResponse
{
    unsigned status = 0;
    std::string body;
    std::string location;
};

struct Url
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // http and https only. Throws FetchError otherwise.
    static Url parse(std::string const& url);

    // Absolute or host-relative Location header against this URL.
    Url resolve(std::string const& location) const;
};

// Single-attempt GET over plain TCP or TLS. The caller's timeout bounds the
// whole request, name resolution and redirects included; failures surface as
// FetchError.
class HttpClient
{
private:
    using Deadline = std::chrono::steady_clock::time_point;

    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string userAgent;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(Url const& url, Deadline deadline);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(Url const& url) const;
    boost::asio::awaitable<HttpResponse> fetchOnce(Url const& url, Deadline deadline);
    template <class Stream>
    boost::asio::awaitable<HttpResponse> exchange(Stream& stream, boost::beast::http::request<boost::beast::http::string_body> const& request, Deadline deadline);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);

public:
    static constexpr int MAX_REDIRECTS = 5;

    HttpClient(boost::asio::io_context& ioc, std::string agent);

    // Follows up to MAX_REDIRECTS redirects. Non-2xx final statuses are
    // returned, not thrown.
    boost::asio::awaitable<HttpResponse> get(std::string url, std::chrono::steady_clock::duration timeout);

    boost::asio::io_context& getIoContext() noexcept;
};
