#include "http_transport.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#ifdef PLAYLIST_SYNC_HAS_SSL
#include <boost/asio/ssl.hpp>
#include <boost/beast/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>
#include <utility>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace playlist_sync {

namespace {

http::request<http::empty_body>
makeRequest(const std::string& host, const std::string& target,
            const std::string& bearerToken) {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::accept, "application/json");
    req.set(http::field::user_agent, "playlist_sync/1.0");
    if (!bearerToken.empty()) {
        req.set(http::field::authorization, "Bearer " + bearerToken);
    }
    return req;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

BeastHttpTransport::BeastHttpTransport(const std::string& baseUrl,
                                       int timeoutMs)
    : mTimeoutMs(timeoutMs)
{
    auto parts = parseUrl(baseUrl);
    mHost     = parts.host;
    mPort     = parts.port;
    mBasePath = parts.target;
    mUseSsl   = (parts.scheme == "https");

    if (mUseSsl) {
#ifndef PLAYLIST_SYNC_HAS_SSL
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

nlohmann::json BeastHttpTransport::get(const std::string& target,
                                       const std::string& bearerToken)
{
    const std::string fullTarget = mBasePath + target;

    if (mVerbose) {
        std::cerr << "[Transport] GET " << mHost << ":" << mPort
                  << fullTarget << "\n";
    }

    RawResponse raw;
    try {
        raw = mUseSsl ? doHttpsRequest(fullTarget, bearerToken)
                      : doHttpRequest(fullTarget, bearerToken);
    } catch (const boost::system::system_error& e) {
        throw NetworkError("GET " + target + " failed: " + e.what());
    }

    if (mVerbose) {
        std::cerr << "[Transport] HTTP " << raw.status << "\n";
    }

    nlohmann::json body;
    bool parsed = true;
    try {
        body = nlohmann::json::parse(raw.body);
    } catch (const nlohmann::json::parse_error&) {
        parsed = false;
    }

    if (raw.status < 200 || raw.status >= 300) {
        // Error bodies are optional; keep null when unparsable.
        throwForStatus(raw.status, parsed ? body : nlohmann::json(), target);
    }
    if (!parsed) {
        throw MalformedResponseError("GET " + target +
                                     " returned a body that is not JSON");
    }
    return body;
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

BeastHttpTransport::RawResponse
BeastHttpTransport::doHttpRequest(const std::string& target,
                                  const std::string& bearerToken)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(mHost, mPort);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = makeRequest(mHost, target, bearerToken);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // Graceful shutdown; the response is already complete.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return {res.result_int(), std::move(res.body())};
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

BeastHttpTransport::RawResponse
BeastHttpTransport::doHttpsRequest(const std::string& target,
                                   const std::string& bearerToken)
{
#ifdef PLAYLIST_SYNC_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), mHost.c_str())) {
        throw NetworkError("Failed to set SNI hostname for " + mHost);
    }

    auto const results = resolver.resolve(mHost, mPort);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = makeRequest(mHost, target, bearerToken);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // Servers commonly skip close_notify; a short read here is harmless.
    beast::error_code ec;
    stream.shutdown(ec);

    return {res.result_int(), std::move(res.body())};
#else
    (void)target;
    (void)bearerToken;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace playlist_sync
