#include "BeastHttpClient.hpp"
#include "../../core/OracleError.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <optional>

namespace rainoracle {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

/**
 * Starts one async operation and runs the io_context until it completes or
 * the deadline passes. On timeout the operation is cancelled and its aborted
 * handler drained before returning beast::error::timeout.
 */
template<typename Start, typename Cancel>
beast::error_code runUntil(net::io_context& ioc, Clock::time_point deadline, Start&& start, Cancel&& cancel) {
    std::optional<beast::error_code> result;
    start([&result](beast::error_code ec) { result = ec; });
    
    ioc.restart();
    const auto now = Clock::now();
    if (deadline > now) {
        ioc.run_for(deadline - now);
    }
    if (!result) {
        cancel();
        ioc.restart();
        ioc.run();
        return beast::error::timeout;
    }
    return *result;
}

void throwIfFailed(const beast::error_code& ec, const char* phase, const BeastHttpClient::Url& url) {
    if (ec) {
        throw OracleError(ErrorKind::Retryable,
                          "HTTP " + std::string(phase) + " " + url.host + ":" + url.port + " failed: " + ec.message());
    }
}

template<typename Stream>
ports::HttpResponse exchange(net::io_context& ioc, Stream& stream, Clock::time_point deadline,
                             const http::request<http::string_body>& request,
                             const BeastHttpClient::Url& url) {
    auto cancel = [&stream]() { beast::get_lowest_layer(stream).cancel(); };
    
    auto ec = runUntil(ioc, deadline, [&](auto done) {
        http::async_write(stream, request, [done](beast::error_code e, std::size_t) { done(e); });
    }, cancel);
    throwIfFailed(ec, "write", url);
    
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    ec = runUntil(ioc, deadline, [&](auto done) {
        http::async_read(stream, buffer, response, [done](beast::error_code e, std::size_t) { done(e); });
    }, cancel);
    throwIfFailed(ec, "read", url);
    
    ports::HttpResponse result;
    result.status = static_cast<int>(response.result_int());
    result.body = std::move(response.body());
    return result;
}

} // namespace

BeastHttpClient::BeastHttpClient()
    : sslContext_(ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(ssl::verify_peer);
}

BeastHttpClient::Url BeastHttpClient::parseUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw OracleError(ErrorKind::Fatal, "Malformed URL (no scheme): " + url);
    }
    
    Url parsed;
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw OracleError(ErrorKind::Fatal, "Unsupported URL scheme: " + parsed.scheme);
    }
    
    const auto authorityStart = schemeEnd + 3;
    const auto pathStart = url.find_first_of("/?", authorityStart);
    std::string authority = url.substr(authorityStart, pathStart == std::string::npos
                                                           ? std::string::npos
                                                           : pathStart - authorityStart);
    parsed.target = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        parsed.host = authority.substr(0, colon);
        parsed.port = authority.substr(colon + 1);
    } else {
        parsed.host = authority;
        parsed.port = parsed.scheme == "https" ? "443" : "80";
    }
    
    if (parsed.host.empty() || parsed.port.empty() ||
        !std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw OracleError(ErrorKind::Fatal, "Malformed URL authority: " + url);
    }
    return parsed;
}

ports::HttpResponse BeastHttpClient::send(const ports::HttpRequest& request) {
    const Url url = parseUrl(request.url);
    const auto deadline = Clock::now() + request.timeout;
    
    http::request<http::string_body> message;
    message.method_string(request.method);
    message.target(url.target);
    message.version(11);
    message.set(http::field::host, url.host);
    message.set(http::field::user_agent, "rainoracle/1.0");
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    if (!request.body.empty()) {
        message.body() = request.body;
    }
    message.prepare_payload();
    
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    
    tcp::resolver::results_type endpoints;
    auto ec = runUntil(ioc, deadline, [&](auto done) {
        resolver.async_resolve(url.host, url.port,
            [&endpoints, done](beast::error_code e, tcp::resolver::results_type results) {
                endpoints = std::move(results);
                done(e);
            });
    }, [&resolver]() { resolver.cancel(); });
    throwIfFailed(ec, "resolve", url);
    
    if (url.scheme == "http") {
        beast::tcp_stream stream(ioc);
        ec = runUntil(ioc, deadline, [&](auto done) {
            stream.async_connect(endpoints, [done](beast::error_code e, const tcp::endpoint&) { done(e); });
        }, [&stream]() { stream.cancel(); });
        throwIfFailed(ec, "connect", url);
        return exchange(ioc, stream, deadline, message, url);
    }
    
    beast::ssl_stream<beast::tcp_stream> stream(ioc, sslContext_);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
        throw OracleError(ErrorKind::Retryable, "HTTP TLS: cannot set SNI host name for " + url.host);
    }
    stream.set_verify_callback(ssl::host_name_verification(url.host));
    
    ec = runUntil(ioc, deadline, [&](auto done) {
        beast::get_lowest_layer(stream).async_connect(endpoints,
            [done](beast::error_code e, const tcp::endpoint&) { done(e); });
    }, [&stream]() { beast::get_lowest_layer(stream).cancel(); });
    throwIfFailed(ec, "connect", url);
    
    ec = runUntil(ioc, deadline, [&](auto done) {
        stream.async_handshake(ssl::stream_base::client, [done](beast::error_code e) { done(e); });
    }, [&stream]() { beast::get_lowest_layer(stream).cancel(); });
    throwIfFailed(ec, "TLS handshake", url);
    
    return exchange(ioc, stream, deadline, message, url);
}

} // namespace rainoracle
