/**
 * @file BeastHttpClient.hpp
 * @brief Boost.Beast implementation of ports::IHttpClient
 *
 * One connection per request over plain TCP or TLS (OpenSSL via Asio).
 * Every phase (resolve, connect, handshake, write, read) shares the request's
 * timeout budget; running out of budget or any transport error throws
 * OracleError(Retryable). HTTP error statuses are returned, not thrown.
 */

#pragma once

#include "../../core/ports/IHttpClient.hpp"
#include <boost/asio/ssl/context.hpp>
#include <string>

namespace rainoracle {

class BeastHttpClient : public ports::IHttpClient {
public:
    BeastHttpClient();
    
    BeastHttpClient(const BeastHttpClient&) = delete;
    BeastHttpClient& operator=(const BeastHttpClient&) = delete;
    
    ports::HttpResponse send(const ports::HttpRequest& request) override;
    
    struct Url {
        std::string scheme;   ///< "http" or "https"
        std::string host;
        std::string port;
        std::string target;   ///< path and query, "/" at minimum
    };
    
    /// Throws OracleError(Fatal) for malformed URLs or unsupported schemes.
    static Url parseUrl(const std::string& url);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace rainoracle
