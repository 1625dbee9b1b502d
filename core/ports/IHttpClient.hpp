#pragma once

#include <chrono>
#include <map>
#include <string>

namespace rainoracle::ports {

struct HttpRequest {
    std::string method = "GET";
    std::string url;                             ///< absolute http:// or https:// URL, query included
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{10000};
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * Blocking HTTP client. Transport failures (DNS, connect, TLS, timeout) throw
 * OracleError(Retryable); any HTTP status, including 4xx/5xx, is returned.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace rainoracle::ports
