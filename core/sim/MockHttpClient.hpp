#pragma once

#include "../ports/IHttpClient.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rainoracle::sim {

/**
 * Canned HTTP responses selected by URL substring, first match wins.
 * Unmatched requests get 404. Every request is recorded.
 */
class MockHttpClient : public ports::IHttpClient {
public:
    ports::HttpResponse send(const ports::HttpRequest& request) override;
    
    void respond(const std::string& urlContains, int status, const std::string& body);
    /// Requests matching urlContains throw OracleError(Retryable) as a transport failure.
    void failTransport(const std::string& urlContains);
    void reset();
    
    std::vector<ports::HttpRequest> requests() const;
    std::size_t requestCount(const std::string& urlContains = "") const;

private:
    struct Route {
        std::string urlContains;
        int status = 200;
        std::string body;
        bool transportFailure = false;
    };
    
    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::vector<ports::HttpRequest> requests_;
};

} // namespace rainoracle::sim
