#include "MockHttpClient.hpp"
#include "../OracleError.hpp"

namespace rainoracle::sim {

ports::HttpResponse MockHttpClient::send(const ports::HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    
    for (const auto& route : routes_) {
        if (request.url.find(route.urlContains) == std::string::npos) {
            continue;
        }
        if (route.transportFailure) {
            throw OracleError(ErrorKind::Retryable, "mock transport failure for " + route.urlContains);
        }
        return ports::HttpResponse{route.status, route.body};
    }
    return ports::HttpResponse{404, ""};
}

void MockHttpClient::respond(const std::string& urlContains, int status, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(Route{urlContains, status, body, false});
}

void MockHttpClient::failTransport(const std::string& urlContains) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.push_back(Route{urlContains, 0, "", true});
}

void MockHttpClient::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_.clear();
    requests_.clear();
}

std::vector<ports::HttpRequest> MockHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::size_t MockHttpClient::requestCount(const std::string& urlContains) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& request : requests_) {
        if (request.url.find(urlContains) != std::string::npos) {
            count++;
        }
    }
    return count;
}

} // namespace rainoracle::sim
