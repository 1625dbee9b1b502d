#include "AccuWeatherProvider.hpp"
#include "../Log.hpp"
#include "../OracleError.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rainoracle::adapters {

namespace {

std::string urlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

nlohmann::json parseBody(const std::string& body, const std::string& what) {
    try {
        return nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw OracleError(ErrorKind::Retryable, what + ": malformed response body: " + e.what());
    }
}

} // namespace

AccuWeatherProvider::AccuWeatherProvider(std::shared_ptr<ports::IHttpClient> http,
                                         std::shared_ptr<IClock> clock,
                                         std::string baseUrl,
                                         std::string apiKey,
                                         int64_t historySeconds,
                                         std::chrono::milliseconds timeout)
    : http_(std::move(http)),
      clock_(std::move(clock)),
      baseUrl_(std::move(baseUrl)),
      apiKey_(std::move(apiKey)),
      historySeconds_(historySeconds),
      timeout_(timeout) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

void AccuWeatherProvider::checkStatus(int status, const std::string& what) {
    if (status >= 200 && status < 300) {
        return;
    }
    
    const std::string message = what + ": HTTP " + std::to_string(status);
    if (status == 401 || status == 403) {
        throw OracleError(ErrorKind::Fatal, message + " (API key rejected)");
    }
    if (status == 429) {
        throw OracleError(ErrorKind::Retryable, message + " (rate limited)");
    }
    if (status >= 500) {
        throw OracleError(ErrorKind::Retryable, message + " (provider error)");
    }
    if (status >= 400) {
        throw OracleError(ErrorKind::Fatal, message + " (bad request)");
    }
    throw OracleError(ErrorKind::Retryable, message + " (unexpected status)");
}

Tenths AccuWeatherProvider::toTenths(double millimetres) {
    return static_cast<Tenths>(std::llround(millimetres * 10.0));
}

void AccuWeatherProvider::requireApiKey() const {
    if (apiKey_.empty()) {
        throw OracleError(ErrorKind::Fatal, "AccuWeather API key is not configured");
    }
}

ports::HttpResponse AccuWeatherProvider::get(const std::string& pathAndQuery) {
    ports::HttpRequest request;
    request.method = "GET";
    request.url = baseUrl_ + pathAndQuery;
    request.headers["Accept"] = "application/json";
    request.timeout = timeout_;
    return http_->send(request);
}

std::vector<Reading> AccuWeatherProvider::fetchPrecipitation(const std::string& locationKey,
                                                             int64_t startTime, int64_t endTime) {
    requireApiKey();
    if (locationKey.empty()) {
        throw OracleError(ErrorKind::Fatal, "AccuWeather: empty location key");
    }
    if (endTime <= startTime) {
        return {};
    }
    
    const int64_t now = clock_->epochSeconds();
    const int64_t servedStart = now - historySeconds_;
    if (startTime < servedStart) {
        throw DataUnavailableError("AccuWeather serves only the trailing " + std::to_string(historySeconds_ / 3600) +
                                   "h; requested window starts " + std::to_string(servedStart - startTime) +
                                   "s earlier",
                                   servedStart, now);
    }
    
    const std::string what = "AccuWeather history for " + locationKey;
    auto response = get("/currentconditions/v1/" + urlEncode(locationKey) + "/historical/24?apikey=" +
                        urlEncode(apiKey_) + "&details=true");
    if (response.status == 404) {
        throw OracleError(ErrorKind::Fatal, what + ": unknown location key");
    }
    checkStatus(response.status, what);
    
    const auto body = parseBody(response.body, what);
    if (!body.is_array()) {
        throw OracleError(ErrorKind::Retryable, what + ": expected a JSON array");
    }
    
    std::vector<Reading> readings;
    std::size_t withoutPrecipitation = 0;
    for (const auto& observation : body) {
        if (!observation.is_object() || !observation.contains("EpochTime") ||
            !observation["EpochTime"].is_number_integer()) {
            throw OracleError(ErrorKind::Retryable, what + ": observation without EpochTime");
        }
        
        const int64_t timestamp = observation["EpochTime"].get<int64_t>();
        if (timestamp < startTime || timestamp >= endTime) {
            continue;
        }
        
        const nlohmann::json* value = &observation;
        for (const char* field : {"PrecipitationSummary", "PastHour", "Metric", "Value"}) {
            value = (value->is_object() && value->contains(field)) ? &(*value)[field] : nullptr;
            if (value == nullptr) break;
        }
        if (value == nullptr || !value->is_number()) {
            withoutPrecipitation++;
            continue;
        }
        readings.push_back(Reading{timestamp, toTenths(value->get<double>())});
    }
    
    if (withoutPrecipitation > 0) {
        LogLine("AccuWeather", LogLine::Warn) << withoutPrecipitation << " observation(s) for " << locationKey
                                              << " carried no past-hour precipitation";
    }
    
    std::sort(readings.begin(), readings.end(),
              [](const Reading& a, const Reading& b) { return a.timestamp < b.timestamp; });
    return readings;
}

std::string AccuWeatherProvider::lookupLocationKey(double lat, double lon) {
    requireApiKey();
    
    std::ostringstream query;
    query << std::fixed << std::setprecision(4) << lat << ',' << lon;
    const std::string what = "AccuWeather geoposition " + query.str();
    
    auto response = get("/locations/v1/cities/geoposition/search?apikey=" + urlEncode(apiKey_) +
                        "&q=" + urlEncode(query.str()));
    if (response.status == 404) {
        throw LocationNotFound(what + ": no location");
    }
    checkStatus(response.status, what);
    
    if (response.body.empty()) {
        throw LocationNotFound(what + ": empty response");
    }
    const auto body = parseBody(response.body, what);
    if (body.is_null() || (body.is_array() && body.empty())) {
        throw LocationNotFound(what + ": no location");
    }
    
    const auto& location = body.is_array() ? body.front() : body;
    if (!location.is_object() || !location.contains("Key") || !location["Key"].is_string() ||
        location["Key"].get<std::string>().empty()) {
        throw LocationNotFound(what + ": response has no location key");
    }
    return location["Key"].get<std::string>();
}

} // namespace rainoracle::adapters
