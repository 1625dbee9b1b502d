#pragma once

#include "../IClock.hpp"
#include "../ports/IHttpClient.hpp"
#include "../ports/IWeatherProvider.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace rainoracle::adapters {

/**
 * @brief AccuWeather REST adapter for precipitation history and geocoding
 *
 * History comes from the 24-hour historical current-conditions endpoint, so
 * the provider can serve only [now - historySeconds, now). A request that
 * starts earlier fails with DataUnavailableError carrying that range.
 *
 * Status classification:
 * - 401/403 (auth), 400 and other 4xx, missing API key: Fatal
 * - 429, 5xx, transport failures and unparseable bodies: Retryable
 */
class AccuWeatherProvider : public ports::IWeatherProvider {
public:
    AccuWeatherProvider(std::shared_ptr<ports::IHttpClient> http,
                        std::shared_ptr<IClock> clock,
                        std::string baseUrl,
                        std::string apiKey,
                        int64_t historySeconds = 24 * 3600,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(10000));
    
    std::vector<Reading> fetchPrecipitation(const std::string& locationKey,
                                            int64_t startTime, int64_t endTime) override;
    
    std::string lookupLocationKey(double lat, double lon) override;
    
    /// Throws the OracleError matching a non-2xx status.
    static void checkStatus(int status, const std::string& what);
    
    /// Millimetres to tenths of a millimetre, rounded half away from zero.
    static Tenths toTenths(double millimetres);

private:
    ports::HttpResponse get(const std::string& pathAndQuery);
    void requireApiKey() const;
    
    std::shared_ptr<ports::IHttpClient> http_;
    std::shared_ptr<IClock> clock_;
    std::string baseUrl_;
    std::string apiKey_;
    int64_t historySeconds_;
    std::chrono::milliseconds timeout_;
};

} // namespace rainoracle::adapters
