#pragma once

#include "../Policy.hpp"
#include <string>
#include <vector>

namespace rainoracle::ports {

class IWeatherProvider {
public:
    virtual ~IWeatherProvider() = default;
    
    /**
     * Readings in [startTime, endTime), ascending by timestamp.
     * Throws DataUnavailableError when the window reaches outside what the
     * provider can serve, OracleError(Retryable) on transient failures and
     * OracleError(Fatal) on auth/configuration failures.
     */
    virtual std::vector<Reading> fetchPrecipitation(const std::string& locationKey,
                                                    int64_t startTime, int64_t endTime) = 0;
    
    /// Throws LocationNotFound when the provider cannot geocode the coordinates.
    virtual std::string lookupLocationKey(double lat, double lon) = 0;
};

} // namespace rainoracle::ports
