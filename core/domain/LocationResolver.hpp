#pragma once

#include "../Policy.hpp"
#include "../ports/IWeatherProvider.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>

namespace rainoracle::domain {

/**
 * @brief Coordinates to weather-provider location key, cached
 *
 * Cache keys are the coordinates rounded to 4 decimal digits (about 11 m).
 * Entries never expire and are not persisted.
 */
class LocationResolver {
public:
    explicit LocationResolver(std::shared_ptr<ports::IWeatherProvider> provider);
    
    /// Throws LocationNotFound (Fatal) or OracleError(Retryable) from the provider.
    std::string resolve(double lat, double lon);
    
    /// Uses the policy's pre-resolved key when present.
    std::string resolveFor(const Policy& policy);
    
    std::size_t cacheSize() const;
    
    using CacheKey = std::pair<int64_t, int64_t>;
    static CacheKey cacheKey(double lat, double lon);

private:
    std::shared_ptr<ports::IWeatherProvider> provider_;
    mutable std::shared_mutex mutex_;
    std::map<CacheKey, std::string> cache_;
};

} // namespace rainoracle::domain
