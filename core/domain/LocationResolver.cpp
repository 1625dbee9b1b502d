#include "LocationResolver.hpp"
#include "../Log.hpp"
#include <cmath>
#include <mutex>

namespace rainoracle::domain {

LocationResolver::LocationResolver(std::shared_ptr<ports::IWeatherProvider> provider)
    : provider_(std::move(provider)) {
}

LocationResolver::CacheKey LocationResolver::cacheKey(double lat, double lon) {
    return {std::llround(lat * 10000.0), std::llround(lon * 10000.0)};
}

std::string LocationResolver::resolve(double lat, double lon) {
    const CacheKey key = cacheKey(lat, lon);
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    
    // Provider call without holding the lock; a concurrent miss for the same
    // key resolves twice and the first insert wins.
    std::string providerKey = provider_->lookupLocationKey(lat, lon);
    
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = cache_.emplace(key, std::move(providerKey));
    if (inserted) {
        LogLine("Resolver") << "Resolved " << lat << "," << lon << " -> " << it->second;
    }
    return it->second;
}

std::string LocationResolver::resolveFor(const Policy& policy) {
    if (!policy.location.providerKey.empty()) {
        return policy.location.providerKey;
    }
    return resolve(policy.location.lat, policy.location.lon);
}

std::size_t LocationResolver::cacheSize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

} // namespace rainoracle::domain
