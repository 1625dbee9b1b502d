#include "MockWeatherProvider.hpp"
#include <cmath>

namespace rainoracle::sim {

namespace {

std::pair<int64_t, int64_t> coordinateKey(double lat, double lon) {
    return {std::llround(lat * 10000.0), std::llround(lon * 10000.0)};
}

} // namespace

MockWeatherProvider::MockWeatherProvider(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {
}

std::vector<Reading> MockWeatherProvider::fetchPrecipitation(const std::string& locationKey,
                                                             int64_t startTime, int64_t endTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetchCalls_++;
    
    if (!failures_.empty()) {
        const ErrorKind kind = failures_.front();
        failures_.pop_front();
        throw OracleError(kind, "mock provider failure");
    }
    
    const int64_t now = clock_->epochSeconds();
    if (historyLimit_ > 0 && startTime < now - historyLimit_) {
        throw DataUnavailableError("mock provider history limit", now - historyLimit_, now);
    }
    
    std::vector<Reading> result;
    auto it = readings_.find(locationKey);
    if (it == readings_.end()) {
        return result;
    }
    for (auto r = it->second.lower_bound(startTime); r != it->second.end() && r->first < endTime; ++r) {
        if (r->first <= now) {
            result.push_back(Reading{r->first, r->second});
        }
    }
    return result;
}

std::string MockWeatherProvider::lookupLocationKey(double lat, double lon) {
    std::lock_guard<std::mutex> lock(mutex_);
    lookupCalls_++;
    auto it = locations_.find(coordinateKey(lat, lon));
    if (it == locations_.end()) {
        throw LocationNotFound("mock provider: no location");
    }
    return it->second;
}

void MockWeatherProvider::addReading(const std::string& locationKey, int64_t timestamp, Tenths precipitation) {
    std::lock_guard<std::mutex> lock(mutex_);
    readings_[locationKey].emplace(timestamp, precipitation);
}

void MockWeatherProvider::setLocation(double lat, double lon, const std::string& locationKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    locations_[coordinateKey(lat, lon)] = locationKey;
}

void MockWeatherProvider::setHistoryLimit(int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    historyLimit_ = seconds;
}

void MockWeatherProvider::failFetches(ErrorKind kind, int times) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < times; ++i) {
        failures_.push_back(kind);
    }
}

std::size_t MockWeatherProvider::fetchCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchCalls_;
}

std::size_t MockWeatherProvider::lookupCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lookupCalls_;
}

} // namespace rainoracle::sim
