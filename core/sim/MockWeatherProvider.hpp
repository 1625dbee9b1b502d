#pragma once

#include "../IClock.hpp"
#include "../OracleError.hpp"
#include "../ports/IWeatherProvider.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rainoracle::sim {

/**
 * Scripted precipitation source. Readings are visible once the clock has
 * passed their timestamp. With a history limit set, requests reaching further
 * back than the limit throw DataUnavailableError like the real provider.
 */
class MockWeatherProvider : public ports::IWeatherProvider {
public:
    explicit MockWeatherProvider(std::shared_ptr<IClock> clock);
    
    std::vector<Reading> fetchPrecipitation(const std::string& locationKey,
                                            int64_t startTime, int64_t endTime) override;
    std::string lookupLocationKey(double lat, double lon) override;
    
    void addReading(const std::string& locationKey, int64_t timestamp, Tenths precipitation);
    void setLocation(double lat, double lon, const std::string& locationKey);
    void setHistoryLimit(int64_t seconds);
    /// The next `times` fetches throw an OracleError of this kind.
    void failFetches(ErrorKind kind, int times = 1);
    
    std::size_t fetchCalls() const;
    std::size_t lookupCalls() const;

private:
    std::shared_ptr<IClock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, std::multimap<int64_t, Tenths>> readings_;
    std::map<std::pair<int64_t, int64_t>, std::string> locations_;
    std::deque<ErrorKind> failures_;
    int64_t historyLimit_ = 0;
    std::size_t fetchCalls_ = 0;
    std::size_t lookupCalls_ = 0;
};

} // namespace rainoracle::sim
