#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <string>

namespace rainoracle::domain {

/**
 * Fixed arena of mutexes selected by key hash. Work on one key is serialized;
 * different keys rarely contend. Hold at most one lock from an arena at a time.
 */
class KeyedMutex {
public:
    std::mutex& mutexFor(const std::string& key) {
        return stripes_[std::hash<std::string>{}(key) % kStripes];
    }

private:
    static constexpr std::size_t kStripes = 64;
    std::array<std::mutex, kStripes> stripes_;
};

} // namespace rainoracle::domain
