#include "IClock.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rainoracle {

std::string SystemClock::iso8601() const {
    return formatIso8601(epochSeconds());
}

std::string formatIso8601(int64_t epochSeconds) {
    auto time_t = static_cast<std::time_t>(epochSeconds);
    
    std::stringstream ss;
    
    // Use thread-safe gmtime_s on Windows, gmtime_r on other platforms
#ifdef _WIN32
    std::tm tm_buf{};
    if (gmtime_s(&tm_buf, &time_t) == 0) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#else
    std::tm tm_buf{};
    if (gmtime_r(&time_t, &tm_buf)) {
        ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    }
#endif
    
    ss << 'Z';
    return ss.str();
}

} // namespace rainoracle
