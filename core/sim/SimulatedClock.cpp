#include "SimulatedClock.hpp"

namespace rainoracle::sim {

SimulatedClock::SimulatedClock(int64_t startEpochSeconds)
    : epochSeconds_(startEpochSeconds) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epochSeconds_.load()));
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(epochSeconds_);
}

} // namespace rainoracle::sim
