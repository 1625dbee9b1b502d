#pragma once

#include "../IClock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace rainoracle::sim {

/// Manually driven wall clock; time moves only through advance()/setEpochSeconds().
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(int64_t startEpochSeconds = 1700000000);
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override;
    int64_t epochSeconds() const override { return epochSeconds_; }
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::seconds duration) { epochSeconds_ += duration.count(); }
    void setEpochSeconds(int64_t epochSeconds) { epochSeconds_ = epochSeconds; }

private:
    std::atomic<int64_t> epochSeconds_;
};

} // namespace rainoracle::sim
