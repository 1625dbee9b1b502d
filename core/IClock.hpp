#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rainoracle {

class IClock {
public:
    virtual ~IClock() = default;
    
    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual int64_t epochSeconds() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
    
    int64_t epochSeconds() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            now().time_since_epoch()).count();
    }
    
    std::string iso8601() const override;
};

// Formats a unix timestamp as "YYYY-MM-DDTHH:MM:SSZ"
std::string formatIso8601(int64_t epochSeconds);

} // namespace rainoracle
