#pragma once

#include "../ports/IRetryPolicy.hpp"
#include <algorithm>
#include <cmath>

namespace rainoracle::adapters {

/// delay(n) = baseDelay * multiplier^(n-1), capped at maxDelay; n is 1-based.
class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(5000),
                                  double multiplier = 2.0,
                                  std::chrono::milliseconds maxDelay = std::chrono::minutes(10),
                                  int maxAttempts = 8)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        const int exponent = std::max(0, attemptCount - 1);
        const double raw = static_cast<double>(baseDelay_.count()) * std::pow(multiplier_, exponent);
        // Large attempt counts overflow the double->integer cast; cap first.
        if (raw >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(raw));
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }
    
    int maxAttempts() const { return maxAttempts_; }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

} // namespace rainoracle::adapters
