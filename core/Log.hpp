#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace rainoracle {

/**
 * @brief One console log line with a "[Component]" prefix
 *
 * Collects the streamed message and writes it in a single locked write when
 * the temporary goes out of scope, so lines from worker threads never mix.
 *
 * Usage: LogLine("Scheduler") << "pass " << cycle << " complete";
 *        LogLine("Fetcher", LogLine::Error) << "request failed";
 */
class LogLine {
public:
    enum Level { Info, Warn, Error };

    explicit LogLine(const char* component, Level level = Info)
        : level_(level) {
        buffer_ << '[' << component << "] ";
        if (level == Warn) {
            buffer_ << "Warning: ";
        } else if (level == Error) {
            buffer_ << "Error: ";
        }
    }

    ~LogLine() {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::ostream& out = (level_ == Info) ? std::cout : std::cerr;
        out << buffer_.str() << std::endl;
    }

    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template<typename T>
    LogLine& operator<<(const T& value) {
        buffer_ << value;
        return *this;
    }

private:
    static std::mutex& outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    Level level_;
    std::ostringstream buffer_;
};

} // namespace rainoracle
