#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rainoracle {

/**
 * @brief Failure taxonomy shared by every external-facing component
 *
 * The kind decides what the caller does with the failure:
 * - Retryable: transient network/provider error, retried with backoff
 * - StaleReading: reading rejected by the aggregator, logged only
 * - DataUnavailable: provider cannot serve the window, policy skipped this pass
 * - Fatal: configuration, auth or geocoding failure, surfaced to the operator
 * - ChainRejectedDuplicate: the chain already holds the report, treated as success
 */
enum class ErrorKind {
    Retryable,
    StaleReading,
    DataUnavailable,
    Fatal,
    ChainRejectedDuplicate
};

std::string errorKindToString(ErrorKind kind);

class OracleError : public std::runtime_error {
public:
    OracleError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }
    bool isRetryable() const noexcept { return kind_ == ErrorKind::Retryable; }
    bool isFatal() const noexcept { return kind_ == ErrorKind::Fatal; }

private:
    ErrorKind kind_;
};

/// Provider could not serve the requested window; carries what it can serve.
class DataUnavailableError : public OracleError {
public:
    DataUnavailableError(const std::string& message, int64_t servedStart, int64_t servedEnd)
        : OracleError(ErrorKind::DataUnavailable, message),
          servedStart_(servedStart), servedEnd_(servedEnd) {}

    int64_t servedStart() const noexcept { return servedStart_; }
    int64_t servedEnd() const noexcept { return servedEnd_; }

private:
    int64_t servedStart_;
    int64_t servedEnd_;
};

class LocationNotFound : public OracleError {
public:
    explicit LocationNotFound(const std::string& message)
        : OracleError(ErrorKind::Fatal, message) {}
};

} // namespace rainoracle
