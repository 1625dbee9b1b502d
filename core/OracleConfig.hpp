/**
 * @file OracleConfig.hpp
 * @brief Runtime configuration for the rainfall oracle service
 *
 * Aggregates every external input of the engine: weather provider, chain
 * endpoint, MQTT broker, poll cadence, bucket geometry, retry/backoff and the
 * submission store location. Populated by TomlConfig and environment overrides.
 */

#pragma once

#include "Policy.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace rainoracle {

/**
 * @brief Aggregation window semantics for one policy version
 *
 * Cumulative counts every bucket since coverage start. Rolling counts only
 * the trailing rollingWindowSeconds ending at the latest observed time.
 */
struct WindowSpec {
    enum class Mode { Cumulative, Rolling };

    Mode mode = Mode::Cumulative;
    int64_t rollingWindowSeconds = 24 * 3600;
};

struct OracleConfig {
    // [weather]
    std::string weatherBaseUrl = "https://dataservice.accuweather.com";
    std::string weatherApiKey;                     ///< ACCUWEATHER_API_KEY
    int64_t providerHistorySeconds = 24 * 3600;    ///< Trailing range the provider serves
    bool acceptPartialHistory = true;              ///< Proceed with the served range on DataUnavailable

    // [chain]
    std::string chainEndpoint = "http://127.0.0.1:9933";
    std::string reporterId = "oracle";
    std::string reporterSecret;                    ///< ORACLE_REPORTER_SECRET

    // [mqtt]
    std::string mqttHost;                          ///< Empty disables events and the status feed
    int mqttPort = 1883;
    std::string mqttClientId = "rainoracle";
    std::string mqttUsername;
    std::string mqttPassword;
    bool mqttUseTls = false;
    std::string topicPrefix = "rainoracle";

    // [scheduler]
    std::chrono::seconds pollInterval{300};
    std::size_t workerThreads = 4;
    int64_t fetchOverlapSeconds = 2 * 3600;        ///< Re-fetch overlap for late provider data
    std::chrono::seconds fatalRecheckInterval{3600};

    // [aggregation]
    int64_t bucketDurationSeconds = 3600;
    int64_t lookbackBuckets = 7 * 24;              ///< Late readings accepted up to this many buckets back
    Tenths maxReadingTenths = 10000;               ///< 1000 mm per reading
    std::map<uint32_t, WindowSpec> windowByVersion = {
        {1, {WindowSpec::Mode::Rolling, 24 * 3600}},
        {2, {WindowSpec::Mode::Cumulative, 0}}
    };
    WindowSpec defaultWindow{WindowSpec::Mode::Cumulative, 0};

    // [retry]
    std::chrono::milliseconds retryBaseDelay{5000};
    double retryMultiplier = 2.0;
    std::chrono::milliseconds retryMaxDelay{std::chrono::minutes(10)};
    int retryMaxAttempts = 8;
    std::chrono::seconds failedRetryInterval{std::chrono::minutes(30)};

    // [store]
    std::string storePath = "./submissions.json";

    // [http]
    std::chrono::milliseconds httpTimeout{10000};

    WindowSpec windowFor(uint32_t policyVersion) const {
        auto it = windowByVersion.find(policyVersion);
        return it != windowByVersion.end() ? it->second : defaultWindow;
    }

    bool hasMqtt() const { return !mqttHost.empty(); }

    /// Returns human-readable problems; empty when the configuration is usable.
    std::vector<std::string> validate() const {
        std::vector<std::string> problems;
        if (weatherBaseUrl.empty()) problems.push_back("weather.base_url is empty");
        if (weatherApiKey.empty()) problems.push_back("weather API key missing (ACCUWEATHER_API_KEY)");
        if (chainEndpoint.empty()) problems.push_back("chain.endpoint is empty");
        if (reporterSecret.empty()) problems.push_back("reporter secret missing (ORACLE_REPORTER_SECRET)");
        if (pollInterval.count() <= 0) problems.push_back("scheduler.poll_interval_sec must be positive");
        if (workerThreads == 0) problems.push_back("scheduler.worker_threads must be at least 1");
        if (bucketDurationSeconds <= 0) problems.push_back("aggregation.bucket_duration_sec must be positive");
        if (lookbackBuckets < 0) problems.push_back("aggregation.lookback_buckets must not be negative");
        if (retryMaxAttempts <= 0) problems.push_back("retry.max_attempts must be positive");
        if (retryMultiplier < 1.0) problems.push_back("retry.multiplier must be >= 1.0");
        if (storePath.empty()) problems.push_back("store.path is empty");
        for (const auto& [version, spec] : windowByVersion) {
            if (spec.mode == WindowSpec::Mode::Rolling && spec.rollingWindowSeconds < bucketDurationSeconds) {
                problems.push_back("rolling window for policy version " + std::to_string(version) +
                                   " is shorter than one bucket");
            }
        }
        return problems;
    }
};

} // namespace rainoracle
