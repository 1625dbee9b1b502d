/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the oracle service
 *
 * Reads the flat TOML subset the service needs: sections, key = value pairs,
 * quoted strings, integers, decimals, booleans and # comments.
 *
 * Supported Sections:
 * - [weather]: provider base URL, API key, served history, partial-history policy
 * - [chain]: JSON-RPC endpoint and reporter identity
 * - [mqtt]: broker for chain events and the operator feed
 * - [scheduler]: poll cadence, worker pool size, fetch overlap, Fatal re-check cadence
 * - [aggregation]: bucket geometry, look-back, per-version window semantics
 * - [retry]: submission backoff and Failed re-try cadence
 * - [store]: submission store path
 * - [http]: per-call timeout
 *
 * Secrets are normally supplied through the environment (see applyEnvOverrides).
 */

#pragma once

#include "OracleConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rainoracle {

/**
 * @brief TOML configuration loader for OracleConfig
 *
 * Unknown keys are reported on stderr and ignored; malformed values throw
 * std::runtime_error naming the section and key.
 */
class TomlConfig {
public:
    using EnvGetter = std::function<std::string(const char*)>;
    
    /**
     * @brief Load and parse a TOML configuration file
     * @param filename Path to the TOML file
     * @return Configuration with file values over defaults
     * @note A missing file leaves the defaults in place and is reported on stderr
     */
    static OracleConfig loadFromFile(const std::string& filename) {
        OracleConfig config;
        std::ifstream file(filename);
        
        if (!file.is_open()) {
            std::cerr << "[Config] Warning: Could not open config file: " << filename
                      << "; using defaults and environment" << std::endl;
            return config;
        }
        
        parse(file, config);
        return config;
    }
    
    static OracleConfig loadFromString(const std::string& text) {
        OracleConfig config;
        std::istringstream stream(text);
        parse(stream, config);
        return config;
    }
    
    /**
     * @brief Apply environment overrides
     *
     * ACCUWEATHER_API_KEY, ORACLE_REPORTER_SECRET, CHAIN_ENDPOINT, MQTT_HOST and
     * POLL_INTERVAL_SEC take precedence over the file.
     */
    static void applyEnvOverrides(OracleConfig& config, const EnvGetter& getEnv) {
        const std::string apiKey = getEnv("ACCUWEATHER_API_KEY");
        const std::string secret = getEnv("ORACLE_REPORTER_SECRET");
        const std::string endpoint = getEnv("CHAIN_ENDPOINT");
        const std::string mqttHost = getEnv("MQTT_HOST");
        const std::string pollInterval = getEnv("POLL_INTERVAL_SEC");
        
        if (!apiKey.empty()) config.weatherApiKey = apiKey;
        if (!secret.empty()) config.reporterSecret = secret;
        if (!endpoint.empty()) config.chainEndpoint = endpoint;
        if (!mqttHost.empty()) config.mqttHost = mqttHost;
        if (!pollInterval.empty()) {
            config.pollInterval = std::chrono::seconds(toInt("env", "POLL_INTERVAL_SEC", pollInterval));
        }
    }
    
    /**
     * @brief Parse a window spec value: "cumulative" or "rolling:<seconds>"
     * @throws std::runtime_error for anything else
     */
    static WindowSpec parseWindow(const std::string& section, const std::string& key, const std::string& value) {
        WindowSpec spec;
        if (value == "cumulative") {
            spec.mode = WindowSpec::Mode::Cumulative;
            spec.rollingWindowSeconds = 0;
            return spec;
        }
        const std::string prefix = "rolling:";
        if (value.compare(0, prefix.size(), prefix) == 0) {
            spec.mode = WindowSpec::Mode::Rolling;
            spec.rollingWindowSeconds = toInt(section, key, value.substr(prefix.size()));
            return spec;
        }
        throw std::runtime_error("[" + section + "] " + key + ": expected \"cumulative\" or \"rolling:<seconds>\"");
    }

private:
    static void parse(std::istream& input, OracleConfig& config) {
        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            stripComment(line);
            trim(line);
            
            if (line.empty()) {
                continue;
            }
            
            // Handle section headers
            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }
            
            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw std::runtime_error("[" + currentSection + "] malformed line: " + line);
            }
            
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);
            unquote(value);
            
            if (!assign(config, currentSection, key, value)) {
                std::cerr << "[Config] Warning: Unknown key [" << currentSection << "] " << key << std::endl;
            }
        }
    }
    
    static bool assign(OracleConfig& config, const std::string& section, const std::string& key,
                       const std::string& value) {
        if (section == "weather") {
            if (key == "base_url") config.weatherBaseUrl = value;
            else if (key == "api_key") config.weatherApiKey = value;
            else if (key == "history_hours") config.providerHistorySeconds = toInt(section, key, value) * 3600;
            else if (key == "accept_partial_history") config.acceptPartialHistory = toBool(section, key, value);
            else return false;
        } else if (section == "chain") {
            if (key == "endpoint") config.chainEndpoint = value;
            else if (key == "reporter_id") config.reporterId = value;
            else if (key == "reporter_secret") config.reporterSecret = value;
            else return false;
        } else if (section == "mqtt") {
            if (key == "host") config.mqttHost = value;
            else if (key == "port") config.mqttPort = static_cast<int>(toInt(section, key, value));
            else if (key == "client_id") config.mqttClientId = value;
            else if (key == "username") config.mqttUsername = value;
            else if (key == "password") config.mqttPassword = value;
            else if (key == "use_tls") config.mqttUseTls = toBool(section, key, value);
            else if (key == "topic_prefix") config.topicPrefix = value;
            else return false;
        } else if (section == "scheduler") {
            if (key == "poll_interval_sec") config.pollInterval = std::chrono::seconds(toInt(section, key, value));
            else if (key == "worker_threads") config.workerThreads = static_cast<std::size_t>(toInt(section, key, value));
            else if (key == "fetch_overlap_sec") config.fetchOverlapSeconds = toInt(section, key, value);
            else if (key == "fatal_recheck_sec") config.fatalRecheckInterval = std::chrono::seconds(toInt(section, key, value));
            else return false;
        } else if (section == "aggregation") {
            if (key == "bucket_duration_sec") config.bucketDurationSeconds = toInt(section, key, value);
            else if (key == "lookback_buckets") config.lookbackBuckets = toInt(section, key, value);
            else if (key == "max_reading_mm") config.maxReadingTenths = toInt(section, key, value) * 10;
            else if (key == "default_window") config.defaultWindow = parseWindow(section, key, value);
            else if (key.compare(0, 8, "window_v") == 0) {
                const auto version = static_cast<uint32_t>(toInt(section, key, key.substr(8)));
                config.windowByVersion[version] = parseWindow(section, key, value);
            }
            else return false;
        } else if (section == "retry") {
            if (key == "base_delay_ms") config.retryBaseDelay = std::chrono::milliseconds(toInt(section, key, value));
            else if (key == "multiplier") config.retryMultiplier = toDouble(section, key, value);
            else if (key == "max_delay_ms") config.retryMaxDelay = std::chrono::milliseconds(toInt(section, key, value));
            else if (key == "max_attempts") config.retryMaxAttempts = static_cast<int>(toInt(section, key, value));
            else if (key == "failed_retry_sec") config.failedRetryInterval = std::chrono::seconds(toInt(section, key, value));
            else return false;
        } else if (section == "store") {
            if (key == "path") config.storePath = value;
            else return false;
        } else if (section == "http") {
            if (key == "timeout_ms") config.httpTimeout = std::chrono::milliseconds(toInt(section, key, value));
            else return false;
        } else {
            return false;
        }
        return true;
    }
    
    static int64_t toInt(const std::string& section, const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            const long long parsed = std::stoll(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error("[" + section + "] " + key + ": expected an integer, got \"" + value + "\"");
        }
    }
    
    static double toDouble(const std::string& section, const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            const double parsed = std::stod(value, &consumed);
            if (consumed != value.size()) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error("[" + section + "] " + key + ": expected a number, got \"" + value + "\"");
        }
    }
    
    static bool toBool(const std::string& section, const std::string& key, const std::string& value) {
        if (value == "true" || value == "1") return true;
        if (value == "false" || value == "0") return false;
        throw std::runtime_error("[" + section + "] " + key + ": expected true or false, got \"" + value + "\"");
    }
    
    /// Drops a # comment that is not inside a quoted string
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }
    
    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }
    
    /**
     * @brief Remove surrounding quotes from string value
     * @param value String value to unquote (modified in place)
     */
    static void unquote(std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
    }
};

} // namespace rainoracle
