/**
 * @file main_cli.cpp
 * @brief Command-line entry point for the rainfall oracle service
 *
 * Loads configuration (TOML file, then environment), wires the adapters into
 * the domain core and runs the monitoring loop until SIGINT/SIGTERM.
 */

#include "TomlConfig.hpp"
#include "IClock.hpp"
#include "Log.hpp"
#include "OracleError.hpp"
#include "BeastHttpClient.hpp"
#include "PahoMqttClient.hpp"
#include "ReportSigner.hpp"
#include "adapters/AccuWeatherProvider.hpp"
#include "adapters/ExponentialBackoff.hpp"
#include "adapters/JsonFileSubmissionStore.hpp"
#include "adapters/JsonRpcChainClient.hpp"
#include "adapters/MqttPolicyEventSource.hpp"
#include "adapters/MqttTransportAdapter.hpp"
#include "domain/EventBus.hpp"
#include "domain/OracleScheduler.hpp"
#include "domain/StatusReporter.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

using namespace rainoracle;

/// Scheduler to stop when a shutdown signal arrives
static std::atomic<domain::OracleScheduler*> g_scheduler{nullptr};
static volatile std::sig_atomic_t g_signalled = 0;

/**
 * @brief Signal handler for graceful shutdown
 * @note Only sets flags; the watcher thread performs the stop
 */
void signalHandler(int signal) {
    g_signalled = signal;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>    Configuration file (default: rainoracle.toml)\n"
              << "  --once             Run a single monitoring pass and exit\n"
              << "  --help             Show this help message\n"
              << "\nEnvironment overrides:\n"
              << "  ACCUWEATHER_API_KEY, ORACLE_REPORTER_SECRET, CHAIN_ENDPOINT,\n"
              << "  MQTT_HOST, POLL_INTERVAL_SEC\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [chain]\n"
              << "  endpoint = \"http://127.0.0.1:9933\"\n"
              << "  reporter_id = \"oracle-1\"\n"
              << "  [scheduler]\n"
              << "  poll_interval_sec = 300\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter for Windows
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    
    bool once = false;
    std::string configFile = "rainoracle.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file name" << std::endl;
                return 1;
            }
            configFile = argv[++i];
        } else if (arg == "--once") {
            once = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }
    
    OracleConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvOverrides(config, safeGetEnv);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: Invalid configuration in " << configFile << ": " << e.what() << std::endl;
        return 1;
    }
    
    const auto problems = config.validate();
    if (!problems.empty()) {
        std::cerr << "Error: Configuration is incomplete:" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return 1;
    }
    
    LogLine("Main") << "Starting rainfall oracle (reporter " << config.reporterId << ", chain "
                    << config.chainEndpoint << ")";
    
    try {
        auto clock = std::make_shared<SystemClock>();
        auto http = std::make_shared<BeastHttpClient>();
        auto eventBus = std::make_shared<domain::EventBus>();
        auto retryPolicy = std::make_shared<adapters::ExponentialBackoffRetryPolicy>(
            config.retryBaseDelay, config.retryMultiplier, config.retryMaxDelay, config.retryMaxAttempts);
        
        auto weather = std::make_shared<adapters::AccuWeatherProvider>(
            http, clock, config.weatherBaseUrl, config.weatherApiKey,
            config.providerHistorySeconds, config.httpTimeout);
        auto chain = std::make_shared<adapters::JsonRpcChainClient>(http, config.chainEndpoint, config.httpTimeout);
        auto store = std::make_shared<adapters::JsonFileSubmissionStore>(config.storePath);
        auto signer = std::make_shared<ReportSigner>(config.reporterId, config.reporterSecret);
        
        auto registry = std::make_shared<domain::PolicyRegistry>(chain);
        auto resolver = std::make_shared<domain::LocationResolver>(weather);
        auto aggregator = std::make_shared<domain::RainfallAggregator>(
            config.bucketDurationSeconds, config.lookbackBuckets, config.maxReadingTenths);
        auto submitter = std::make_shared<domain::ReportSubmitter>(
            chain, store, signer, clock, retryPolicy, eventBus, config.failedRetryInterval);
        
        std::shared_ptr<ports::ITransport> transport;
        std::shared_ptr<adapters::MqttPolicyEventSource> eventSource;
        std::shared_ptr<domain::StatusReporter> statusReporter;
        
        if (config.hasMqtt()) {
            auto mqttClient = std::make_shared<PahoMqttClient>();
            transport = std::make_shared<adapters::MqttTransportAdapter>(mqttClient);
            
            eventSource = std::make_shared<adapters::MqttPolicyEventSource>(transport, registry, config.topicPrefix);
            statusReporter = std::make_shared<domain::StatusReporter>(transport, eventBus, retryPolicy,
                                                                      config.topicPrefix);
            eventSource->start();
            statusReporter->start();
            
            ports::Credentials credentials;
            credentials.host = config.mqttHost;
            credentials.port = config.mqttPort;
            credentials.clientId = config.mqttClientId;
            credentials.username = config.mqttUsername;
            credentials.password = config.mqttPassword;
            credentials.useTls = config.mqttUseTls;
            credentials.offlineTopic = statusReporter->statusTopic();
            credentials.offlinePayload = domain::StatusReporter::offlinePayload(config.reporterId);
            if (!transport->connect(credentials)) {
                LogLine("Main", LogLine::Warn) << "MQTT connect to " << config.mqttHost
                                               << " failed; continuing with periodic reconciliation only";
            }
        } else {
            LogLine("Main") << "No MQTT broker configured; chain events and operator feed disabled";
        }
        
        domain::OracleScheduler::Dependencies deps;
        deps.clock = clock;
        deps.registry = registry;
        deps.resolver = resolver;
        deps.weather = weather;
        deps.aggregator = aggregator;
        deps.submitter = submitter;
        deps.store = store;
        deps.chain = chain;
        deps.eventBus = eventBus;
        if (eventSource) {
            deps.applyChainEvents = [eventSource]() { return eventSource->applyPending(); };
        }
        if (statusReporter) {
            deps.afterPass = [statusReporter]() { statusReporter->processEvents(); };
        }
        
        domain::OracleScheduler scheduler(config, std::move(deps));
        
        if (once) {
            const auto summary = scheduler.runPass();
            if (transport) {
                // Give queued feed messages a moment to leave
                std::this_thread::sleep_for(std::chrono::seconds(1));
                transport->disconnect();
            }
            return summary.chainVerified ? 0 : 2;
        }
        
        g_scheduler = &scheduler;
        std::atomic<bool> done{false};
        std::thread signalWatcher([&done]() {
            while (!done) {
                if (g_signalled != 0) {
                    LogLine("Main") << "Received signal " << static_cast<int>(g_signalled) << ", shutting down...";
                    if (auto* active = g_scheduler.load()) {
                        active->stop();
                    }
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });
        
        scheduler.run();
        
        done = true;
        signalWatcher.join();
        g_scheduler = nullptr;
        
        if (statusReporter) {
            statusReporter->stop();
        }
        if (transport) {
            transport->disconnect();
        }
    } catch (const OracleError& e) {
        LogLine("Main", LogLine::Error) << "Startup failed (" << errorKindToString(e.kind()) << "): " << e.what();
        return 1;
    } catch (const std::invalid_argument& e) {
        LogLine("Main", LogLine::Error) << "Startup failed: " << e.what();
        return 1;
    }
    
    LogLine("Main") << "Rainfall oracle stopped.";
    return 0;
}
