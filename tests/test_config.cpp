#include <gtest/gtest.h>
#include "../platform/desktop/TomlConfig.hpp"
#include "../net/http/BeastHttpClient.hpp"
#include "../core/OracleError.hpp"
#include <map>

using namespace rainoracle;

TEST(TomlConfigTest, ParsesAllSections) {
    auto config = TomlConfig::loadFromString(R"(
# Oracle configuration
[weather]
base_url = "https://dataservice.accuweather.com"
history_hours = 48
accept_partial_history = false

[chain]
endpoint = "http://10.0.0.5:9933"   # node RPC
reporter_id = "oracle-2"

[mqtt]
host = "broker.local"
port = 8883
use_tls = true
topic_prefix = "insurance/oracle"

[scheduler]
poll_interval_sec = 600
worker_threads = 8
fatal_recheck_sec = 7200

[aggregation]
bucket_duration_sec = 1800
lookback_buckets = 96
max_reading_mm = 500
default_window = "rolling:86400"
window_v3 = "cumulative"

[retry]
base_delay_ms = 1000
multiplier = 1.5
max_attempts = 5
failed_retry_sec = 900

[store]
path = "/var/lib/rainoracle/submissions.json"

[http]
timeout_ms = 4000
)");

    EXPECT_EQ(config.providerHistorySeconds, 48 * 3600);
    EXPECT_FALSE(config.acceptPartialHistory);
    EXPECT_EQ(config.chainEndpoint, "http://10.0.0.5:9933");
    EXPECT_EQ(config.reporterId, "oracle-2");
    EXPECT_EQ(config.mqttPort, 8883);
    EXPECT_TRUE(config.mqttUseTls);
    EXPECT_EQ(config.topicPrefix, "insurance/oracle");
    EXPECT_EQ(config.pollInterval.count(), 600);
    EXPECT_EQ(config.workerThreads, 8u);
    EXPECT_EQ(config.bucketDurationSeconds, 1800);
    EXPECT_EQ(config.maxReadingTenths, 5000);
    EXPECT_EQ(config.defaultWindow.mode, WindowSpec::Mode::Rolling);
    EXPECT_EQ(config.windowFor(3).mode, WindowSpec::Mode::Cumulative);
    EXPECT_EQ(config.windowFor(1).rollingWindowSeconds, 24 * 3600);
    EXPECT_EQ(config.windowFor(9).rollingWindowSeconds, 86400);
    EXPECT_DOUBLE_EQ(config.retryMultiplier, 1.5);
    EXPECT_EQ(config.retryMaxAttempts, 5);
    EXPECT_EQ(config.failedRetryInterval.count(), 900);
    EXPECT_EQ(config.storePath, "/var/lib/rainoracle/submissions.json");
    EXPECT_EQ(config.httpTimeout.count(), 4000);
    EXPECT_TRUE(config.hasMqtt());
}

TEST(TomlConfigTest, MalformedValuesNameTheKey) {
    try {
        TomlConfig::loadFromString("[scheduler]\npoll_interval_sec = soon\n");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("poll_interval_sec"), std::string::npos);
    }

    EXPECT_THROW(TomlConfig::loadFromString("[mqtt]\nuse_tls = maybe\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[aggregation]\ndefault_window = \"hourly\"\n"), std::runtime_error);
    EXPECT_THROW(TomlConfig::loadFromString("[chain]\nendpoint\n"), std::runtime_error);
}

TEST(TomlConfigTest, HashInsideQuotesIsKept) {
    auto config = TomlConfig::loadFromString("[mqtt]\npassword = \"p#ss\" # comment\n");
    EXPECT_EQ(config.mqttPassword, "p#ss");
}

TEST(TomlConfigTest, EnvironmentOverridesFile) {
    auto config = TomlConfig::loadFromString("[chain]\nendpoint = \"http://file:9933\"\n");
    std::map<std::string, std::string> env = {
        {"ACCUWEATHER_API_KEY", "env-key"},
        {"ORACLE_REPORTER_SECRET", "env-secret"},
        {"CHAIN_ENDPOINT", "http://env:9933"},
        {"POLL_INTERVAL_SEC", "60"}
    };

    TomlConfig::applyEnvOverrides(config, [&env](const char* name) {
        auto it = env.find(name);
        return it != env.end() ? it->second : std::string();
    });

    EXPECT_EQ(config.weatherApiKey, "env-key");
    EXPECT_EQ(config.reporterSecret, "env-secret");
    EXPECT_EQ(config.chainEndpoint, "http://env:9933");
    EXPECT_EQ(config.pollInterval.count(), 60);
    EXPECT_FALSE(config.hasMqtt());
}

TEST(TomlConfigTest, ValidateListsMissingSecretsAndBadGeometry) {
    OracleConfig config;
    config.workerThreads = 0;
    config.windowByVersion[4] = WindowSpec{WindowSpec::Mode::Rolling, 60};

    auto problems = config.validate();

    EXPECT_EQ(problems.size(), 4u);

    config.weatherApiKey = "k";
    config.reporterSecret = "s";
    config.workerThreads = 2;
    config.windowByVersion.erase(4);
    EXPECT_TRUE(config.validate().empty());
}

TEST(BeastHttpClientUrlTest, SplitsUrlParts) {
    auto url = BeastHttpClient::parseUrl("https://dataservice.accuweather.com/locations/v1?q=1,2");
    EXPECT_EQ(url.scheme, "https");
    EXPECT_EQ(url.host, "dataservice.accuweather.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.target, "/locations/v1?q=1,2");

    auto rpc = BeastHttpClient::parseUrl("HTTP://127.0.0.1:9933");
    EXPECT_EQ(rpc.scheme, "http");
    EXPECT_EQ(rpc.port, "9933");
    EXPECT_EQ(rpc.target, "/");
}

TEST(BeastHttpClientUrlTest, RejectsMalformedUrls) {
    EXPECT_THROW(BeastHttpClient::parseUrl("dataservice.accuweather.com"), OracleError);
    EXPECT_THROW(BeastHttpClient::parseUrl("ftp://host/file"), OracleError);
    EXPECT_THROW(BeastHttpClient::parseUrl("http://host:port/"), OracleError);
    EXPECT_THROW(BeastHttpClient::parseUrl("http:///path"), OracleError);
}
