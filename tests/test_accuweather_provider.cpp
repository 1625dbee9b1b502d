#include <gtest/gtest.h>
#include "../core/OracleError.hpp"
#include "../core/adapters/AccuWeatherProvider.hpp"
#include "../core/sim/MockHttpClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rainoracle;

namespace {

constexpr int64_t kNow = 1700000000;

std::string observation(int64_t epoch, double pastHourMm) {
    return R"({"EpochTime":)" + std::to_string(epoch) +
           R"(,"PrecipitationSummary":{"PastHour":{"Metric":{"Value":)" + std::to_string(pastHourMm) +
           R"(,"Unit":"mm"}}}})";
}

} // namespace

class AccuWeatherProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(kNow);
        http_ = std::make_shared<sim::MockHttpClient>();
        provider_ = std::make_shared<adapters::AccuWeatherProvider>(
            http_, clock_, "https://dataservice.accuweather.com/", "secret-key", 24 * 3600);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockHttpClient> http_;
    std::shared_ptr<adapters::AccuWeatherProvider> provider_;
};

TEST_F(AccuWeatherProviderTest, ParsesPastHourPrecipitationAscending) {
    http_->respond("/historical/24", 200,
                   "[" + observation(kNow - 600, 1.25) + "," + observation(kNow - 4200, 0.0) + "," +
                   observation(kNow - 7800, 12.3) + "]");

    auto readings = provider_->fetchPrecipitation("224758", kNow - 6 * 3600, kNow);

    ASSERT_EQ(readings.size(), 3u);
    EXPECT_EQ(readings[0].timestamp, kNow - 7800);
    EXPECT_EQ(readings[0].precipitation, 123);
    EXPECT_EQ(readings[2].precipitation, 13);   // 1.25 mm rounds to 13 tenths

    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url,
              "https://dataservice.accuweather.com/currentconditions/v1/224758/historical/24"
              "?apikey=secret-key&details=true");
}

TEST_F(AccuWeatherProviderTest, FiltersToRequestedWindowAndSkipsMissingValues) {
    http_->respond("/historical/24", 200,
                   "[" + observation(kNow - 600, 2.0) + R"(,{"EpochTime":)" + std::to_string(kNow - 1200) +
                   "}," + observation(kNow - 20000, 5.0) + "]");

    auto readings = provider_->fetchPrecipitation("224758", kNow - 3600, kNow);

    ASSERT_EQ(readings.size(), 1u);
    EXPECT_EQ(readings[0].precipitation, 20);
}

TEST_F(AccuWeatherProviderTest, WindowBeyondServedHistoryIsDataUnavailable) {
    try {
        provider_->fetchPrecipitation("224758", kNow - 30 * 3600, kNow);
        FAIL() << "expected DataUnavailableError";
    } catch (const DataUnavailableError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DataUnavailable);
        EXPECT_EQ(e.servedStart(), kNow - 24 * 3600);
        EXPECT_EQ(e.servedEnd(), kNow);
    }
    EXPECT_EQ(http_->requestCount(), 0u);
}

TEST_F(AccuWeatherProviderTest, EmptyWindowMakesNoRequest) {
    EXPECT_TRUE(provider_->fetchPrecipitation("224758", kNow, kNow).empty());
    EXPECT_EQ(http_->requestCount(), 0u);
}

TEST_F(AccuWeatherProviderTest, ClassifiesHttpFailures) {
    auto kindFor = [this](int status) {
        http_->reset();
        http_->respond("/historical/24", status, "{}");
        try {
            provider_->fetchPrecipitation("224758", kNow - 3600, kNow);
        } catch (const OracleError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "status " << status << " did not throw";
        return ErrorKind::StaleReading;
    };

    EXPECT_EQ(kindFor(401), ErrorKind::Fatal);
    EXPECT_EQ(kindFor(403), ErrorKind::Fatal);
    EXPECT_EQ(kindFor(404), ErrorKind::Fatal);
    EXPECT_EQ(kindFor(429), ErrorKind::Retryable);
    EXPECT_EQ(kindFor(503), ErrorKind::Retryable);
    EXPECT_EQ(kindFor(400), ErrorKind::Fatal);
}

TEST_F(AccuWeatherProviderTest, MalformedBodyIsRetryable) {
    http_->respond("/historical/24", 200, "<html>maintenance</html>");
    try {
        provider_->fetchPrecipitation("224758", kNow - 3600, kNow);
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
}

TEST_F(AccuWeatherProviderTest, TransportFailurePropagatesAsRetryable) {
    http_->failTransport("/historical/24");
    try {
        provider_->fetchPrecipitation("224758", kNow - 3600, kNow);
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
}

TEST_F(AccuWeatherProviderTest, MissingApiKeyIsFatal) {
    adapters::AccuWeatherProvider unconfigured(http_, clock_, "https://dataservice.accuweather.com", "");
    try {
        unconfigured.lookupLocationKey(1.0, 2.0);
        FAIL() << "expected OracleError";
    } catch (const OracleError& e) {
        EXPECT_TRUE(e.isFatal());
    }
    EXPECT_EQ(http_->requestCount(), 0u);
}

TEST_F(AccuWeatherProviderTest, GeopositionLookupReturnsKey) {
    http_->respond("/geoposition/search", 200, R"({"Key":"224758","LocalizedName":"Nairobi"})");

    EXPECT_EQ(provider_->lookupLocationKey(-1.29207, 36.82196), "224758");
    EXPECT_EQ(http_->requestCount("q=-1.2921%2C36.8220"), 1u);
}

TEST_F(AccuWeatherProviderTest, GeopositionWithoutMatchIsLocationNotFound) {
    http_->respond("/geoposition/search", 200, "null");
    EXPECT_THROW(provider_->lookupLocationKey(0.0, -160.0), LocationNotFound);

    http_->reset();
    http_->respond("/geoposition/search", 200, "[]");
    EXPECT_THROW(provider_->lookupLocationKey(0.0, -160.0), LocationNotFound);

    http_->reset();
    EXPECT_THROW(provider_->lookupLocationKey(0.0, -160.0), LocationNotFound);   // unmatched route is 404
}

TEST(AccuWeatherConversionTest, MillimetresToTenths) {
    EXPECT_EQ(adapters::AccuWeatherProvider::toTenths(0.0), 0);
    EXPECT_EQ(adapters::AccuWeatherProvider::toTenths(0.04), 0);
    EXPECT_EQ(adapters::AccuWeatherProvider::toTenths(0.05), 1);
    EXPECT_EQ(adapters::AccuWeatherProvider::toTenths(25.4), 254);
}
