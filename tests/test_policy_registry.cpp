#include <gtest/gtest.h>
#include "../core/domain/PolicyRegistry.hpp"
#include "../core/domain/LocationResolver.hpp"
#include "../core/sim/MockChainClient.hpp"
#include "../core/sim/MockWeatherProvider.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rainoracle;

namespace {

Policy makePolicy(const std::string& id, PolicyStatus status = PolicyStatus::Active) {
    Policy policy;
    policy.policyId = id;
    policy.location = {-1.2921, 36.8219, ""};
    policy.coverageStart = 1700000000;
    policy.coverageEnd = 1700000000 + 30 * 86400;
    policy.threshold = 500;
    policy.status = status;
    return policy;
}

} // namespace

class PolicyRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        chain_ = std::make_shared<sim::MockChainClient>();
        registry_ = std::make_shared<domain::PolicyRegistry>(chain_);
    }

    std::shared_ptr<sim::MockChainClient> chain_;
    std::shared_ptr<domain::PolicyRegistry> registry_;
};

TEST_F(PolicyRegistryTest, ReconcileReportsAddedPolicies) {
    chain_->addPolicy(makePolicy("2"));
    chain_->addPolicy(makePolicy("1"));

    auto report = registry_->reconcile();

    EXPECT_EQ(report.added.size(), 2u);
    auto active = registry_->activePolicies();
    ASSERT_EQ(active.size(), 2u);
    EXPECT_EQ(active[0].policyId, "1");
    EXPECT_TRUE(registry_->reconcile().empty());
}

TEST_F(PolicyRegistryTest, NeverReturnsSettledPolicies) {
    chain_->addPolicy(makePolicy("1"));
    chain_->addPolicy(makePolicy("2", PolicyStatus::Settled));

    auto report = registry_->reconcile();

    EXPECT_EQ(report.settled, std::vector<PolicyId>{"2"});
    EXPECT_FALSE(registry_->find("2").has_value());
    EXPECT_TRUE(registry_->isSettled("2"));
    EXPECT_EQ(registry_->activePolicies().size(), 1u);
}

TEST_F(PolicyRegistryTest, SettledPolicyCannotBeResurrected) {
    chain_->addPolicy(makePolicy("1"));
    registry_->reconcile();

    domain::PolicyEvent settled;
    settled.type = domain::PolicyEvent::Type::Settled;
    settled.policyId = "1";
    registry_->applyEvent(settled);

    // A stale creation event and a stale full read both arrive afterwards
    domain::PolicyEvent created;
    created.type = domain::PolicyEvent::Type::Created;
    created.policyId = "1";
    created.policy = makePolicy("1");
    registry_->applyEvent(created);
    auto report = registry_->reconcile();

    EXPECT_EQ(report.settled, std::vector<PolicyId>{"1"});
    EXPECT_TRUE(report.added.empty());
    EXPECT_TRUE(registry_->activePolicies().empty());
}

TEST_F(PolicyRegistryTest, StatusDriftIsReported) {
    chain_->addPolicy(makePolicy("1"));
    chain_->addPolicy(makePolicy("2"));
    registry_->reconcile();

    chain_->setStatus("1", PolicyStatus::Triggered);
    chain_->setStatus("2", PolicyStatus::Matured);
    domain::PolicyEvent changed;
    changed.type = domain::PolicyEvent::Type::StatusChanged;
    changed.policyId = "2";
    changed.status = PolicyStatus::Matured;
    registry_->applyEvent(changed);

    auto report = registry_->reconcile();

    EXPECT_EQ(report.drifted.size(), 2u);
    EXPECT_EQ(registry_->find("1")->status, PolicyStatus::Triggered);
    EXPECT_TRUE(registry_->activePolicies().empty());

    auto counts = registry_->countByStatus();
    EXPECT_EQ(counts[PolicyStatus::Triggered], 1u);
    EXPECT_EQ(counts[PolicyStatus::Matured], 1u);
    EXPECT_EQ(counts[PolicyStatus::Active], 0u);
}

TEST_F(PolicyRegistryTest, ResolvedProviderKeySurvivesReconcile) {
    chain_->addPolicy(makePolicy("1"));
    registry_->reconcile();
    registry_->setProviderKey("1", "224758");

    registry_->reconcile();

    EXPECT_EQ(registry_->find("1")->location.providerKey, "224758");
}

TEST_F(PolicyRegistryTest, ChainFailureKeepsCachedView) {
    chain_->addPolicy(makePolicy("1"));
    registry_->reconcile();
    chain_->setListFailure(true);

    EXPECT_THROW(registry_->reconcile(), OracleError);
    EXPECT_EQ(registry_->activePolicies().size(), 1u);
}

TEST_F(PolicyRegistryTest, FatalPoliciesAreExcludedUntilRecheck) {
    chain_->addPolicy(makePolicy("1"));
    registry_->reconcile();

    registry_->markFatal("1", "location not found", 1000);
    EXPECT_TRUE(registry_->activePolicies().empty());
    ASSERT_EQ(registry_->fatalPolicies().size(), 1u);
    EXPECT_EQ(registry_->fatalPolicies()[0].reason, "location not found");

    EXPECT_TRUE(registry_->releaseFatalDue(1000 + 3599, 3600).empty());
    EXPECT_EQ(registry_->releaseFatalDue(1000 + 3600, 3600), std::vector<PolicyId>{"1"});
    EXPECT_FALSE(registry_->isFatal("1"));
    EXPECT_EQ(registry_->activePolicies().size(), 1u);
}

TEST(LocationResolverTest, CachesByRoundedCoordinates) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    auto weather = std::make_shared<sim::MockWeatherProvider>(clock);
    weather->setLocation(-1.2921, 36.8219, "224758");
    domain::LocationResolver resolver(weather);

    EXPECT_EQ(resolver.resolve(-1.2921, 36.8219), "224758");
    EXPECT_EQ(resolver.resolve(-1.292100004, 36.821899996), "224758");
    EXPECT_EQ(weather->lookupCalls(), 1u);
    EXPECT_EQ(resolver.cacheSize(), 1u);
}

TEST(LocationResolverTest, PreResolvedKeyBypassesProvider) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    auto weather = std::make_shared<sim::MockWeatherProvider>(clock);
    domain::LocationResolver resolver(weather);

    auto policy = makePolicy("1");
    policy.location.providerKey = "999";
    EXPECT_EQ(resolver.resolveFor(policy), "999");
    EXPECT_EQ(weather->lookupCalls(), 0u);
}

TEST(LocationResolverTest, UnknownLocationIsNotCached) {
    auto clock = std::make_shared<sim::SimulatedClock>();
    auto weather = std::make_shared<sim::MockWeatherProvider>(clock);
    domain::LocationResolver resolver(weather);

    EXPECT_THROW(resolver.resolve(10.0, 10.0), LocationNotFound);
    EXPECT_THROW(resolver.resolve(10.0, 10.0), LocationNotFound);
    EXPECT_EQ(weather->lookupCalls(), 2u);
    EXPECT_EQ(resolver.cacheSize(), 0u);
}
