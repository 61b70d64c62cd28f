#include <gtest/gtest.h>
#include "selection_rule.hpp"
#include "test_helpers.hpp"
#include <map>
#include <set>
#include <vector>

using namespace clb;

class SelectionRuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        servers = {
            Server("localhost", 8080),
            Server("localhost", 8081),
            Server("localhost", 8082),
        };
    }

    ServerList servers;
};

TEST_F(SelectionRuleTest, RoundRobinDistribution) {
    RoundRobinRule rule;
    auto candidates = CandidateSet::from(servers);

    std::vector<uint16_t> ports;
    for (int i = 0; i < 9; ++i) {
        auto result = rule.choose(candidates);
        ASSERT_TRUE(result.has_value());
        ports.push_back(result.value().port());
    }

    // Verify round-robin pattern: 8080, 8081, 8082, 8080, 8081, 8082, ...
    EXPECT_EQ(ports[0], 8080);
    EXPECT_EQ(ports[1], 8081);
    EXPECT_EQ(ports[2], 8082);
    EXPECT_EQ(ports[3], 8080);
    EXPECT_EQ(ports[4], 8081);
    EXPECT_EQ(ports[5], 8082);
    EXPECT_EQ(ports[6], 8080);
    EXPECT_EQ(ports[7], 8081);
    EXPECT_EQ(ports[8], 8082);
}

TEST_F(SelectionRuleTest, NoCandidates) {
    CandidateSet empty;

    RoundRobinRule round_robin;
    RandomRule random(1);
    ZoneAvoidanceRule zone_avoidance(0.5, {}, 1);

    for (SelectionRule* rule : std::vector<SelectionRule*>{&round_robin, &random, &zone_avoidance}) {
        auto result = rule->choose(empty);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::NoAvailableServer);
    }
}

TEST_F(SelectionRuleTest, SingleCandidate) {
    RoundRobinRule rule;
    auto candidates = CandidateSet::from({servers[0]});

    for (int i = 0; i < 5; ++i) {
        auto result = rule.choose(candidates);
        ASSERT_TRUE(result.has_value());
        EXPECT_EQ(result.value().port(), 8080);
    }
}

TEST_F(SelectionRuleTest, ResetCounter) {
    RoundRobinRule rule;
    auto candidates = CandidateSet::from(servers);

    // Select a few servers
    ASSERT_TRUE(rule.choose(candidates).has_value());
    ASSERT_TRUE(rule.choose(candidates).has_value());
    ASSERT_TRUE(rule.choose(candidates).has_value());

    // Reset and verify it starts from beginning
    rule.reset();

    auto result = rule.choose(candidates);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().port(), 8080);
}

TEST_F(SelectionRuleTest, RandomReturnsMembers) {
    RandomRule rule(99);
    auto candidates = CandidateSet::from(servers);

    std::set<uint16_t> seen;
    for (int i = 0; i < 200; ++i) {
        auto result = rule.choose(candidates);
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(test::contains(servers, result.value()));
        seen.insert(result.value().port());
    }
    EXPECT_EQ(seen.size(), 3u);
}

TEST(RandomSourceTest, SameSeedSameSequence) {
    RandomSource first(12345);
    RandomSource second(12345);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(first.next(), second.next());
    }
}

TEST(RandomSourceTest, BelowStaysInRange) {
    RandomSource random(3);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(random.below(7), 7u);
    }
    EXPECT_EQ(random.below(0), 0u);
}

class ZoneAvoidanceRuleTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < 4; ++i) {
            zone_a.emplace_back("a" + std::to_string(i), 8080, "zone-a");
            zone_b.emplace_back("b" + std::to_string(i), 8080, "zone-b");
        }
    }

    static std::map<std::string, int> pick_counts(SelectionRule& rule, const CandidateSet& candidates,
                                                   int draws) {
        std::map<std::string, int> counts;
        for (int i = 0; i < draws; ++i) {
            auto result = rule.choose(candidates);
            EXPECT_TRUE(result.has_value());
            if (result.has_value()) {
                EXPECT_TRUE(test::contains(candidates.servers, result.value()));
                ++counts[result.value().zone()];
            }
        }
        return counts;
    }

    ServerList zone_a;
    ServerList zone_b;
};

TEST_F(ZoneAvoidanceRuleTest, HealthyZonesBothServed) {
    ServerList all = zone_a;
    all.insert(all.end(), zone_b.begin(), zone_b.end());
    ZoneAvoidanceRule rule(0.5, {}, 11);

    auto counts = pick_counts(rule, CandidateSet::from(all), 400);
    EXPECT_GT(counts["zone-a"], 0);
    EXPECT_GT(counts["zone-b"], 0);
}

TEST_F(ZoneAvoidanceRuleTest, DegradedZoneIsAvoided) {
    // zone-a fully reachable, zone-b has one of four servers left
    CandidateSet candidates;
    candidates.servers = zone_a;
    candidates.servers.push_back(zone_b[0]);
    candidates.zones["zone-a"] = ZoneStats{4, 4};
    candidates.zones["zone-b"] = ZoneStats{4, 1};

    ZoneAvoidanceRule rule(0.5, {}, 11);
    auto counts = pick_counts(rule, candidates, 400);

    EXPECT_EQ(counts["zone-a"], 400);
    EXPECT_EQ(counts["zone-b"], 0);
}

TEST_F(ZoneAvoidanceRuleTest, ThresholdControlsTolerance) {
    CandidateSet candidates;
    candidates.servers = zone_a;
    candidates.servers.push_back(zone_b[0]);
    candidates.servers.push_back(zone_b[1]);
    candidates.zones["zone-a"] = ZoneStats{4, 4};
    candidates.zones["zone-b"] = ZoneStats{4, 2};

    // zone-b scores 0.5 of the best zone: kept at 0.5, dropped at 0.6
    ZoneAvoidanceRule lenient(0.5, {}, 5);
    EXPECT_GT(pick_counts(lenient, candidates, 400)["zone-b"], 0);

    ZoneAvoidanceRule strict(0.6, {}, 5);
    EXPECT_EQ(pick_counts(strict, candidates, 400)["zone-b"], 0);
}

TEST_F(ZoneAvoidanceRuleTest, ZeroWeightZoneIsExcluded) {
    ServerList all = zone_a;
    all.insert(all.end(), zone_b.begin(), zone_b.end());
    ZoneAvoidanceRule rule(0.1, {{"zone-b", 0.0}}, 3);

    auto counts = pick_counts(rule, CandidateSet::from(all), 200);
    EXPECT_EQ(counts["zone-a"], 200);
}

TEST_F(ZoneAvoidanceRuleTest, AllZonesBlackedOutStillPicksCandidate) {
    ServerList all = {zone_a[0], zone_b[0]};
    ZoneAvoidanceRule rule(0.5, {{"zone-a", 0.0}, {"zone-b", 0.0}}, 3);

    auto counts = pick_counts(rule, CandidateSet::from(all), 100);
    EXPECT_EQ(counts["zone-a"] + counts["zone-b"], 100);
}

TEST_F(ZoneAvoidanceRuleTest, SingleZoneUniformOverAllServers) {
    ZoneAvoidanceRule rule(0.5, {}, 21);
    auto candidates = CandidateSet::from(zone_a);

    std::set<std::string> hosts;
    for (int i = 0; i < 200; ++i) {
        auto result = rule.choose(candidates);
        ASSERT_TRUE(result.has_value());
        hosts.insert(result.value().host());
    }
    EXPECT_EQ(hosts.size(), 4u);
}

TEST_F(ZoneAvoidanceRuleTest, MissingZoneStatsTreatedAsReachable) {
    CandidateSet candidates;
    candidates.servers = {zone_a[0], zone_b[0]};

    ZoneAvoidanceRule rule(0.9, {}, 8);
    auto counts = pick_counts(rule, candidates, 200);
    EXPECT_GT(counts["zone-a"], 0);
    EXPECT_GT(counts["zone-b"], 0);
}

TEST_F(ZoneAvoidanceRuleTest, SameSeedSameChoices) {
    ServerList all = zone_a;
    all.insert(all.end(), zone_b.begin(), zone_b.end());
    auto candidates = CandidateSet::from(all);

    ZoneAvoidanceRule first(0.5, {}, 42);
    ZoneAvoidanceRule second(0.5, {}, 42);
    for (int i = 0; i < 50; ++i) {
        auto x = first.choose(candidates);
        auto y = second.choose(candidates);
        ASSERT_TRUE(x.has_value());
        ASSERT_TRUE(y.has_value());
        EXPECT_EQ(x.value().id(), y.value().id());
    }
}

TEST(SelectionRuleFactoryTest, ZoneAvoidanceRequiresThreshold) {
    RuleConfig config;
    auto missing = make_rule(config);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::InvalidConfiguration);

    config.availability_threshold = 1.5;
    auto out_of_range = make_rule(config);
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::InvalidConfiguration);

    config.availability_threshold = 0.5;
    config.zone_weights["zone-a"] = -1.0;
    auto negative_weight = make_rule(config);
    ASSERT_FALSE(negative_weight.has_value());

    config.zone_weights["zone-a"] = 2.0;
    auto valid = make_rule(config);
    ASSERT_TRUE(valid.has_value());
    auto* rule = dynamic_cast<ZoneAvoidanceRule*>(valid.value().get());
    ASSERT_NE(rule, nullptr);
    EXPECT_DOUBLE_EQ(rule->availability_threshold(), 0.5);
}

TEST(SelectionRuleFactoryTest, BuildsOtherPolicies) {
    RuleConfig config;
    config.policy = "round-robin";
    auto round_robin = make_rule(config);
    ASSERT_TRUE(round_robin.has_value());
    EXPECT_NE(dynamic_cast<RoundRobinRule*>(round_robin.value().get()), nullptr);

    config.policy = "random";
    auto random = make_rule(config);
    ASSERT_TRUE(random.has_value());
    EXPECT_NE(dynamic_cast<RandomRule*>(random.value().get()), nullptr);

    config.policy = "least-connections";
    auto unknown = make_rule(config);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ErrorCode::InvalidConfiguration);
}
