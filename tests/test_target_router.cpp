#include <gtest/gtest.h>
#include <trafficgen/config.hpp>
#include <trafficgen/target_router.hpp>

#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace trafficgen;

namespace {

Target make_target(const std::string &name, int weight = 1,
                   bool enabled = true) {
  Target t;
  t.name = name;
  t.url = "https://" + name + ".example.com/matomo.php";
  t.site_id = 1;
  t.weight = weight;
  t.enabled = enabled;
  return t;
}

std::map<std::string, int> draw(TargetRouter &r, int n) {
  std::map<std::string, int> counts;
  for (int i = 0; i < n; ++i)
    ++counts[r.next_target().name];
  return counts;
}

} // namespace

TEST(TargetMetrics, StartsUnknown) {
  TargetMetrics m("a");
  const auto s = m.snapshot();
  EXPECT_EQ(s.total_requests, 0u);
  EXPECT_EQ(s.status(), HealthStatus::Unknown);
  EXPECT_FALSE(s.avg_latency_ms().has_value());
  EXPECT_DOUBLE_EQ(s.success_rate(), 0.0);
}

TEST(TargetMetrics, LatencyAveragesSuccessesOnly) {
  TargetMetrics m("a");
  m.record_success(100);
  m.record_success(300);
  m.record_failure("timeout");
  const auto s = m.snapshot();
  EXPECT_EQ(s.total_requests, 3u);
  EXPECT_EQ(s.failed_requests, 1u);
  ASSERT_TRUE(s.avg_latency_ms().has_value());
  EXPECT_DOUBLE_EQ(*s.avg_latency_ms(), 200.0);
  EXPECT_EQ(s.last_error.value_or(""), "timeout");
  EXPECT_TRUE(s.last_success.has_value());
  EXPECT_TRUE(s.last_failure.has_value());
}

TEST(TargetMetrics, StatusThresholds) {
  TargetMetrics m("a");
  for (int i = 0; i < 19; ++i)
    m.record_success(10);
  m.record_failure("x");
  EXPECT_EQ(m.snapshot().status(), HealthStatus::Healthy); // 95%

  for (int i = 0; i < 5; ++i)
    m.record_failure("x");
  EXPECT_EQ(m.snapshot().status(), HealthStatus::Degraded); // 19/25

  for (int i = 0; i < 10; ++i)
    m.record_failure("x");
  EXPECT_EQ(m.snapshot().status(), HealthStatus::Failed); // 19/35
}

TEST(TargetMetrics, SingleSuccessIsHealthy) {
  TargetMetrics m("a");
  m.record_success(5);
  EXPECT_EQ(m.snapshot().status(), HealthStatus::Healthy);
}

TEST(TargetRouter, RequiresEnabledTarget) {
  Random rng(1);
  EXPECT_THROW(TargetRouter({make_target("a", 1, false)},
                            DistributionStrategy::RoundRobin, rng),
               std::invalid_argument);
  EXPECT_THROW(TargetRouter({}, DistributionStrategy::Random, rng),
               std::invalid_argument);
}

TEST(TargetRouter, RejectsDuplicateNames) {
  Random rng(1);
  EXPECT_THROW(TargetRouter({make_target("a"), make_target("a")},
                            DistributionStrategy::RoundRobin, rng),
               std::invalid_argument);
}

TEST(TargetRouter, FiltersDisabledTargets) {
  Random rng(1);
  TargetRouter r({make_target("a"), make_target("b", 1, false),
                  make_target("c")},
                 DistributionStrategy::RoundRobin, rng);
  EXPECT_EQ(r.all_targets().size(), 3u);
  ASSERT_EQ(r.enabled_targets().size(), 2u);
  for (int i = 0; i < 10; ++i)
    EXPECT_NE(r.next_target().name, "b");
}

TEST(TargetRouter, RoundRobinIsExactCycle) {
  Random rng(1);
  TargetRouter r({make_target("a"), make_target("b"), make_target("c")},
                 DistributionStrategy::RoundRobin, rng);
  const char *expected[] = {"a", "b", "c"};
  for (int i = 0; i < 30; ++i)
    EXPECT_EQ(r.next_target().name, expected[i % 3]);
}

TEST(TargetRouter, FreshRoundRobinRoutersAgree) {
  Random rng1(1), rng2(2);
  std::vector<Target> ts{make_target("x"), make_target("y")};
  TargetRouter r1(ts, DistributionStrategy::RoundRobin, rng1);
  TargetRouter r2(ts, DistributionStrategy::RoundRobin, rng2);
  for (int i = 0; i < 10; ++i)
    EXPECT_EQ(r1.next_target().name, r2.next_target().name);
}

TEST(TargetRouter, WeightedFollowsWeights) {
  Random rng(42);
  TargetRouter r({make_target("heavy", 90), make_target("light", 10)},
                 DistributionStrategy::Weighted, rng);
  auto counts = draw(r, 1000);
  EXPECT_GE(counts["heavy"], 810);
  EXPECT_LE(counts["heavy"], 990);
  EXPECT_GE(counts["light"], 10);
  EXPECT_LE(counts["light"], 190);
}

TEST(TargetRouter, WeightedRejectsZeroWeightEnabled) {
  Random rng(1);
  EXPECT_THROW(TargetRouter({make_target("a", 1), make_target("b", 0)},
                            DistributionStrategy::Weighted, rng),
               std::invalid_argument);
}

TEST(TargetRouter, WeightedIgnoresDisabledZeroWeight) {
  Random rng(1);
  TargetRouter r({make_target("a", 3), make_target("b", 0, false)},
                 DistributionStrategy::Weighted, rng);
  EXPECT_EQ(r.next_target().name, "a");
}

TEST(TargetRouter, RandomIsRoughlyUniform) {
  Random rng(7);
  TargetRouter r({make_target("a"), make_target("b"), make_target("c")},
                 DistributionStrategy::Random, rng);
  auto counts = draw(r, 3000);
  for (const auto &kv : counts) {
    EXPECT_GE(kv.second, 650) << kv.first;
    EXPECT_LE(kv.second, 1350) << kv.first;
  }
  EXPECT_EQ(counts.size(), 3u);
}

TEST(TargetRouter, ReportAggregatesTargets) {
  Random rng(1);
  TargetRouter r({make_target("a"), make_target("b")},
                 DistributionStrategy::RoundRobin, rng);
  r.record_success("a", 50);
  r.record_failure("b", "HTTP 500");
  const auto rep = r.report();
  EXPECT_EQ(rep["total_requests"].get<int>(), 2);
  EXPECT_EQ(rep["strategy"].get<std::string>(), "round-robin");
  EXPECT_EQ(rep["per_target"]["a"]["status"].get<std::string>(), "healthy");
  EXPECT_EQ(rep["per_target"]["b"]["status"].get<std::string>(), "failed");
  EXPECT_TRUE(rep["per_target"]["b"]["avg_latency_ms"].is_null());
  EXPECT_THROW(r.record_success("nope", 1), std::out_of_range);
}

TEST(ParseTargets, ReadsBlob) {
  const auto mt = parse_targets(R"({
    "targets": [
      {"name": "primary", "url": "https://a.example.com", "site_id": "3",
       "token_auth": "tok", "weight": 5},
      {"name": "backup", "url": "https://b.example.com/custom.php/",
       "site_id": 4, "enabled": false}
    ],
    "distribution_strategy": "weighted"})");
  ASSERT_TRUE(mt.has_value());
  ASSERT_EQ(mt->targets.size(), 2u);
  EXPECT_EQ(mt->strategy, DistributionStrategy::Weighted);
  EXPECT_EQ(mt->targets[0].url, "https://a.example.com/matomo.php");
  EXPECT_EQ(mt->targets[0].site_id, 3);
  EXPECT_EQ(mt->targets[0].token_auth.value_or(""), "tok");
  EXPECT_EQ(mt->targets[0].weight, 5);
  EXPECT_EQ(mt->targets[1].url, "https://b.example.com/custom.php");
  EXPECT_FALSE(mt->targets[1].enabled);
  EXPECT_FALSE(mt->targets[1].token_auth.has_value());
}

TEST(ParseTargets, EmptyMeansSingleTarget) {
  EXPECT_FALSE(parse_targets("").has_value());
  EXPECT_FALSE(parse_targets(R"({"targets": []})").has_value());
}

TEST(ParseTargets, BadInputIsConfigError) {
  EXPECT_THROW(parse_targets("{not json"), ConfigError);
  EXPECT_THROW(parse_targets(R"({"targets": [{"url": "https://x"}]})"),
               ConfigError);
  EXPECT_THROW(
      parse_targets(R"({"targets": [{"name": "a", "url": "https://x",
                        "site_id": 1}], "distribution_strategy": "fastest"})"),
      ConfigError);
}

TEST(MakeRouter, ImplicitDefaultTarget) {
  Config cfg;
  cfg.matomo_url = "https://stats.example.com";
  cfg.site_id = 9;
  cfg.token_auth = "secret";
  Random rng(1);
  auto r = make_router(cfg, rng);
  ASSERT_EQ(r->enabled_targets().size(), 1u);
  const Target &t = r->next_target();
  EXPECT_EQ(t.name, "default");
  EXPECT_EQ(t.url, "https://stats.example.com/matomo.php");
  EXPECT_EQ(t.site_id, 9);
  EXPECT_EQ(t.token_auth.value_or(""), "secret");
}

TEST(MakeRouter, WeightErrorsBecomeConfigErrors) {
  Config cfg;
  cfg.multi_target_config = R"({"targets": [
      {"name": "a", "url": "https://a.example.com", "site_id": 1, "weight": 0}],
      "distribution_strategy": "weighted"})";
  Random rng(1);
  EXPECT_THROW(make_router(cfg, rng), ConfigError);
}
