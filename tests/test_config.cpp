#include <gtest/gtest.h>
#include <trafficgen/config.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace trafficgen;

namespace {

// Выставляет переменные окружения на время теста
class EnvGuard {
public:
  void set(const char *name, const std::string &value) {
    ::setenv(name, value.c_str(), 1);
    names_.push_back(name);
  }
  ~EnvGuard() {
    for (const char *n : names_)
      ::unsetenv(n);
  }

private:
  std::vector<const char *> names_;
};

} // namespace

TEST(Config, DefaultsAreValid) {
  Config cfg;
  EXPECT_NO_THROW(validate(cfg));
  EXPECT_EQ(cfg.pageviews_min, 3);
  EXPECT_EQ(cfg.pageviews_max, 6);
  EXPECT_EQ(cfg.concurrency, 50u);
  EXPECT_EQ(cfg.ecommerce_currency, "SEK");
}

TEST(Config, EnvironmentOverrides) {
  EnvGuard env;
  env.set("MATOMO_URL", "https://stats.example.com/matomo.php/");
  env.set("MATOMO_SITE_ID", "4");
  env.set("TARGET_VISITS_PER_DAY", "5000");
  env.set("CONCURRENCY", "8");
  env.set("RANDOMIZE_VISITOR_COUNTRIES", "false");
  env.set("ECOMMERCE_SHIPPING_RATES", "0, 19.5,39");
  env.set("MAX_TOTAL_VISITS", "250");

  const Config cfg = load_config("");
  EXPECT_EQ(cfg.matomo_url, "https://stats.example.com/matomo.php");
  EXPECT_EQ(cfg.site_id, 4);
  EXPECT_DOUBLE_EQ(cfg.target_visits_per_day, 5000);
  EXPECT_EQ(cfg.concurrency, 8u);
  EXPECT_FALSE(cfg.randomize_visitor_countries);
  EXPECT_EQ(cfg.ecommerce_shipping_rates, (std::vector<double>{0, 19.5, 39}));
  EXPECT_EQ(cfg.max_total_visits, 250u);
}

TEST(Config, MalformedValuesAreRejected) {
  {
    EnvGuard env;
    env.set("CONCURRENCY", "many");
    EXPECT_THROW(load_config(""), ConfigError);
  }
  {
    EnvGuard env;
    env.set("AUTO_START", "maybe");
    EXPECT_THROW(load_config(""), ConfigError);
  }
  {
    EnvGuard env;
    env.set("MAX_TOTAL_VISITS", "-5");
    EXPECT_THROW(load_config(""), ConfigError);
  }
}

TEST(Config, RangeChecks) {
  Config cfg;
  cfg.pageviews_min = 8;
  cfg.pageviews_max = 4;
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg = Config{};
  cfg.outlinks_probability = 1.2;
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg = Config{};
  cfg.concurrency = 0;
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg = Config{};
  cfg.matomo_url = "stats.example.com/matomo.php";
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg = Config{};
  cfg.ecommerce_currency = "sek";
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg = Config{};
  cfg.visit_duration_min = 10;
  cfg.visit_duration_max = 5;
  EXPECT_THROW(validate(cfg), ConfigError);
}

TEST(Config, BackfillChecksOnlyWhenEnabled) {
  Config cfg;
  cfg.backfill_max_visits_total = 10;
  cfg.backfill_max_visits_per_day = 100;
  EXPECT_NO_THROW(validate(cfg));

  cfg.backfill_enabled = true;
  cfg.backfill_days_back = 2;
  cfg.backfill_duration_days = 1;
  EXPECT_THROW(validate(cfg), ConfigError);

  cfg.backfill_max_visits_total = 1000;
  EXPECT_NO_THROW(validate(cfg));

  cfg.backfill_rps_limit = 0.0;
  EXPECT_THROW(validate(cfg), ConfigError);
}

TEST(Config, JsonFileThenEnvironment) {
  const std::string path = ::testing::TempDir() + "trafficgen_config.json";
  {
    std::ofstream out(path);
    out << R"({
      "site_id": 9,
      "pageviews_min": 2,
      "pageviews_max": 3,
      "timezone": "UTC",
      "backfill_seed": 77,
      "multi_target_config": {"targets": [], "distribution_strategy": "random"}
    })";
  }
  EnvGuard env;
  env.set("PAGEVIEWS_MAX", "5");

  const Config cfg = load_config(path);
  EXPECT_EQ(cfg.site_id, 9);
  EXPECT_EQ(cfg.pageviews_min, 2);
  EXPECT_EQ(cfg.pageviews_max, 5);
  EXPECT_EQ(cfg.timezone, "UTC");
  ASSERT_TRUE(cfg.backfill_seed.has_value());
  EXPECT_EQ(*cfg.backfill_seed, 77u);
  EXPECT_NE(cfg.multi_target_config.find("random"), std::string::npos);
  std::remove(path.c_str());
}

TEST(Config, BrokenJsonFileIsConfigError) {
  const std::string path = ::testing::TempDir() + "trafficgen_broken.json";
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(load_config(path), ConfigError);
  std::remove(path.c_str());
}
