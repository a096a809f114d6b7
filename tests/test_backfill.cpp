#include "counting_source.hpp"

#include <gtest/gtest.h>
#include <trafficgen/backfill.hpp>
#include <trafficgen/time_utils.hpp>

#include <atomic>
#include <vector>

using namespace trafficgen;
using trafficgen::testing::CountingSource;
namespace gr = boost::gregorian;

namespace {

const gr::date kToday(2024, 10, 19);

Config absolute(const std::string &start, const std::string &end) {
  Config cfg;
  cfg.backfill_enabled = true;
  cfg.backfill_start_date = start;
  cfg.backfill_end_date = end;
  cfg.timezone = "UTC";
  return cfg;
}

struct DayCall {
  TimeWindow window;
  std::uint64_t target;
  double rps;
};

// run_day без пула: запоминает аргументы и "отправляет" весь target
class RecordingBackfill : public BackfillScheduler {
public:
  using BackfillScheduler::BackfillScheduler;

  std::uint64_t run_day(const TimeWindow &day, std::uint64_t target,
                        double rps_limit) override {
    calls.push_back({day, target, rps_limit});
    first_draws.push_back(rng_.uniform_int(0, 1 << 30));
    return target;
  }

  std::vector<DayCall> calls;
  std::vector<long long> first_draws;
};

} // namespace

TEST(BackfillWindow, AbsoluteRangeInclusive) {
  const auto days =
      compute_backfill_window(absolute("2024-10-01", "2024-10-03"), kToday);
  ASSERT_EQ(days.size(), 3u);
  EXPECT_EQ(format_date(days.front()), "2024-10-01");
  EXPECT_EQ(format_date(days.back()), "2024-10-03");
}

TEST(BackfillWindow, RelativeRange) {
  Config cfg;
  cfg.backfill_days_back = 7;
  cfg.backfill_duration_days = 3;
  const auto days = compute_backfill_window(cfg, kToday);
  ASSERT_EQ(days.size(), 3u);
  EXPECT_EQ(format_date(days.front()), "2024-10-12");
  EXPECT_EQ(format_date(days.back()), "2024-10-14");

  cfg.backfill_days_back = 1;
  cfg.backfill_duration_days = 1;
  const auto yesterday = compute_backfill_window(cfg, kToday);
  ASSERT_EQ(yesterday.size(), 1u);
  EXPECT_EQ(format_date(yesterday[0]), "2024-10-18");
}

TEST(BackfillWindow, Rejections) {
  EXPECT_THROW(compute_backfill_window(absolute("2024-10-05", "2024-10-01"),
                                       kToday),
               ConfigError);
  EXPECT_THROW(compute_backfill_window(absolute("2024-10-18", "2024-10-20"),
                                       kToday),
               ConfigError);
  EXPECT_THROW(compute_backfill_window(absolute("2024-04-01", "2024-09-28"),
                                       kToday),
               ConfigError);
  EXPECT_THROW(compute_backfill_window(absolute("2024/10/01", "2024-10-02"),
                                       kToday),
               ConfigError);
  EXPECT_NO_THROW(compute_backfill_window(absolute("2024-04-01", "2024-09-27"),
                                          kToday));

  Config both = absolute("2024-10-01", "2024-10-02");
  both.backfill_days_back = 3;
  EXPECT_THROW(compute_backfill_window(both, kToday), ConfigError);

  Config half;
  half.backfill_start_date = std::string("2024-10-01");
  EXPECT_THROW(compute_backfill_window(half, kToday), ConfigError);

  Config half_rel;
  half_rel.backfill_days_back = 3;
  EXPECT_THROW(compute_backfill_window(half_rel, kToday), ConfigError);

  EXPECT_THROW(compute_backfill_window(Config{}, kToday), ConfigError);
}

TEST(Backfill, CapsSplitAcrossDays) {
  Config cfg = absolute("2024-10-01", "2024-10-03");
  cfg.backfill_max_visits_per_day = 100;
  cfg.backfill_max_visits_total = 150;
  cfg.backfill_rps_limit = 5.0;
  CountingSource source;
  Random rng(1);
  std::atomic<bool> running{true};
  RecordingBackfill bf(cfg, source, rng, running);

  const auto days = bf.run_backfill(kToday);
  ASSERT_EQ(days.size(), 3u);
  EXPECT_EQ(days[0].target, 100u);
  EXPECT_EQ(days[0].sent, 100u);
  EXPECT_EQ(days[1].target, 50u);
  EXPECT_FALSE(days[1].skipped);
  EXPECT_TRUE(days[2].skipped);
  EXPECT_EQ(days[2].date, "2024-10-03");

  ASSERT_EQ(bf.calls.size(), 2u);
  for (const auto &c : bf.calls)
    EXPECT_DOUBLE_EQ(c.rps, 5.0);
  // окна: полночь UTC -> следующая полночь
  EXPECT_EQ(format_cdt(bf.calls[0].window.begin), "2024-10-01 00:00:00");
  EXPECT_EQ(format_cdt(bf.calls[0].window.end), "2024-10-02 00:00:00");
  EXPECT_EQ(format_cdt(bf.calls[1].window.begin), "2024-10-02 00:00:00");
}

TEST(Backfill, DefaultRateFollowsDailyTarget) {
  Config cfg = absolute("2024-10-01", "2024-10-01");
  cfg.target_visits_per_day = 172800;
  CountingSource source;
  Random rng(1);
  std::atomic<bool> running{true};
  RecordingBackfill bf(cfg, source, rng, running);
  bf.run_backfill(kToday);
  ASSERT_EQ(bf.calls.size(), 1u);
  EXPECT_DOUBLE_EQ(bf.calls[0].rps, 2.0);
}

TEST(Backfill, DayWindowsFollowTimezone) {
  Config cfg = absolute("2024-07-01", "2024-07-01");
  cfg.timezone = "CET";
  CountingSource source;
  Random rng(1);
  std::atomic<bool> running{true};
  RecordingBackfill bf(cfg, source, rng, running);
  bf.run_backfill(kToday);
  ASSERT_EQ(bf.calls.size(), 1u);
  EXPECT_EQ(format_cdt(bf.calls[0].window.begin), "2024-06-30 22:00:00");
  EXPECT_EQ(format_cdt(bf.calls[0].window.end), "2024-07-01 22:00:00");
}

TEST(Backfill, SeedIsAppliedPerDay) {
  Config cfg = absolute("2024-10-01", "2024-10-03");
  cfg.backfill_max_visits_per_day = 10;
  cfg.backfill_seed = 42u;
  CountingSource source;
  std::atomic<bool> running{true};

  Random first_rng(7);
  RecordingBackfill first(cfg, source, first_rng, running);
  first.run_backfill(kToday);
  Random second_rng(99);
  RecordingBackfill second(cfg, source, second_rng, running);
  second.run_backfill(kToday);

  ASSERT_EQ(first.first_draws.size(), 3u);
  EXPECT_EQ(first.first_draws, second.first_draws);
  EXPECT_NE(first.first_draws[0], first.first_draws[1]);
  for (std::size_t i = 0; i < first.first_draws.size(); ++i) {
    Random expected(42u + i);
    EXPECT_EQ(first.first_draws[i], expected.uniform_int(0, 1 << 30))
        << "day " << i;
  }
}

TEST(Backfill, StoppedRunSchedulesNothing) {
  Config cfg = absolute("2024-10-01", "2024-10-03");
  CountingSource source;
  Random rng(1);
  std::atomic<bool> running{false};
  RecordingBackfill bf(cfg, source, rng, running);
  EXPECT_TRUE(bf.run_backfill(kToday).empty());
  EXPECT_TRUE(bf.calls.empty());
}

TEST(Backfill, RealDayUsesWorkerPool) {
  Config cfg = absolute("2024-10-01", "2024-10-01");
  cfg.concurrency = 4;
  CountingSource source;
  Random rng(1);
  std::atomic<bool> running{true};
  BackfillScheduler bf(cfg, source, rng, running);

  TimeWindow day;
  day.begin = Clock::from_time_t(1'727'740'800);
  day.end = day.begin + std::chrono::hours(24);
  EXPECT_EQ(bf.run_day(day, 12, 100.0), 12u);
  EXPECT_EQ(source.visits.load(), 12);
  for (const auto &w : source.windows) {
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->begin, day.begin);
  }
}
