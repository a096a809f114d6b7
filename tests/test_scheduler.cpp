#include "counting_source.hpp"

#include <gtest/gtest.h>
#include <trafficgen/scheduler.hpp>
#include <trafficgen/worker_pool.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>

#include <boost/thread.hpp>

using namespace trafficgen;
using trafficgen::testing::CountingSource;

TEST(RateBudget, RefillIsCapped) {
  RateBudget b;
  b.refill(10.0, 2.0, 5.0);
  EXPECT_DOUBLE_EQ(b.tokens, 5.0);
  for (int i = 0; i < 5; ++i)
    EXPECT_TRUE(b.try_take());
  EXPECT_FALSE(b.try_take());
}

TEST(RateBudget, FractionalTokensAccumulate) {
  RateBudget b;
  b.refill(0.25, 2.0, 10.0);
  EXPECT_FALSE(b.try_take());
  b.refill(0.25, 2.0, 10.0);
  EXPECT_TRUE(b.try_take());
  EXPECT_FALSE(b.try_take());
}

TEST(DailyCap, Decisions) {
  const TimePoint start = Clock::from_time_t(1'727'740'800);

  auto d = check_daily_cap(start + std::chrono::hours(1), start, 500, 0);
  EXPECT_FALSE(d.pause);
  EXPECT_EQ(d.visits_today, 500u);

  d = check_daily_cap(start + std::chrono::hours(1), start, 99, 100);
  EXPECT_FALSE(d.pause);

  d = check_daily_cap(start + std::chrono::hours(1), start, 100, 100);
  EXPECT_TRUE(d.pause);
  EXPECT_EQ(d.window_start, start);

  const TimePoint later = start + std::chrono::hours(24);
  d = check_daily_cap(later, start, 100, 100);
  EXPECT_FALSE(d.pause);
  EXPECT_EQ(d.window_start, later);
  EXPECT_EQ(d.visits_today, 0u);
}

TEST(Summary, ImpliedDailyRate) {
  const RunSummary s = make_summary(100, 3600);
  EXPECT_DOUBLE_EQ(s.implied_daily_rate, 2400.0);
  EXPECT_DOUBLE_EQ(make_summary(5, 0).implied_daily_rate, 0.0);
}

namespace {

class ThrowingSource : public VisitSource {
public:
  void run_visit(const std::optional<TimeWindow> &) override {
    ++calls;
    throw std::runtime_error("tracker exploded");
  }
  std::atomic<int> calls{0};
};

} // namespace

TEST(WorkerPool, DrainFinishesQueuedJobs) {
  CountingSource source;
  WorkerPool pool(2, source);
  pool.start();
  int submitted = 0;
  while (submitted < 4 && pool.try_submit(VisitJob{}))
    ++submitted;
  EXPECT_EQ(submitted, 4);
  pool.drain();
  EXPECT_EQ(source.visits.load(), 4);
  EXPECT_EQ(pool.completed(), 4u);
}

TEST(WorkerPool, FailedVisitDoesNotStopWorker) {
  ThrowingSource source;
  WorkerPool pool(1, source);
  pool.start();
  ASSERT_TRUE(pool.try_submit(VisitJob{}));
  ASSERT_TRUE(pool.try_submit(VisitJob{}));
  pool.drain();
  EXPECT_EQ(source.calls.load(), 2);
  EXPECT_EQ(pool.completed(), 2u);
}

TEST(WorkerPool, BoundedQueue) {
  CountingSource source;
  WorkerPool pool(1, source);
  // воркеры не запущены: очередь на 2 задания
  EXPECT_TRUE(pool.try_submit(VisitJob{}));
  EXPECT_TRUE(pool.try_submit(VisitJob{}));
  EXPECT_FALSE(pool.try_submit(VisitJob{}));
  EXPECT_TRUE(pool.queue_full());
}

TEST(RealtimeScheduler, StopsAtMaxTotalVisits) {
  Config cfg;
  cfg.target_visits_per_day = 1000000; // ~11.6/s
  cfg.concurrency = 4;
  cfg.max_total_visits = 10;
  CountingSource source;
  std::atomic<bool> running{true};
  RealtimeScheduler sched(cfg, source, running);

  const RunSummary s = sched.run();
  EXPECT_EQ(s.total_visits, 10u);
  EXPECT_EQ(source.visits.load(), 10);
  EXPECT_TRUE(running.load());
  for (const auto &w : source.windows)
    EXPECT_FALSE(w.has_value());
}

TEST(RealtimeScheduler, DailyCapHoldsAdmissions) {
  Config cfg;
  cfg.target_visits_per_day = 1000000;
  cfg.concurrency = 4;
  cfg.daily_visit_cap = 3;
  CountingSource source;
  std::atomic<bool> running{true};
  RealtimeScheduler sched(cfg, source, running);

  boost::thread stopper([&sched] {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(1500));
    sched.stop();
  });
  sched.run();
  stopper.join();
  EXPECT_LE(source.visits.load(), 3);
}

TEST(RealtimeScheduler, StopFromAnotherThread) {
  Config cfg;
  cfg.target_visits_per_day = 86400; // 1/s
  cfg.concurrency = 2;
  CountingSource source;
  std::atomic<bool> running{true};
  RealtimeScheduler sched(cfg, source, running);

  int progress_calls = 0;
  sched.set_progress_interval(std::chrono::seconds(0));
  sched.set_progress_callback([&](const RunSummary &) { ++progress_calls; });

  boost::thread stopper([&sched] {
    boost::this_thread::sleep_for(boost::chrono::milliseconds(600));
    sched.stop();
  });
  const auto t0 = std::chrono::steady_clock::now();
  sched.run();
  stopper.join();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(3));
  EXPECT_FALSE(running.load());
  EXPECT_GT(progress_calls, 0);
}
