#include "trafficgen/scheduler.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/time_utils.hpp"
#include "trafficgen/worker_pool.hpp"

#include <algorithm>
#include <cstdio>

namespace trafficgen {

using steady = std::chrono::steady_clock;

void RateBudget::refill(double elapsed_s, double rate, double cap) {
  if (elapsed_s > 0 && rate > 0)
    tokens = std::min(cap, tokens + elapsed_s * rate);
}

bool RateBudget::try_take() {
  if (tokens < 1.0)
    return false;
  tokens -= 1.0;
  return true;
}

DailyCapDecision check_daily_cap(TimePoint now, TimePoint window_start,
                                 std::uint64_t visits_today,
                                 std::uint64_t cap) {
  if (cap == 0)
    return {false, window_start, visits_today};
  if (now - window_start >= std::chrono::hours(24))
    return {false, now, 0};
  return {visits_today >= cap, window_start, visits_today};
}

RunSummary make_summary(std::uint64_t visits, double elapsed_seconds) {
  RunSummary s;
  s.total_visits = visits;
  s.elapsed_seconds = elapsed_seconds;
  s.implied_daily_rate =
      elapsed_seconds > 0 ? static_cast<double>(visits) / elapsed_seconds * 86400.0
                          : 0.0;
  return s;
}

RealtimeScheduler::RealtimeScheduler(const Config &cfg, VisitSource &source,
                                     std::atomic<bool> &running)
    : cfg_(cfg), source_(source), running_(running) {}

RunSummary RealtimeScheduler::run() {
  const double rate = cfg_.target_visits_per_day / 86400.0;
  const double cap = static_cast<double>(std::max<std::size_t>(1, cfg_.concurrency));
  const auto auto_stop = std::chrono::duration_cast<steady::duration>(
      std::chrono::duration<double, std::ratio<3600>>(cfg_.auto_stop_after_hours));

  char buf[160];
  std::snprintf(buf, sizeof(buf),
                "realtime start: target=%.0f/day (%.3f/s) concurrency=%zu",
                cfg_.target_visits_per_day, rate, cfg_.concurrency);
  log_info("RUN", buf);

  WorkerPool pool(cfg_.concurrency, source_);
  pool.start();

  const auto t0 = steady::now();
  auto last_tick = t0;
  auto last_progress = t0;
  RateBudget budget;

  std::uint64_t admitted = 0;
  TimePoint cap_window = Clock::now();
  std::uint64_t admitted_today = 0;
  bool cap_paused = false;

  auto elapsed_s = [&] {
    return std::chrono::duration<double>(steady::now() - t0).count();
  };

  while (running_) {
    const auto now = steady::now();

    if (cfg_.auto_stop_after_hours > 0 && now - t0 >= auto_stop) {
      log_info("RUN", "auto-stop after " +
                          std::to_string(cfg_.auto_stop_after_hours) + " h");
      break;
    }
    if (cfg_.max_total_visits > 0 && admitted >= cfg_.max_total_visits) {
      log_info("RUN", "MAX_TOTAL_VISITS reached (" +
                          std::to_string(cfg_.max_total_visits) + ")");
      break;
    }

    budget.refill(std::chrono::duration<double>(now - last_tick).count(), rate,
                  cap);
    last_tick = now;

    const auto gate = check_daily_cap(Clock::now(), cap_window, admitted_today,
                                      cfg_.daily_visit_cap);
    cap_window = gate.window_start;
    admitted_today = gate.visits_today;

    if (gate.pause) {
      if (!cap_paused)
        log_info("RUN", "DAILY_VISIT_CAP reached (" +
                            std::to_string(cfg_.daily_visit_cap) +
                            "), pausing until the 24 h window rolls over");
      cap_paused = true;
    } else {
      if (cap_paused)
        log_info("RUN", "daily window reset, resuming");
      cap_paused = false;
      while (!pool.queue_full() && budget.try_take()) {
        if (cfg_.max_total_visits > 0 && admitted >= cfg_.max_total_visits)
          break;
        if (cfg_.daily_visit_cap > 0 && admitted_today >= cfg_.daily_visit_cap)
          break;
        if (!pool.try_submit(VisitJob{}))
          break;
        ++admitted;
        ++admitted_today;
      }
    }

    if (now - last_progress >= progress_interval_) {
      last_progress = now;
      const RunSummary s = make_summary(pool.completed(), elapsed_s());
      std::snprintf(buf, sizeof(buf),
                    "visits_total=%llu elapsed=%.0fs rate~%.0f/day",
                    static_cast<unsigned long long>(s.total_visits),
                    s.elapsed_seconds, s.implied_daily_rate);
      log_info("RUN", buf);
      if (on_progress_)
        on_progress_(s);
    }

    sleep_with_checks(running_, kProducerTick);
  }

  if (running_) {
    pool.drain();
  } else {
    log_info("RUN", "cancelled, waiting for in-flight visits");
    pool.cancel();
  }
  return make_summary(pool.completed(), elapsed_s());
}

} // namespace trafficgen
