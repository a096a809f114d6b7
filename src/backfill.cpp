#include "trafficgen/backfill.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/scheduler.hpp"
#include "trafficgen/worker_pool.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace gr = boost::gregorian;

namespace trafficgen {

namespace {

gr::date parse_config_date(const std::string &name, const std::string &value) {
  try {
    return parse_date(value);
  } catch (const std::exception &) {
    throw ConfigError(name + " must be YYYY-MM-DD, got '" + value + "'");
  }
}

} // namespace

std::vector<gr::date> compute_backfill_window(const Config &cfg,
                                              const gr::date &today) {
  const bool has_absolute = cfg.backfill_start_date || cfg.backfill_end_date;
  const bool has_relative = cfg.backfill_days_back || cfg.backfill_duration_days;

  if (has_absolute && has_relative)
    throw ConfigError("Provide either BACKFILL_START_DATE/END_DATE or "
                      "BACKFILL_DAYS_BACK + DURATION_DAYS, not both");

  gr::date start, end;
  if (has_absolute) {
    if (!cfg.backfill_start_date || !cfg.backfill_end_date)
      throw ConfigError("BACKFILL_START_DATE and BACKFILL_END_DATE must both "
                        "be set");
    start = parse_config_date("BACKFILL_START_DATE", *cfg.backfill_start_date);
    end = parse_config_date("BACKFILL_END_DATE", *cfg.backfill_end_date);
  } else if (has_relative) {
    if (!cfg.backfill_days_back || !cfg.backfill_duration_days)
      throw ConfigError("BACKFILL_DAYS_BACK and BACKFILL_DURATION_DAYS must "
                        "both be set");
    if (*cfg.backfill_days_back < 1 || *cfg.backfill_duration_days < 1)
      throw ConfigError("BACKFILL_DAYS_BACK and BACKFILL_DURATION_DAYS must "
                        "be >= 1");
    start = today - gr::days(*cfg.backfill_days_back);
    end = start + gr::days(*cfg.backfill_duration_days - 1);
  } else {
    throw ConfigError("Backfill window required: set BACKFILL_START_DATE/"
                      "END_DATE or BACKFILL_DAYS_BACK + DURATION_DAYS");
  }

  if (start > end)
    throw ConfigError("Backfill start date " + format_date(start) +
                      " is after end date " + format_date(end));
  if (end > today)
    throw ConfigError("Backfill end date " + format_date(end) +
                      " is in the future (today is " + format_date(today) +
                      ")");
  const long length = (end - start).days() + 1;
  if (length > kMaxBackfillDays)
    throw ConfigError("Backfill window of " + std::to_string(length) +
                      " days exceeds " + std::to_string(kMaxBackfillDays));

  std::vector<gr::date> days;
  days.reserve(static_cast<std::size_t>(length));
  for (gr::day_iterator it(start); *it <= end; ++it)
    days.push_back(*it);
  return days;
}

std::vector<gr::date> compute_backfill_window(const Config &cfg) {
  return compute_backfill_window(cfg, today_in(resolve_timezone(cfg.timezone)));
}

BackfillScheduler::BackfillScheduler(const Config &cfg, VisitSource &source,
                                     Random &rng, std::atomic<bool> &running)
    : cfg_(cfg), source_(source), rng_(rng), running_(running),
      tz_(resolve_timezone(cfg.timezone)) {}

double BackfillScheduler::effective_rps() const {
  if (cfg_.backfill_rps_limit && *cfg_.backfill_rps_limit > 0)
    return *cfg_.backfill_rps_limit;
  return cfg_.target_visits_per_day / 86400.0;
}

std::vector<DaySummary> BackfillScheduler::run_backfill() {
  return run_backfill(today_in(tz_));
}

std::vector<DaySummary>
BackfillScheduler::run_backfill(const gr::date &today) {
  const auto days = compute_backfill_window(cfg_, today);
  const double rps = effective_rps();
  const bool bounded = cfg_.backfill_max_visits_total > 0;
  std::uint64_t remaining = cfg_.backfill_max_visits_total;

  log_info("BACKFILL", "window " + format_date(days.front()) + " .. " +
                           format_date(days.back()) + " (" +
                           std::to_string(days.size()) + " days), per-day=" +
                           std::to_string(cfg_.backfill_max_visits_per_day) +
                           " total=" +
                           (bounded ? std::to_string(remaining) : "unbounded"));

  std::vector<DaySummary> out;
  out.reserve(days.size());
  for (std::size_t i = 0; i < days.size(); ++i) {
    if (!running_)
      break;

    DaySummary s;
    s.date = format_date(days[i]);
    if (bounded && remaining == 0) {
      s.skipped = true;
      log_info("BACKFILL", s.date + ": total cap exhausted, skipped");
      out.push_back(s);
      continue;
    }

    s.target = cfg_.backfill_max_visits_per_day;
    if (bounded)
      s.target = std::min(s.target, remaining);
    if (cfg_.backfill_seed)
      rng_.reseed(static_cast<std::uint64_t>(*cfg_.backfill_seed) + i);

    log_info("BACKFILL", s.date + ": target=" + std::to_string(s.target));
    s.sent = run_day(day_bounds(days[i], tz_), s.target, rps);
    if (bounded)
      remaining -= std::min(s.sent, remaining);

    log_info("BACKFILL", s.date + ": sent=" + std::to_string(s.sent) + "/" +
                             std::to_string(s.target));
    out.push_back(s);
  }
  return out;
}

std::uint64_t BackfillScheduler::run_day(const TimeWindow &day,
                                         std::uint64_t target,
                                         double rps_limit) {
  using steady = std::chrono::steady_clock;

  WorkerPool pool(cfg_.concurrency, source_);
  pool.start();

  const double cap =
      static_cast<double>(std::max<std::size_t>(1, cfg_.concurrency));
  RateBudget budget;
  auto last_tick = steady::now();
  std::uint64_t scheduled = 0;

  while (running_ && scheduled < target) {
    const auto now = steady::now();
    budget.refill(std::chrono::duration<double>(now - last_tick).count(),
                  rps_limit, cap);
    last_tick = now;

    while (scheduled < target && !pool.queue_full() && budget.try_take()) {
      if (!pool.try_submit(VisitJob{false, day}))
        break;
      ++scheduled;
    }
    if (scheduled < target)
      sleep_with_checks(running_, kProducerTick);
  }

  if (running_)
    pool.drain();
  else
    pool.cancel();
  return pool.completed();
}

} // namespace trafficgen
