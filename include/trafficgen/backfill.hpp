#pragma once
#include "config.hpp"
#include "random.hpp"
#include "time_utils.hpp"
#include "types.hpp"
#include "visit_source.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

#include <boost/date_time/gregorian/gregorian_types.hpp>

namespace trafficgen {

constexpr int kMaxBackfillDays = 180;

// Даты окна по возрастанию. Либо BACKFILL_START_DATE + END_DATE, либо
// DAYS_BACK + DURATION_DAYS (days_back = 1 означает вчера). Бросает ConfigError.
std::vector<boost::gregorian::date>
compute_backfill_window(const Config &cfg, const boost::gregorian::date &today);

// today берётся в часовом поясе cfg.timezone
std::vector<boost::gregorian::date> compute_backfill_window(const Config &cfg);

// День за днём, синхронно: на каждый день свой пул и token bucket,
// метки времени внутри [полночь, полночь) дня в cfg.timezone.
class BackfillScheduler {
public:
  BackfillScheduler(const Config &cfg, VisitSource &source, Random &rng,
                    std::atomic<bool> &running);
  virtual ~BackfillScheduler() = default;

  std::vector<DaySummary> run_backfill();
  std::vector<DaySummary> run_backfill(const boost::gregorian::date &today);

  void stop() { running_.store(false); }

  // сколько визитов реально отработано за день
  virtual std::uint64_t run_day(const TimeWindow &day, std::uint64_t target,
                                double rps_limit);

protected:
  double effective_rps() const;

  const Config cfg_;
  VisitSource &source_;
  Random &rng_;
  std::atomic<bool> &running_;
  TimeZonePtr tz_;
};

} // namespace trafficgen
