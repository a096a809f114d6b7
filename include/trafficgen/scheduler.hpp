#pragma once
#include "config.hpp"
#include "types.hpp"
#include "visit_source.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace trafficgen {

// Token bucket продюсера. Пишет только продюсер, поэтому без синхронизации.
struct RateBudget {
  double tokens{0.0};

  // +elapsed * rate, не больше cap
  void refill(double elapsed_s, double rate, double cap);
  bool try_take();
};

struct DailyCapDecision {
  bool pause{false};
  TimePoint window_start;
  std::uint64_t visits_today{0};
};

// Скользящее окно 24 ч: по истечении окна счётчик сбрасывается и окно
// начинается с now; при достигнутом лимите пауза. При cap == 0 лимита нет.
DailyCapDecision check_daily_cap(TimePoint now, TimePoint window_start,
                                 std::uint64_t visits_today,
                                 std::uint64_t cap);

constexpr std::chrono::milliseconds kProducerTick{250};

// Продюсер + пул воркеров с темпом target_visits_per_day. Останавливается
// по AUTO_STOP_AFTER_HOURS, MAX_TOTAL_VISITS или stop().
class RealtimeScheduler {
public:
  using ProgressFn = std::function<void(const RunSummary &)>;

  RealtimeScheduler(const Config &cfg, VisitSource &source,
                    std::atomic<bool> &running);

  // блокирует до завершения
  RunSummary run();

  // можно звать из другого потока
  void stop() { running_.store(false); }

  // раз в progress_interval, из потока продюсера
  void set_progress_callback(ProgressFn fn) { on_progress_ = std::move(fn); }
  void set_progress_interval(std::chrono::seconds s) { progress_interval_ = s; }

private:
  const Config cfg_;
  VisitSource &source_;
  std::atomic<bool> &running_;
  ProgressFn on_progress_;
  std::chrono::seconds progress_interval_{60};
};

RunSummary make_summary(std::uint64_t visits, double elapsed_seconds);

} // namespace trafficgen
