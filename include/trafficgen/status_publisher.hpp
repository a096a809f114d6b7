#pragma once
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sw {
namespace redis {
class Redis;
} // namespace redis
} // namespace sw

namespace trafficgen {

struct Config;

struct StatusSnapshot {
  std::uint64_t visits_total{0};
  std::uint64_t hits_sent{0};
  std::uint64_t hits_failed{0};
  double implied_daily_rate{0.0};
  std::string mode; // "realtime" | "backfill" | "done"
};

// снимок из глобальных счётчиков
StatusSnapshot current_status(double implied_daily_rate, std::string mode);

// Зеркало статуса в Redis-хеше trafficgen:status. Недоступный Redis при
// старте выключает зеркало; ошибки записи только в лог.
class StatusPublisher {
public:
  explicit StatusPublisher(const Config &cfg);
  ~StatusPublisher();

  void publish(const StatusSnapshot &s);

private:
  bool enabled_{false};
  std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace trafficgen
