#pragma once
#include "types.hpp"

#include <optional>

namespace trafficgen {

// Задание воркеру: один визит. stop = сигнал воркеру завершиться.
struct VisitJob {
  bool stop{false};
  std::optional<TimeWindow> window; // есть только в backfill
};

inline VisitJob stop_job() { return VisitJob{true, std::nullopt}; }

} // namespace trafficgen
