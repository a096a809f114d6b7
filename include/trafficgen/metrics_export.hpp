#pragma once
#include <atomic>
#include <cstddef>

namespace trafficgen {
// сколько хитов принял трекер (counter)
extern std::atomic<unsigned long long> g_hits_sent;
// сколько хитов потеряно: сеть, таймаут, не-2xx (counter)
extern std::atomic<unsigned long long> g_hits_failed;
// визиты, отработанные воркерами, включая неудачные (counter)
extern std::atomic<unsigned long long> g_visits_total;
} // namespace trafficgen
