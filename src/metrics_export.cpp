#include "trafficgen/metrics_export.hpp"

namespace trafficgen {
std::atomic<unsigned long long> g_hits_sent{0};
std::atomic<unsigned long long> g_hits_failed{0};
std::atomic<unsigned long long> g_visits_total{0};
} // namespace trafficgen
