#include "trafficgen/status_publisher.hpp"
#include "trafficgen/config.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/metrics_export.hpp"
#include "trafficgen/time_utils.hpp"

#include <sstream>
#include <unordered_map>

#include <sw/redis++/redis++.h>

namespace trafficgen {

using sw::redis::Redis;

namespace {
const char *kStatusKey = "trafficgen:status";
} // namespace

StatusSnapshot current_status(double implied_daily_rate, std::string mode) {
  StatusSnapshot s;
  s.visits_total = g_visits_total.load(std::memory_order_relaxed);
  s.hits_sent = g_hits_sent.load(std::memory_order_relaxed);
  s.hits_failed = g_hits_failed.load(std::memory_order_relaxed);
  s.implied_daily_rate = implied_daily_rate;
  s.mode = std::move(mode);
  return s;
}

StatusPublisher::StatusPublisher(const Config &cfg) {
  if (!cfg.redis_enabled)
    return;

  try {
    std::ostringstream uri;
    uri << "tcp://" << cfg.redis_host << ":" << cfg.redis_port;

    redis_ = std::make_unique<Redis>(uri.str());
    redis_->ping(); // соединение живое
    enabled_ = true;
    log_info("REDIS", "status mirror -> " + uri.str());
  } catch (const sw::redis::Error &e) {
    enabled_ = false;
    redis_.reset();
    log_warn("REDIS", std::string("unavailable, status mirror off: ") +
                          e.what());
  }
}

StatusPublisher::~StatusPublisher() = default;

void StatusPublisher::publish(const StatusSnapshot &s) {
  if (!enabled_ || !redis_)
    return;

  const std::unordered_map<std::string, std::string> fields{
      {"visits_total", std::to_string(s.visits_total)},
      {"hits_sent", std::to_string(s.hits_sent)},
      {"hits_failed", std::to_string(s.hits_failed)},
      {"implied_daily_rate", std::to_string(s.implied_daily_rate)},
      {"mode", s.mode},
      {"updated_at", format_cdt(Clock::now())},
  };
  try {
    redis_->hset(kStatusKey, fields.begin(), fields.end());
  } catch (const sw::redis::Error &e) {
    log_dbg("REDIS", std::string("status write failed: ") + e.what());
  }
}

} // namespace trafficgen
