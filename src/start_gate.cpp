#include "trafficgen/start_gate.hpp"
#include "trafficgen/log.hpp"
#include "trafficgen/time_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/stat.h>

namespace trafficgen {

namespace {

bool file_exists(const std::string &path) {
  struct stat st;
  return ::stat(path.c_str(), &st) == 0;
}

} // namespace

bool wait_for_start_signal(const Config &cfg, const std::atomic<bool> &running) {
  if (cfg.auto_start)
    return true;

  log_info("START", "waiting for start signal file " + cfg.start_signal_file);
  const auto interval = std::max(std::chrono::milliseconds(1),
                                 seconds_to_ms(cfg.start_check_interval));
  while (running) {
    if (file_exists(cfg.start_signal_file)) {
      if (std::remove(cfg.start_signal_file.c_str()) != 0)
        log_warn("START", "cannot remove " + cfg.start_signal_file + ": " +
                              std::strerror(errno));
      log_info("START", "start signal received");
      return true;
    }
    sleep_with_checks(running, interval);
  }
  return false;
}

} // namespace trafficgen
