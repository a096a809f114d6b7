#include "trafficgen/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>

namespace trafficgen {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

inline void write_line(const char *tag, const std::string &msg) {
  std::fprintf(stderr, "[%s] %s\n", tag, msg.c_str());
  std::fflush(stderr);
}

} // namespace

void set_log_level(LogLevel level) {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void set_log_level(const std::string &name) {
  std::string up = name;
  std::transform(up.begin(), up.end(), up.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (up == "ERROR" || up == "CRITICAL")
    set_log_level(LogLevel::Error);
  else if (up == "WARNING" || up == "WARN")
    set_log_level(LogLevel::Warning);
  else if (up == "DEBUG")
    set_log_level(LogLevel::Debug);
  else
    set_log_level(LogLevel::Info);
}

bool log_enabled(LogLevel level) {
  return static_cast<int>(level) <= g_level.load(std::memory_order_relaxed);
}

void log_err(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Error))
    write_line(tag, msg);
}

void log_warn(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Warning))
    write_line(tag, msg);
}

void log_info(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Info))
    write_line(tag, msg);
}

void log_dbg(const char *tag, const std::string &msg) {
  if (log_enabled(LogLevel::Debug))
    write_line(tag, msg);
}

} // namespace trafficgen
