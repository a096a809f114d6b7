#pragma once
#include <string>

namespace trafficgen {

enum class LogLevel { Error = 0, Warning = 1, Info = 2, Debug = 3 };

// Уровень задаётся один раз при старте (LOG_LEVEL); неизвестное имя -> Info
void set_log_level(const std::string &name);
void set_log_level(LogLevel level);
bool log_enabled(LogLevel level);

void log_err(const char *tag, const std::string &msg);
void log_warn(const char *tag, const std::string &msg);
void log_info(const char *tag, const std::string &msg);
void log_dbg(const char *tag, const std::string &msg);

} // namespace trafficgen
