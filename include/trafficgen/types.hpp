#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trafficgen {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Строка из файла URL: адрес и необязательный заголовок страницы
struct UrlEntry {
  std::string url;
  std::string title;
};

using UrlList = std::vector<UrlEntry>;

// Полуоткрытый интервал [begin, end) для размещения меток времени (backfill)
struct TimeWindow {
  TimePoint begin;
  TimePoint end;
};

// Параметры одного хита в порядке добавления
using HitParams = std::vector<std::pair<std::string, std::string>>;

struct Hit {
  HitParams params;
  std::string user_agent;
};

struct GeoChoice {
  std::string country;
  std::string ip;
};

struct VisitContext {
  std::string visitor_id; // 16 hex
  std::string user_agent;
  std::optional<std::string> referrer; // nullopt = прямой заход
  std::optional<GeoChoice> geo;
  std::string last_page_url;
  TimePoint last_hit_time{};
  std::size_t hits_sent{0};
};

struct EventDef {
  std::string category;
  std::string action;
  std::string name;
  std::optional<double> value;
};

struct DaySummary {
  std::string date; // YYYY-MM-DD
  std::uint64_t sent{0};
  std::uint64_t target{0};
  bool skipped{false};
};

struct RunSummary {
  std::uint64_t total_visits{0};
  double elapsed_seconds{0.0};
  double implied_daily_rate{0.0};
};

} // namespace trafficgen
