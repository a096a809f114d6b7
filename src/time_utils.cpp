#include "trafficgen/time_utils.hpp"
#include "trafficgen/log.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <boost/make_shared.hpp>

namespace trafficgen {

namespace bg = boost::gregorian;
namespace bpt = boost::posix_time;
namespace blt = boost::local_time;

namespace {

const bpt::ptime kEpoch(bg::date(1970, 1, 1));

const char *const kCentralEurope = "CET+01CEST,M3.5.0/02:00:00,M10.5.0/03:00:00";
const char *const kUsEastern = "EST-05EDT,M3.2.0/02:00:00,M11.1.0/02:00:00";

const std::unordered_map<std::string, std::string> &known_zones() {
  static const std::unordered_map<std::string, std::string> zones{
      {"UTC", "UTC+00"},
      {"GMT", "GMT+00"},
      {"Etc/UTC", "UTC+00"},
      {"CET", kCentralEurope},
      {"Europe/Stockholm", kCentralEurope},
      {"Europe/Berlin", kCentralEurope},
      {"Europe/Paris", kCentralEurope},
      {"Europe/Amsterdam", kCentralEurope},
      {"Europe/Oslo", kCentralEurope},
      {"Europe/Copenhagen", kCentralEurope},
      {"Europe/Madrid", kCentralEurope},
      {"Europe/Rome", kCentralEurope},
      {"Europe/Warsaw", kCentralEurope},
      {"Europe/London", "GMT+00BST,M3.5.0/01:00:00,M10.5.0/02:00:00"},
      {"Europe/Dublin", "GMT+00IST,M3.5.0/01:00:00,M10.5.0/02:00:00"},
      {"EET", "EET+02EEST,M3.5.0/03:00:00,M10.5.0/04:00:00"},
      {"Europe/Helsinki", "EET+02EEST,M3.5.0/03:00:00,M10.5.0/04:00:00"},
      {"Europe/Moscow", "MSK+03"},
      {"EST5EDT", kUsEastern},
      {"America/New_York", kUsEastern},
      {"America/Chicago", "CST-06CDT,M3.2.0/02:00:00,M11.1.0/02:00:00"},
      {"America/Denver", "MST-07MDT,M3.2.0/02:00:00,M11.1.0/02:00:00"},
      {"America/Los_Angeles", "PST-08PDT,M3.2.0/02:00:00,M11.1.0/02:00:00"},
      {"Asia/Tokyo", "JST+09"},
      {"Asia/Singapore", "SGT+08"},
      {"Australia/Sydney", "AEST+10AEDT,M10.1.0/02:00:00,M4.1.0/03:00:00"},
  };
  return zones;
}

} // namespace

TimePoint to_time_point(const bpt::ptime &pt) {
  return Clock::from_time_t(0) +
         std::chrono::seconds((pt - kEpoch).total_seconds());
}

bpt::ptime to_ptime(TimePoint tp) {
  const auto secs =
      std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
          .count();
  return kEpoch + bpt::seconds(static_cast<long>(secs));
}

std::string format_cdt(TimePoint tp) {
  const bpt::ptime pt = to_ptime(tp);
  const bg::date d = pt.date();
  const bpt::time_duration t = pt.time_of_day();
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                static_cast<int>(d.year()), static_cast<int>(d.month()),
                static_cast<int>(d.day()), static_cast<int>(t.hours()),
                static_cast<int>(t.minutes()), static_cast<int>(t.seconds()));
  return buf;
}

bg::date parse_date(const std::string &s) {
  int y = 0, m = 0, d = 0;
  char tail = 0;
  if (s.size() != 10 ||
      std::sscanf(s.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &tail) != 3)
    throw std::invalid_argument("'" + s + "' must be in YYYY-MM-DD format");
  try {
    return bg::date(static_cast<unsigned short>(y),
                    static_cast<unsigned short>(m),
                    static_cast<unsigned short>(d));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("'" + s + "' is not a valid calendar date");
  }
}

std::string format_date(const bg::date &d) { return bg::to_iso_extended_string(d); }

TimeZonePtr resolve_timezone(const std::string &name) {
  const auto &zones = known_zones();
  auto it = zones.find(name);
  const std::string spec = it != zones.end() ? it->second : name;
  const bool looks_posix =
      std::any_of(spec.begin(), spec.end(),
                  [](unsigned char c) { return c >= '0' && c <= '9'; });
  if (it != zones.end() || looks_posix) {
    try {
      return boost::make_shared<blt::posix_time_zone>(spec);
    } catch (const std::exception &e) {
      log_warn("TZ", "bad timezone spec '" + spec + "': " + e.what());
    }
  }
  log_warn("TZ", "unknown timezone '" + name + "', falling back to UTC");
  return boost::make_shared<blt::posix_time_zone>("UTC+00");
}

bg::date today_in(const TimeZonePtr &tz) {
  return blt::local_sec_clock::local_time(tz).local_time().date();
}

TimeWindow day_bounds(const bg::date &d, const TimeZonePtr &tz) {
  auto local_midnight = [&tz](const bg::date &day) {
    blt::local_date_time ldt(day, bpt::time_duration(0, 0, 0), tz,
                             blt::local_date_time::NOT_DATE_TIME_ON_ERROR);
    if (ldt.is_not_a_date_time()) {
      // полночь попала в переход на летнее время
      ldt = blt::local_date_time(day, bpt::time_duration(1, 0, 0), tz,
                                 blt::local_date_time::NOT_DATE_TIME_ON_ERROR);
    }
    return ldt.utc_time();
  };
  TimeWindow w;
  w.begin = to_time_point(local_midnight(d));
  w.end = to_time_point(local_midnight(d + bg::days(1)));
  return w;
}

void sleep_with_checks(const std::atomic<bool> &running,
                       std::chrono::milliseconds dur) {
  const auto step = std::chrono::milliseconds(100);
  auto left = dur;
  while (running && left.count() > 0) {
    std::this_thread::sleep_for(std::min(step, left));
    left -= step;
  }
}

} // namespace trafficgen
