#pragma once
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <string>

#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

namespace trafficgen {

using TimeZonePtr = boost::local_time::time_zone_ptr;

// UTC "YYYY-MM-DD HH:MM:SS", формат параметра cdt
std::string format_cdt(TimePoint tp);

// YYYY-MM-DD; бросает std::invalid_argument
boost::gregorian::date parse_date(const std::string &s);

std::string format_date(const boost::gregorian::date &d);

// Имя из встроенной таблицы (CET, UTC, Europe/Stockholm, ...) или
// posix-строка в нотации Boost (смещение положительное к востоку).
// Неизвестное имя -> UTC с предупреждением в лог.
TimeZonePtr resolve_timezone(const std::string &name);

boost::gregorian::date today_in(const TimeZonePtr &tz);

// [локальная полночь, следующая локальная полночь) в UTC
TimeWindow day_bounds(const boost::gregorian::date &d, const TimeZonePtr &tz);

TimePoint to_time_point(const boost::posix_time::ptime &pt);
boost::posix_time::ptime to_ptime(TimePoint tp);

// сон короткими шагами, прерывается при running == false
void sleep_with_checks(const std::atomic<bool> &running,
                       std::chrono::milliseconds dur);

inline std::chrono::milliseconds seconds_to_ms(double s) {
  return std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
}

} // namespace trafficgen
