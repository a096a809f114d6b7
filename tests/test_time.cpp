#include <gtest/gtest.h>
#include <trafficgen/time_utils.hpp>

#include <stdexcept>

using namespace trafficgen;
namespace bg = boost::gregorian;

TEST(TimeFormat, CdtIsUtcSeconds) {
  EXPECT_EQ(format_cdt(Clock::from_time_t(1'730'000'000)),
            "2024-10-27 03:33:20");
}

TEST(TimeFormat, CdtDropsSubseconds) {
  const auto tp = Clock::from_time_t(0) + std::chrono::milliseconds(1999);
  EXPECT_EQ(format_cdt(tp), "1970-01-01 00:00:01");
}

TEST(TimeFormat, ParseDateRoundTrip) {
  EXPECT_EQ(format_date(parse_date("2024-10-01")), "2024-10-01");
}

TEST(TimeFormat, ParseDateRejectsGarbage) {
  EXPECT_THROW(parse_date("2024-13-01"), std::invalid_argument);
  EXPECT_THROW(parse_date("2024/10/01"), std::invalid_argument);
  EXPECT_THROW(parse_date("2024-10-1"), std::invalid_argument);
  EXPECT_THROW(parse_date(""), std::invalid_argument);
}

TEST(DayBounds, UtcIsMidnightToMidnight) {
  const auto w = day_bounds(bg::date(2024, 10, 1), resolve_timezone("UTC"));
  EXPECT_EQ(format_cdt(w.begin), "2024-10-01 00:00:00");
  EXPECT_EQ(format_cdt(w.end), "2024-10-02 00:00:00");
}

TEST(DayBounds, CentralEuropeSummerAndWinter) {
  const auto tz = resolve_timezone("CET");
  const auto summer = day_bounds(bg::date(2024, 7, 1), tz);
  EXPECT_EQ(format_cdt(summer.begin), "2024-06-30 22:00:00");
  EXPECT_EQ(format_cdt(summer.end), "2024-07-01 22:00:00");

  const auto winter = day_bounds(bg::date(2024, 1, 15), tz);
  EXPECT_EQ(format_cdt(winter.begin), "2024-01-14 23:00:00");
}

TEST(DayBounds, FallBackDayHas25Hours) {
  const auto w = day_bounds(bg::date(2024, 10, 27), resolve_timezone("CET"));
  EXPECT_EQ(w.end - w.begin, std::chrono::hours(25));
}

TEST(Timezone, UnknownNameFallsBackToUtc) {
  const auto w =
      day_bounds(bg::date(2024, 3, 3), resolve_timezone("Mars/Olympus"));
  EXPECT_EQ(format_cdt(w.begin), "2024-03-03 00:00:00");
}

TEST(Sleep, ReturnsEarlyWhenStopped) {
  std::atomic<bool> running{false};
  const auto t0 = std::chrono::steady_clock::now();
  sleep_with_checks(running, std::chrono::seconds(5));
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(1));
}
