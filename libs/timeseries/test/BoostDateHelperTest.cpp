#include <catch2/catch_test_macros.hpp>
#include "BoostDateHelper.h"
#include "TestUtils.h"

using namespace mkc_markethealth;

TEST_CASE ("Weekday helpers", "[BoostDateHelper]")
{
  REQUIRE (isWeekday(createDate("20240105")));
  REQUIRE (isWeekend(createDate("20240106")));
  REQUIRE (isWeekend(createDate("20240107")));

  REQUIRE (boost_next_weekday(createDate("20240105")) == createDate("20240108"));
  REQUIRE (boost_next_weekday(createDate("20240106")) == createDate("20240108"));
  REQUIRE (boost_next_weekday(createDate("20240102")) == createDate("20240103"));
}

TEST_CASE ("weekdaysAfter counts the half open interval", "[BoostDateHelper]")
{
  const TimeSeriesDate friday = createDate("20240105");

  REQUIRE (weekdaysAfter(friday, friday) == 0);
  REQUIRE (weekdaysAfter(friday, createDate("20240101")) == 0);
  REQUIRE (weekdaysAfter(friday, createDate("20240107")) == 0);
  REQUIRE (weekdaysAfter(friday, createDate("20240108")) == 1);
  REQUIRE (weekdaysAfter(friday, createDate("20240112")) == 5);
  REQUIRE (weekdaysAfter(friday, createDate("20240202")) == 20);

  // Start mid-week, span several full weeks plus a remainder
  REQUIRE (weekdaysAfter(createDate("20240103"), createDate("20240122")) == 13);
}

TEST_CASE ("Month helpers", "[BoostDateHelper]")
{
  REQUIRE (last_of_month(createDate("20240210")) == createDate("20240229"));
  REQUIRE (yearMonthKey(createDate("20240131")) + 1 == yearMonthKey(createDate("20240201")));
  REQUIRE (yearMonthKey(createDate("20231215")) + 1 == yearMonthKey(createDate("20240101")));
}
