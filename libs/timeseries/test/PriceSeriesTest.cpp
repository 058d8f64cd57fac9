#include <catch2/catch_test_macros.hpp>
#include <vector>
#include "PriceSeries.h"
#include "TestUtils.h"

using namespace mkc_markethealth;
using namespace boost::gregorian;

TEST_CASE ("PriceSeries construction and access", "[PriceSeries]")
{
  std::vector<PriceBar<DecimalType>> bars;
  bars.push_back(createPriceBar("20240102", "100.50", 1000));
  bars.push_back(createPriceBar("20240103", "101.25", 1200));
  bars.push_back(createPriceBar("20240105", "99.75", 900));

  PriceSeries<DecimalType> series("SPY", bars);

  REQUIRE (series.getSymbol() == "SPY");
  REQUIRE (series.getNumEntries() == 3);
  REQUIRE (series.getFirstDate() == createDate("20240102"));
  REQUIRE (series.getLastDate() == createDate("20240105"));
  REQUIRE (series.getEntry(1).getCloseValue() == createDecimal("101.25"));
  REQUIRE (series.getEntry(2).getVolume() == 900);
  REQUIRE (series.getLastEntry() == bars.back());

  std::vector<DecimalType> closes = series.getCloseValues();
  REQUIRE (closes.size() == 3);
  REQUIRE (closes.front() == createDecimal("100.50"));

  SECTION ("out of range session index")
    {
      REQUIRE_THROWS_AS (series.getEntry(3), std::out_of_range);
    }

  SECTION ("date lookup")
    {
      REQUIRE (series.isDateFound(createDate("20240103")));
      REQUIRE_FALSE (series.isDateFound(createDate("20240104")));
    }
}

TEST_CASE ("PriceSeries rejects invalid input", "[PriceSeries]")
{
  SECTION ("empty series")
    {
      REQUIRE_THROWS_AS (PriceSeries<DecimalType>("SPY", {}), InsufficientHistoryException);
    }

  SECTION ("duplicate dates")
    {
      std::vector<PriceBar<DecimalType>> bars { createPriceBar("20240102", "100", 10),
						createPriceBar("20240102", "101", 10) };
      REQUIRE_THROWS_AS (PriceSeries<DecimalType>("SPY", bars), NonMonotonicDatesException);
    }

  SECTION ("dates out of order")
    {
      std::vector<PriceBar<DecimalType>> bars { createPriceBar("20240103", "100", 10),
						createPriceBar("20240102", "101", 10) };
      REQUIRE_THROWS_AS (PriceSeries<DecimalType>("SPY", bars), NonMonotonicDatesException);
    }

  SECTION ("non-positive close")
    {
      std::vector<PriceBar<DecimalType>> bars { createPriceBar("20240102", "100", 10),
						createPriceBar("20240103", "0", 10) };
      REQUIRE_THROWS_AS (PriceSeries<DecimalType>("SPY", bars), DegenerateInputException);
    }
}

TEST_CASE ("PriceSeries session indices", "[PriceSeries]")
{
  // Mon 2024-01-01 through Fri 2024-01-12
  auto series = createDailySeries("QQQ", createDate("20240101"),
				  { 10, 11, 12, 13, 14, 15, 16, 17, 18, 19 });

  SECTION ("exact and in-between dates")
    {
      REQUIRE (series->getSessionIndex(createDate("20240101")).value() == 0);
      REQUIRE (series->getSessionIndex(createDate("20240105")).value() == 4);
      // Saturday maps to the Friday before it
      REQUIRE (series->getSessionIndex(createDate("20240106")).value() == 4);
      REQUIRE_FALSE (series->getSessionIndex(createDate("20231229")).has_value());
    }

  SECTION ("as-of index inside the series")
    {
      REQUIRE (series->getAsOfSessionIndex(createDate("20240108")) == 5);
      REQUIRE (series->getAsOfSessionIndex(createDate("20240112")) == 9);
    }

  SECTION ("as-of index past the last bar counts weekdays")
    {
      // Monday after the last Friday is one session later
      REQUIRE (series->getAsOfSessionIndex(createDate("20240115")) == 10);
      REQUIRE (series->getAsOfSessionIndex(createDate("20240114")) == 9);
      REQUIRE (series->getAsOfSessionIndex(createDate("20240119")) == 14);
    }

  SECTION ("as-of before the first bar")
    {
      REQUIRE_THROWS_AS (series->getAsOfSessionIndex(createDate("20231231")), ConfigurationException);
    }
}
