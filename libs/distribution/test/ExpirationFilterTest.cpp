#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cmath>
#include "DistributionDayDetector.h"
#include "ExpirationFilter.h"
#include "MarketConditionAssessor.h"
#include "TestUtils.h"

using namespace mkc_markethealth;

namespace
{
  // 27 sessions. Distribution days at session 1 (close 99) and session 5
  // (close 98). Closes never rally enough to trigger a price recovery.
  std::shared_ptr<SeriesType> createAgingSeries()
  {
    std::vector<double> closes { 100, 99, 99, 99, 99, 98 };
    std::vector<VolumeType> volumes { 1000, 2000, 1000, 1000, 1000, 3000 };
    while (closes.size() < 27)
      {
	closes.push_back(98);
	volumes.push_back(1000);
      }

    return createDailySeries("SPY", createDate("20240102"), closes, volumes);
  }

  // Distribution day at session 1 (close 95) followed by a rally to exactly
  // 5% above it at session 3.
  std::shared_ptr<SeriesType> createRecoverySeries()
  {
    return createDailySeries("SPY", createDate("20240102"),
			     { 100, 95, 97, 99.75, 99 },
			     { 1000, 2000, 1000, 1000, 1000 });
  }
}

TEST_CASE ("Time expiration after the configured number of sessions", "[ExpirationFilter]")
{
  auto series = createAgingSeries();
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  REQUIRE (records.size() == 2);
  REQUIRE (records[0].getSessionIndex() == 1);
  REQUIRE (records[1].getSessionIndex() == 5);

  ExpirationFilter<DecimalType> filter;

  SECTION ("one session before expiry both records are active")
    {
      filter.apply(records, *series, series->getEntry(25).getDate());
      REQUIRE_FALSE (records[0].isExpired());
      REQUIRE_FALSE (records[1].isExpired());
    }

  SECTION ("the 25th session after a record expires it")
    {
      filter.apply(records, *series);
      REQUIRE (records[0].isExpired());
      REQUIRE (records[0].getExpirationReason() == ExpirationReason::TIME);
      REQUIRE (records[0].getExpirationDate().value() == series->getEntry(26).getDate());
      REQUIRE_FALSE (records[1].isExpired());

      auto active = activeDistributionDays(records, series->getLastDate());
      REQUIRE (active.size() == 1);
      REQUIRE (active.front().getSessionIndex() == 5);
    }

  SECTION ("as-of dates past the data count weekdays as sessions")
    {
      // Session 30 is four weekdays after the last bar
      const TimeSeriesDate asOf = consecutiveWeekdays(series->getLastDate(), 5).back();
      filter.apply(records, *series, asOf);

      REQUIRE (records[0].getExpirationReason() == ExpirationReason::TIME);
      REQUIRE (records[1].getExpirationReason() == ExpirationReason::TIME);
      REQUIRE_FALSE (records[1].getExpirationDate().has_value());
    }

  SECTION ("shorter expiration window")
    {
      DistributionDayConfiguration<DecimalType> config;
      config.setExpirationSessions(4);
      ExpirationFilter<DecimalType>(config).apply(records, *series, series->getEntry(5).getDate());

      REQUIRE (records[0].getExpirationReason() == ExpirationReason::TIME);
      REQUIRE (records[0].getExpirationDate().value() == series->getEntry(5).getDate());
      REQUIRE_FALSE (records[1].isExpired());
    }
}

TEST_CASE ("Price recovery expiration", "[ExpirationFilter]")
{
  auto series = createRecoverySeries();
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  REQUIRE (records.size() == 1);

  SECTION ("rally to the recovery threshold expires the record")
    {
      ExpirationFilter<DecimalType>().apply(records, *series);
      REQUIRE (records[0].getExpirationReason() == ExpirationReason::PRICE_RECOVERY);
      REQUIRE (records[0].getExpirationDate().value() == series->getEntry(3).getDate());
    }

  SECTION ("a recovery after the as-of date is ignored")
    {
      ExpirationFilter<DecimalType>().apply(records, *series, series->getEntry(2).getDate());
      REQUIRE_FALSE (records[0].isExpired());
    }

  SECTION ("a higher threshold is not reached")
    {
      DistributionDayConfiguration<DecimalType> config;
      config.setRecoveryThreshold(createDecimal("0.06"));
      ExpirationFilter<DecimalType>(config).apply(records, *series);
      REQUIRE_FALSE (records[0].isExpired());
    }

  SECTION ("recovery and time expiry on the same session report recovery")
    {
      DistributionDayConfiguration<DecimalType> config;
      config.setExpirationSessions(2);
      ExpirationFilter<DecimalType>(config).apply(records, *series);
      REQUIRE (records[0].getExpirationReason() == ExpirationReason::PRICE_RECOVERY);
    }
}

TEST_CASE ("Every active record is below its recovery price", "[ExpirationFilter]")
{
  std::vector<double> closes;
  std::vector<VolumeType> volumes;
  double price = 100.0;
  VolumeType volume = 1000;
  for (int i = 0; i < 120; ++i)
    {
      // Saw-tooth: three down days on rising volume, then a rally
      const int phase = i % 7;
      price = (phase < 3) ? price * 0.98 : price * 1.025;
      volume = (phase < 3) ? volume + 100 : 1000;
      closes.push_back(price);
      volumes.push_back(volume);
    }

  auto series = createDailySeries("SPY", createDate("20240102"), closes, volumes);
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  REQUIRE_FALSE (records.empty());

  ExpirationFilter<DecimalType>().apply(records, *series);
  const DecimalType multiplier = createDecimal("1.05");
  const unsigned long lastSession = series->getNumEntries() - 1;

  unsigned int recovered = 0;
  for (const auto& record : records)
    {
      if (record.getExpirationReason() == ExpirationReason::PRICE_RECOVERY)
	{
	  ++recovered;
	  auto recoverySession = series->getSessionIndex(record.getExpirationDate().value());
	  REQUIRE (recoverySession.has_value());
	  REQUIRE (*recoverySession > record.getSessionIndex());
	  REQUIRE (*recoverySession <= lastSession);
	  REQUIRE (series->getEntry(*recoverySession).getCloseValue() >= record.getCloseValue() * multiplier);

	  // and it is the first such session
	  for (unsigned long s = record.getSessionIndex() + 1; s < *recoverySession; ++s)
	    REQUIRE (series->getEntry(s).getCloseValue() < record.getCloseValue() * multiplier);
	  continue;
	}

      if (record.isExpired())
	continue;

      REQUIRE (lastSession - record.getSessionIndex() + 1 <= 25);
      for (unsigned long s = record.getSessionIndex() + 1; s <= lastSession; ++s)
	REQUIRE (series->getEntry(s).getCloseValue() < record.getCloseValue() * multiplier);
    }

  REQUIRE (recovered > 0);
}

TEST_CASE ("Steady decline on rising volume ages the oldest day out", "[ExpirationFilter]")
{
  // 26 sessions, each closing 1% lower on 10% more volume
  std::vector<double> closes;
  std::vector<VolumeType> volumes;
  for (int i = 0; i < 26; ++i)
    {
      closes.push_back(100.0 * std::pow(0.99, i));
      volumes.push_back(static_cast<VolumeType>(std::llround(1000.0 * std::pow(1.1, i))));
    }

  auto series = createDailySeries("SPY", createDate("20240102"), closes, volumes);
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  REQUIRE (records.size() == 25);

  // One session past the last bar
  const TimeSeriesDate asOf = boost_next_weekday(series->getLastDate());
  ExpirationFilter<DecimalType>().apply(records, *series, asOf);

  unsigned int timeExpired = 0;
  unsigned int active = 0;
  for (const auto& record : records)
    {
      REQUIRE (record.getExpirationReason() != ExpirationReason::PRICE_RECOVERY);
      if (record.getExpirationReason() == ExpirationReason::TIME)
	++timeExpired;
      else
	++active;
    }

  REQUIRE (timeExpired == 1);
  REQUIRE (records.front().getExpirationReason() == ExpirationReason::TIME);
  REQUIRE_FALSE (records[1].isExpired());

  auto condition = MarketConditionAssessor<DecimalType>().assess(records, *series, asOf);
  REQUIRE (condition.getTotalCount() == active);
  REQUIRE (condition.getTotalCount() == 24);
  REQUIRE (condition.getVerdict() == MarketVerdict::HIGH_PRESSURE);
}

TEST_CASE ("Expiration is recomputed on every call", "[ExpirationFilter]")
{
  auto series = createAgingSeries();
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  ExpirationFilter<DecimalType> filter;

  filter.apply(records, *series);
  auto firstPass = records;

  filter.apply(records, *series, series->getEntry(10).getDate());
  REQUIRE_FALSE (records[0].isExpired());

  filter.apply(records, *series);
  for (std::size_t i = 0; i < records.size(); ++i)
    {
      REQUIRE (records[i].getExpirationReason() == firstPass[i].getExpirationReason());
      REQUIRE (records[i].getExpirationDate() == firstPass[i].getExpirationDate());
    }
}

TEST_CASE ("Expiration filter input checks", "[ExpirationFilter]")
{
  auto series = createAgingSeries();
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  ExpirationFilter<DecimalType> filter;

  SECTION ("records out of session order")
    {
      std::reverse(records.begin(), records.end());
      REQUIRE_THROWS_AS (filter.apply(records, *series), DegenerateInputException);
    }

  SECTION ("as-of before the series")
    {
      REQUIRE_THROWS_AS (filter.apply(records, *series, createDate("20231229")), ConfigurationException);
    }

  SECTION ("no records")
    {
      std::vector<DistributionDayRecord<DecimalType>> none;
      REQUIRE_NOTHROW (filter.apply(none, *series));
    }
}
