#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "DistributionDayDetector.h"
#include "ExpirationFilter.h"
#include "MarketConditionAssessor.h"
#include "TestUtils.h"

using namespace mkc_markethealth;
using Catch::Approx;

namespace
{
  // Distribution days at sessions 1 and 10 of a 12 session series
  std::shared_ptr<SeriesType> createTwoDaySeries()
  {
    std::vector<double> closes { 100, 99 };
    std::vector<VolumeType> volumes { 1000, 2000 };
    for (int i = 2; i < 10; ++i)
      {
	closes.push_back(99);
	volumes.push_back(1000);
      }

    closes.push_back(98);
    volumes.push_back(2000);
    closes.push_back(98);
    volumes.push_back(1000);

    return createDailySeries("QQQ", createDate("20240102"), closes, volumes);
  }
}

TEST_CASE ("Verdict classification by counts", "[MarketConditionAssessor]")
{
  MarketConditionAssessor<DecimalType> assessor;
  const DecimalType zero = createDecimal("0");

  REQUIRE (assessor.classify(0, 0, zero) == MarketVerdict::HEALTHY);
  REQUIRE (assessor.classify(4, 3, zero) == MarketVerdict::HEALTHY);
  REQUIRE (assessor.classify(5, 0, zero) == MarketVerdict::MODERATE_PRESSURE);
  REQUIRE (assessor.classify(7, 3, zero) == MarketVerdict::MODERATE_PRESSURE);
  REQUIRE (assessor.classify(8, 0, zero) == MarketVerdict::HIGH_PRESSURE);
  REQUIRE (assessor.classify(4, 4, zero) == MarketVerdict::HIGH_PRESSURE);
}

TEST_CASE ("Optional verdict thresholds", "[MarketConditionAssessor]")
{
  MarketConditionThresholds<DecimalType> thresholds;

  SECTION ("weighted change thresholds")
    {
      thresholds.setWeightedChangeThresholds(createDecimal("-0.05"), createDecimal("-0.10"));
      MarketConditionAssessor<DecimalType> assessor(thresholds);

      REQUIRE (assessor.classify(1, 0, createDecimal("-0.04")) == MarketVerdict::HEALTHY);
      REQUIRE (assessor.classify(1, 0, createDecimal("-0.05")) == MarketVerdict::MODERATE_PRESSURE);
      REQUIRE (assessor.classify(1, 0, createDecimal("-0.12")) == MarketVerdict::HIGH_PRESSURE);
    }

  SECTION ("recent moderate count")
    {
      thresholds.setRecentModerateCount(2u);
      MarketConditionAssessor<DecimalType> assessor(thresholds);

      REQUIRE (assessor.classify(1, 1, createDecimal("0")) == MarketVerdict::HEALTHY);
      REQUIRE (assessor.classify(2, 2, createDecimal("0")) == MarketVerdict::MODERATE_PRESSURE);
    }

  SECTION ("inconsistent thresholds are rejected")
    {
      REQUIRE_THROWS_AS (thresholds.setCountThresholds(9, 8), ConfigurationException);
      REQUIRE_THROWS_AS (thresholds.setRecentWindowSessions(0), ConfigurationException);
      REQUIRE_THROWS_AS (thresholds.setRecentModerateCount(5u), ConfigurationException);
      REQUIRE_THROWS_AS (thresholds.setWeightedChangeThresholds(createDecimal("-0.10"), createDecimal("-0.05")),
			 ConfigurationException);
    }
}

TEST_CASE ("Assessment counts active and recent records", "[MarketConditionAssessor]")
{
  auto series = createTwoDaySeries();
  auto records = DistributionDayDetector<DecimalType>().detect(*series);
  REQUIRE (records.size() == 2);

  ExpirationFilter<DecimalType>().apply(records, *series);
  auto condition = MarketConditionAssessor<DecimalType>().assess(records, *series);

  REQUIRE (condition.getAsOfDate() == series->getLastDate());
  REQUIRE (condition.getTotalCount() == 2);
  // Session 1 is 11 sessions back from session 11, outside the 10 session window
  REQUIRE (condition.getRecentCount() == 1);
  REQUIRE (num::to_double(condition.getTotalWeightedChange()) ==
	   Approx(-0.02 + (98.0 / 99.0 - 1.0) * 2.0).margin(1e-6));
  REQUIRE (condition.getVerdict() == MarketVerdict::HEALTHY);
  REQUIRE (condition.getDescription() == describeVerdict(MarketVerdict::HEALTHY));

  SECTION ("widening the recent window")
    {
      MarketConditionThresholds<DecimalType> thresholds;
      thresholds.setRecentWindowSessions(11);
      auto wider = MarketConditionAssessor<DecimalType>(thresholds).assess(records, *series);
      REQUIRE (wider.getRecentCount() == 2);
    }

  SECTION ("records after the as-of date are ignored")
    {
      const TimeSeriesDate asOf = series->getEntry(5).getDate();
      ExpirationFilter<DecimalType>().apply(records, *series, asOf);
      auto earlier = MarketConditionAssessor<DecimalType>().assess(records, *series, asOf);
      REQUIRE (earlier.getTotalCount() == 1);
      REQUIRE (earlier.getRecentCount() == 1);
    }
}

TEST_CASE ("Distribution statistics", "[DistributionStatistics]")
{
  SECTION ("no records")
    {
      std::vector<DistributionDayRecord<DecimalType>> none;
      DistributionStatistics<DecimalType> statistics(none);
      REQUIRE (statistics.getDetectedCount() == 0);
      REQUIRE (statistics.getTotalWeightedChange() == createDecimal("0"));
      REQUIRE_FALSE (statistics.getAverageVolumeIncrease().has_value());
    }

  SECTION ("expired records still count")
    {
      auto series = createTwoDaySeries();
      auto records = DistributionDayDetector<DecimalType>().detect(*series);

      DistributionDayConfiguration<DecimalType> config;
      config.setExpirationSessions(2);
      ExpirationFilter<DecimalType>(config).apply(records, *series);
      REQUIRE (records[0].isExpired());

      DistributionStatistics<DecimalType> statistics(records);
      REQUIRE (statistics.getDetectedCount() == 2);
      REQUIRE (statistics.getAverageVolumeIncrease().value() == createDecimal("1.0"));
    }
}
