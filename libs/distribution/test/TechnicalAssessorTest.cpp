#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TechnicalAssessor.h"
#include "TestUtils.h"

using namespace mkc_markethealth;
using Catch::Approx;

namespace
{
  TechnicalIndicatorConfiguration<DecimalType> shortPeriods()
  {
    return TechnicalIndicatorConfiguration<DecimalType>(3, 5, 3, createDecimal("70"), createDecimal("30"));
  }
}

TEST_CASE ("Rising and falling series", "[TechnicalAssessor]")
{
  TechnicalAssessor<DecimalType> assessor(shortPeriods());

  SECTION ("rising")
    {
      auto series = createDailySeries("SPY", createDate("20240102"), { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });
      auto snapshot = assessor.assess(*series);

      REQUIRE (snapshot.getAsOfDate() == series->getLastDate());
      REQUIRE (snapshot.getLastClose() == createDecimal("10"));
      REQUIRE (snapshot.getShortMA().value() == createDecimal("9"));
      REQUIRE (snapshot.getLongMA().value() == createDecimal("8"));
      REQUIRE (num::to_double(snapshot.getRsi().value()) == Approx(100.0));
      REQUIRE (snapshot.getTrend() == TrendState::STRONG_UPTREND);
      REQUIRE (snapshot.getMomentum() == MomentumState::OVERBOUGHT);
    }

  SECTION ("falling")
    {
      auto series = createDailySeries("SPY", createDate("20240102"), { 10, 9, 8, 7, 6, 5, 4, 3, 2, 1 });
      auto snapshot = assessor.assess(*series);

      REQUIRE (snapshot.getTrend() == TrendState::STRONG_DOWNTREND);
      REQUIRE (snapshot.getMomentum() == MomentumState::OVERSOLD);
    }

  SECTION ("as-of inside the series uses only earlier bars")
    {
      auto series = createDailySeries("SPY", createDate("20240102"), { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });
      auto snapshot = assessor.assess(*series, series->getEntry(4).getDate());

      REQUIRE (snapshot.getLastClose() == createDecimal("5"));
      REQUIRE (snapshot.getLongMA().value() == createDecimal("3"));
    }

  SECTION ("as-of before the series")
    {
      auto series = createDailySeries("SPY", createDate("20240102"), { 1, 2, 3 });
      REQUIRE_THROWS_AS (assessor.assess(*series, createDate("20231201")), ConfigurationException);
    }
}

TEST_CASE ("Indicators without enough history are unavailable", "[TechnicalAssessor]")
{
  TechnicalAssessor<DecimalType> assessor(shortPeriods());
  auto series = createDailySeries("SPY", createDate("20240102"), { 5, 4, 6, 5 });
  auto snapshot = assessor.assess(*series);

  REQUIRE (snapshot.getShortMA().has_value());
  REQUIRE_FALSE (snapshot.getLongMA().has_value());
  REQUIRE (snapshot.getRsi().has_value());
  REQUIRE (snapshot.getTrend() == TrendState::UNAVAILABLE);

  auto single = createDailySeries("SPY", createDate("20240102"), { 5 });
  auto bare = assessor.assess(*single);
  REQUIRE_FALSE (bare.getShortMA().has_value());
  REQUIRE_FALSE (bare.getRsi().has_value());
  REQUIRE (bare.getMomentum() == MomentumState::UNAVAILABLE);
}

TEST_CASE ("Trend and momentum classification", "[TechnicalAssessor]")
{
  using Assessor = TechnicalAssessor<DecimalType>;

  REQUIRE (Assessor::classifyTrend(createDecimal("10"), createDecimal("11"), createDecimal("9")) ==
	   TrendState::BULLISH);
  REQUIRE (Assessor::classifyTrend(createDecimal("8"), createDecimal("7"), createDecimal("9")) ==
	   TrendState::BEARISH);
  REQUIRE (Assessor::classifyTrend(createDecimal("8"), std::nullopt, createDecimal("9")) ==
	   TrendState::UNAVAILABLE);

  Assessor assessor(shortPeriods());
  REQUIRE (assessor.classifyMomentum(createDecimal("70")) == MomentumState::NEUTRAL);
  REQUIRE (assessor.classifyMomentum(createDecimal("70.5")) == MomentumState::OVERBOUGHT);
  REQUIRE (assessor.classifyMomentum(createDecimal("30")) == MomentumState::NEUTRAL);
  REQUIRE (assessor.classifyMomentum(createDecimal("29.9")) == MomentumState::OVERSOLD);

  REQUIRE (toString(TrendState::STRONG_UPTREND) == "STRONG_UPTREND");
  REQUIRE (toString(MomentumState::OVERSOLD) == "OVERSOLD");
}

TEST_CASE ("Technical configuration validation", "[TechnicalIndicatorConfiguration]")
{
  REQUIRE_THROWS_AS (TechnicalIndicatorConfiguration<DecimalType>(50, 50, 14, createDecimal("70"), createDecimal("30")),
		     ConfigurationException);
  REQUIRE_THROWS_AS (TechnicalIndicatorConfiguration<DecimalType>(50, 200, 0, createDecimal("70"), createDecimal("30")),
		     ConfigurationException);
  REQUIRE_THROWS_AS (TechnicalIndicatorConfiguration<DecimalType>(50, 200, 14, createDecimal("30"), createDecimal("70")),
		     ConfigurationException);
}
