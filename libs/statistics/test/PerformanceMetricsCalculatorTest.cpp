#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "PerformanceMetricsCalculator.h"
#include "TestUtils.h"

using namespace mkc_markethealth;
using namespace boost::gregorian;
using Catch::Approx;

namespace
{
  EquityCurve<DecimalType> createCurve (const std::vector<double>& returns, const std::vector<bool>& invested)
  {
    date monthEnd = createDate("20031231");
    EquityCurve<DecimalType> curve(monthEnd, createDecimal("10000"));
    for (std::size_t i = 0; i < returns.size(); ++i)
      {
	monthEnd = (monthEnd + days(1)).end_of_month();
	curve.addPeriod(monthEnd, DecimalType(returns[i]), invested[i]);
      }

    return curve;
  }
}

TEST_CASE ("Maximum drawdown", "[PerformanceMetricsCalculator]")
{
  auto curve = createCurve({ 0.10, -0.20, 0.05 }, { true, true, true });
  REQUIRE (num::to_double(PerformanceMetricsCalculator<DecimalType>::computeMaxDrawdown(curve)) ==
	   Approx(-0.2).margin(1e-6));

  SECTION ("a curve that never falls has no drawdown")
    {
      auto rising = createCurve({ 0.01, 0.02, 0.0 }, { true, true, true });
      REQUIRE (PerformanceMetricsCalculator<DecimalType>::computeMaxDrawdown(rising) == createDecimal("0"));
    }

  SECTION ("a fall from the initial equity counts")
    {
      auto falling = createCurve({ -0.10, 0.05 }, { true, true });
      REQUIRE (num::to_double(PerformanceMetricsCalculator<DecimalType>::computeMaxDrawdown(falling)) ==
	       Approx(-0.10).margin(1e-6));
    }
}

TEST_CASE ("CAGR over a long monthly history", "[PerformanceMetricsCalculator]")
{
  const std::size_t months = 254;
  auto curve = createCurve(std::vector<double>(months, 0.01), std::vector<bool>(months, true));

  PerformanceMetricsCalculator<DecimalType> calculator(createDecimal("0"));
  auto result = calculator.compute(curve);

  REQUIRE (result.getMonthCount() == months);
  REQUIRE (num::to_double(result.getCAGR()) == Approx(std::pow(1.01, 12.0) - 1.0).margin(1e-4));
  REQUIRE (num::to_double(result.getTotalReturn()) == Approx(std::pow(1.01, 254.0) - 1.0).epsilon(1e-4));
  REQUIRE (result.getMaxDrawdown() == createDecimal("0"));
  REQUIRE (result.getSharpeRatio() == createDecimal("0"));
  REQUIRE (num::to_double(result.getTimeInvestedFraction()) == Approx(1.0));
  REQUIRE (result.getPeriodStart() == createDate("20031231"));
  REQUIRE (result.getPeriodEnd() == curve.getLastPoint().getDate());
  REQUIRE (result.getInitialEquity() == createDecimal("10000"));
}

TEST_CASE ("Sharpe and time invested", "[PerformanceMetricsCalculator]")
{
  auto curve = createCurve({ 0.01, 0.03, 0.01, 0.03 }, { true, false, true, false });
  PerformanceMetricsCalculator<DecimalType> calculator(createDecimal("0.01"));
  auto result = calculator.compute(curve);

  const double sd = std::sqrt(4.0 * 0.0001 / 3.0);
  REQUIRE (num::to_double(result.getSharpeRatio()) == Approx(0.01 / sd * std::sqrt(12.0)).epsilon(1e-5));
  REQUIRE (num::to_double(result.getTimeInvestedFraction()) == Approx(0.5));
  REQUIRE (calculator.getPeriodsPerYear() == 12);
}

TEST_CASE ("Metrics need at least one period", "[PerformanceMetricsCalculator]")
{
  EquityCurve<DecimalType> curve(createDate("20231229"), createDecimal("100"));
  PerformanceMetricsCalculator<DecimalType> calculator(createDecimal("0"));

  REQUIRE_THROWS_AS (calculator.compute(curve), InsufficientHistoryException);
  REQUIRE_THROWS_AS (PerformanceMetricsCalculator<DecimalType>(createDecimal("0"), 0), ConfigurationException);
}
