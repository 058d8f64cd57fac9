#include <catch2/catch_test_macros.hpp>
#include "EquityCurve.h"
#include "TestUtils.h"

using namespace mkc_markethealth;

TEST_CASE ("Equity compounds period returns", "[EquityCurve]")
{
  EquityCurve<DecimalType> curve(createDate("20231229"), createDecimal("10000"));

  REQUIRE (curve.getNumPoints() == 1);
  REQUIRE (curve.getNumPeriods() == 0);
  REQUIRE (curve.getFinalEquity() == createDecimal("10000"));
  REQUIRE_FALSE (curve.getAnchor().isInvested());

  REQUIRE (curve.addPeriod(createDate("20240131"), createDecimal("0.10"), true) == createDecimal("11000"));
  REQUIRE (curve.addPeriod(createDate("20240229"), createDecimal("-0.20"), true) == createDecimal("8800"));
  REQUIRE (curve.addPeriod(createDate("20240328"), createDecimal("0.005"), false) == createDecimal("8844"));

  REQUIRE (curve.getNumPeriods() == 3);
  REQUIRE (curve.getInitialEquity() == createDecimal("10000"));
  REQUIRE (curve.getLastPoint().getDate() == createDate("20240328"));
  REQUIRE_FALSE (curve.getLastPoint().isInvested());
  REQUIRE (curve.getPoint(1).getPeriodReturn() == createDecimal("0.10"));

  auto returns = curve.getPeriodReturns();
  REQUIRE (returns.size() == 3);
  REQUIRE (returns[1] == createDecimal("-0.20"));

  unsigned long visited = 0;
  for (const auto& point : curve)
    {
      REQUIRE (point.getEquity() > createDecimal("0"));
      ++visited;
    }
  REQUIRE (visited == curve.getNumPoints());
}

TEST_CASE ("Equity curve rejects bad input", "[EquityCurve]")
{
  REQUIRE_THROWS_AS (EquityCurve<DecimalType>(createDate("20231229"), createDecimal("0")), DegenerateInputException);

  EquityCurve<DecimalType> curve(createDate("20231229"), createDecimal("100"));
  REQUIRE_THROWS_AS (curve.addPeriod(createDate("20231229"), createDecimal("0.01"), true), NonMonotonicDatesException);
  REQUIRE_THROWS_AS (curve.addPeriod(createDate("20231130"), createDecimal("0.01"), true), NonMonotonicDatesException);
  REQUIRE_THROWS (curve.getPoint(1));
}
