#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include "TimeSeriesIndicators.h"
#include "TestUtils.h"

using namespace mkc_markethealth;
using Catch::Approx;

namespace
{
  std::vector<DecimalType> toDecimals (const std::vector<double>& values)
  {
    std::vector<DecimalType> result;
    for (double v : values)
      result.push_back(DecimalType(v));

    return result;
  }
}

TEST_CASE ("SimpleMovingAverage", "[TimeSeriesIndicators]")
{
  std::vector<DecimalType> values = toDecimals({ 1, 2, 3, 4, 5, 6 });

  REQUIRE (SimpleMovingAverage(values, 3).value() == createDecimal("5.0"));
  REQUIRE (SimpleMovingAverage(values, 6).value() == createDecimal("3.5"));
  REQUIRE_FALSE (SimpleMovingAverage(values, 7).has_value());
  REQUIRE_THROWS_AS (SimpleMovingAverage(values, 0), ConfigurationException);
}

TEST_CASE ("RollingSimpleMovingAverage", "[TimeSeriesIndicators]")
{
  std::vector<DecimalType> values = toDecimals({ 2, 4, 6, 8 });
  auto rolling = RollingSimpleMovingAverage(values, 2);

  REQUIRE (rolling.size() == 4);
  REQUIRE_FALSE (rolling[0].has_value());
  REQUIRE (rolling[1].value() == createDecimal("3.0"));
  REQUIRE (rolling[2].value() == createDecimal("5.0"));
  REQUIRE (rolling[3].value() == createDecimal("7.0"));

  // Last rolling value agrees with the point estimate
  REQUIRE (rolling.back().value() == SimpleMovingAverage(values, 2).value());
}

TEST_CASE ("RelativeStrengthIndex", "[TimeSeriesIndicators]")
{
  SECTION ("not enough history")
    {
      std::vector<DecimalType> values = toDecimals({ 1, 2, 3 });
      REQUIRE_FALSE (RelativeStrengthIndex(values, 3).has_value());
      REQUIRE (RelativeStrengthIndex(values, 2).has_value());
    }

  SECTION ("only gains")
    {
      std::vector<DecimalType> values = toDecimals({ 1, 2, 3, 4, 5, 6 });
      REQUIRE (num::to_double(RelativeStrengthIndex(values, 3).value()) == Approx(100.0));
    }

  SECTION ("only losses")
    {
      std::vector<DecimalType> values = toDecimals({ 6, 5, 4, 3, 2, 1 });
      REQUIRE (num::to_double(RelativeStrengthIndex(values, 3).value()) == Approx(0.0));
    }

  SECTION ("flat series")
    {
      std::vector<DecimalType> values = toDecimals({ 5, 5, 5, 5, 5 });
      REQUIRE (num::to_double(RelativeStrengthIndex(values, 3).value()) == Approx(50.0));
    }

  SECTION ("Wilder smoothing")
    {
      // changes +1, -1 with period 2: gain 1 -> 0.5, loss 0 -> 0.5
      std::vector<DecimalType> values = toDecimals({ 10, 11, 10 });
      REQUIRE (num::to_double(RelativeStrengthIndex(values, 2).value()) == Approx(50.0));

      // changes +2, +2, -1 with period 2: gain 2, 2, 1 and loss 0, 0, 0.5
      values = toDecimals({ 10, 12, 14, 13 });
      REQUIRE (num::to_double(RelativeStrengthIndex(values, 2).value()) == Approx(100.0 * 1.0 / 1.5));
    }
}
