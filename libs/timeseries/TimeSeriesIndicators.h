// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TIMESERIES_INDICATORS_H
#define __TIMESERIES_INDICATORS_H 1

#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>
#include "DecimalConstants.h"
#include "PriceSeriesException.h"
#include "number.h"

namespace mkc_markethealth
{
  /**
   * @brief Mean of the last `period` values of a series.
   *
   * @return the average, or empty when the series is shorter than `period`.
   *         An unavailable indicator is reported as empty rather than zero.
   * @throws ConfigurationException if period is zero.
   */
  template <class Decimal>
  std::optional<Decimal> SimpleMovingAverage (const std::vector<Decimal>& values,
					      std::size_t period)
  {
    if (period == 0)
      throw ConfigurationException("SimpleMovingAverage: period must be positive");

    if (values.size() < period)
      return std::nullopt;

    Decimal sum = std::accumulate(values.end() - static_cast<std::ptrdiff_t>(period), values.end(),
				  DecimalConstants<Decimal>::DecimalZero);
    return sum / Decimal(static_cast<int>(period));
  }

  /**
   * @brief Trailing simple moving average at every position.
   *
   * Entry i holds the mean of values[i-period+1 .. i], or empty for the first
   * period-1 positions. Runs in O(n) with a running sum.
   */
  template <class Decimal>
  std::vector<std::optional<Decimal>> RollingSimpleMovingAverage (const std::vector<Decimal>& values,
								  std::size_t period)
  {
    if (period == 0)
      throw ConfigurationException("RollingSimpleMovingAverage: period must be positive");

    std::vector<std::optional<Decimal>> result(values.size());
    const Decimal divisor(static_cast<int>(period));
    Decimal runningSum(DecimalConstants<Decimal>::DecimalZero);

    for (std::size_t i = 0; i < values.size(); ++i)
      {
	runningSum += values[i];
	if (i >= period)
	  runningSum -= values[i - period];

	if (i + 1 >= period)
	  result[i] = runningSum / divisor;
      }

    return result;
  }

  /**
   * @brief Wilder relative strength index of the last value in the series.
   *
   * Average gains and losses are smoothed exponentially with alpha = 1/period,
   * seeded with the first price change. This is the same recursion used by
   * the common charting packages, so values line up with published RSI(14).
   *
   * @return RSI in [0, 100], or empty when fewer than period+1 values exist.
   *         100 when there are no losses, 50 when the series is flat.
   */
  template <class Decimal>
  std::optional<Decimal> RelativeStrengthIndex (const std::vector<Decimal>& values,
						std::size_t period)
  {
    if (period == 0)
      throw ConfigurationException("RelativeStrengthIndex: period must be positive");

    if (values.size() < period + 1)
      return std::nullopt;

    const double alpha = 1.0 / static_cast<double>(period);
    double avgGain = 0.0;
    double avgLoss = 0.0;

    for (std::size_t i = 1; i < values.size(); ++i)
      {
	const double change = num::to_double(values[i]) - num::to_double(values[i - 1]);
	const double gain = (change > 0.0) ? change : 0.0;
	const double loss = (change < 0.0) ? -change : 0.0;

	if (i == 1)
	  {
	    avgGain = gain;
	    avgLoss = loss;
	  }
	else
	  {
	    avgGain = (1.0 - alpha) * avgGain + alpha * gain;
	    avgLoss = (1.0 - alpha) * avgLoss + alpha * loss;
	  }
      }

    const double total = avgGain + avgLoss;
    if (total == 0.0)
      return Decimal(50.0);

    return Decimal(100.0 * avgGain / total);
  }
}

#endif
