// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MONTHLY_SIGNAL_GENERATOR_H
#define __MONTHLY_SIGNAL_GENERATOR_H 1

#include <optional>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "TimeSeriesIndicators.h"
#include "TrendGuardConfiguration.h"

namespace mkc_markethealth
{
  enum class Position { INVESTED, CASH };

  inline std::string toString (Position position)
  {
    return (position == Position::INVESTED) ? "INVESTED" : "CASH";
  }

  template <class Decimal>
  class MonthlyObservation
  {
  public:
    MonthlyObservation (const TimeSeriesDate& monthEndDate,
			const Decimal& price,
			const std::optional<Decimal>& trailingSMA,
			const std::optional<Position>& rawSignal,
			const std::optional<Position>& positionForThisMonth)
      : mMonthEndDate(monthEndDate),
	mPrice(price),
	mTrailingSMA(trailingSMA),
	mRawSignal(rawSignal),
	mPositionForThisMonth(positionForThisMonth)
    {}

    // Date of the last session of the month
    const TimeSeriesDate& getMonthEndDate() const { return mMonthEndDate; }
    const Decimal& getPrice() const { return mPrice; }
    const std::optional<Decimal>& getTrailingSMA() const { return mTrailingSMA; }

    // Signal computed from this month's close; acted on next month
    const std::optional<Position>& getRawSignal() const { return mRawSignal; }

    // Position held during this month, i.e. last month's raw signal
    const std::optional<Position>& getPositionForThisMonth() const { return mPositionForThisMonth; }

  private:
    TimeSeriesDate mMonthEndDate;
    Decimal mPrice;
    std::optional<Decimal> mTrailingSMA;
    std::optional<Position> mRawSignal;
    std::optional<Position> mPositionForThisMonth;
  };

  /**
   * @brief Month-end prices, trailing SMA and the lagged invested/cash signal.
   *
   * The month-end price is the last close in each calendar month. The raw
   * signal for month m is INVESTED when price >= SMA. It is only known at the
   * close of month m, so the position held during month m is the raw signal of
   * month m-1. Same-month information never drives a position.
   */
  template <class Decimal>
  class MonthlySignalGenerator
  {
  public:
    explicit MonthlySignalGenerator (unsigned int smaLookbackMonths =
				     TrendGuardConfiguration<Decimal>::DefaultSmaLookbackMonths)
      : mSmaLookbackMonths(smaLookbackMonths)
    {
      if (mSmaLookbackMonths < 1)
	throw ConfigurationException("MonthlySignalGenerator: SMA lookback must be at least one month");
    }

    unsigned int getSmaLookbackMonths() const
    {
      return mSmaLookbackMonths;
    }

    std::vector<MonthlyObservation<Decimal>> generate (const PriceSeries<Decimal>& series) const
    {
      std::vector<TimeSeriesDate> monthEndDates;
      std::vector<Decimal> monthEndPrices;

      for (auto it = series.beginSortedAccess(); it != series.endSortedAccess(); ++it)
	{
	  if (!monthEndDates.empty() && yearMonthKey(monthEndDates.back()) == yearMonthKey(it->getDate()))
	    {
	      monthEndDates.back() = it->getDate();
	      monthEndPrices.back() = it->getCloseValue();
	    }
	  else
	    {
	      monthEndDates.push_back(it->getDate());
	      monthEndPrices.push_back(it->getCloseValue());
	    }
	}

      std::vector<std::optional<Decimal>> sma = RollingSimpleMovingAverage(monthEndPrices, mSmaLookbackMonths);

      std::vector<MonthlyObservation<Decimal>> observations;
      observations.reserve(monthEndPrices.size());

      std::optional<Position> previousSignal;
      for (std::size_t m = 0; m < monthEndPrices.size(); ++m)
	{
	  std::optional<Position> rawSignal;
	  if (sma[m])
	    rawSignal = (monthEndPrices[m] >= *sma[m]) ? Position::INVESTED : Position::CASH;

	  observations.emplace_back(monthEndDates[m], monthEndPrices[m], sma[m], rawSignal, previousSignal);
	  previousSignal = rawSignal;
	}

      return observations;
    }

  private:
    unsigned int mSmaLookbackMonths;
  };
}

#endif
