// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __BACKTEST_SIMULATOR_H
#define __BACKTEST_SIMULATOR_H 1

#include <vector>
#include "EquityCurve.h"
#include "MonthlySignalGenerator.h"
#include "TrendGuardConfiguration.h"

namespace mkc_markethealth
{
  // Strategy and buy-and-hold curves over the same months
  template <class Decimal>
  class SimulatedCurves
  {
  public:
    SimulatedCurves (EquityCurve<Decimal> strategy, EquityCurve<Decimal> buyAndHold)
      : mStrategy(std::move(strategy)),
	mBuyAndHold(std::move(buyAndHold))
    {}

    const EquityCurve<Decimal>& getStrategyCurve() const { return mStrategy; }
    const EquityCurve<Decimal>& getBuyAndHoldCurve() const { return mBuyAndHold; }

  private:
    EquityCurve<Decimal> mStrategy;
    EquityCurve<Decimal> mBuyAndHold;
  };

  /**
   * @brief Walks the monthly observations and compounds both equity curves.
   *
   * The first tradable month is the first one with a position. The month
   * before it is the anchor: its price is the base of the first return and both
   * curves start there at the initial capital. For every tradable month
   *
   *   assetReturn = price[m] / price[m-1] - 1
   *   strategy    = assetReturn when INVESTED, cash monthly rate when in CASH
   *   buy & hold  = assetReturn
   */
  template <class Decimal>
  class BacktestSimulator
  {
  public:
    explicit BacktestSimulator (const TrendGuardConfiguration<Decimal>& config =
				TrendGuardConfiguration<Decimal>())
      : mConfig(config)
    {}

    const TrendGuardConfiguration<Decimal>& getConfiguration() const
    {
      return mConfig;
    }

    /**
     * @throws InsufficientHistoryException when no month has a position.
     * @throws DegenerateInputException on a non-positive month-end price.
     */
    SimulatedCurves<Decimal> run (const std::vector<MonthlyObservation<Decimal>>& observations) const
    {
      std::size_t firstTradable = 0;
      while (firstTradable < observations.size() && !observations[firstTradable].getPositionForThisMonth())
	++firstTradable;

      if (firstTradable == observations.size())
	throw InsufficientHistoryException("BacktestSimulator: need more than " +
					   std::to_string(mConfig.getSmaLookbackMonths()) +
					   " months of history for a tradable month");

      const MonthlyObservation<Decimal>& anchor = observations[firstTradable - 1];
      EquityCurve<Decimal> strategy(anchor.getMonthEndDate(), mConfig.getInitialCapital());
      EquityCurve<Decimal> buyAndHold(anchor.getMonthEndDate(), mConfig.getInitialCapital());

      const Decimal cashMonthlyRate = mConfig.getCashMonthlyRate();

      for (std::size_t m = firstTradable; m < observations.size(); ++m)
	{
	  const MonthlyObservation<Decimal>& previous = observations[m - 1];
	  const MonthlyObservation<Decimal>& current = observations[m];

	  if (previous.getPrice() <= DecimalConstants<Decimal>::DecimalZero)
	    throw DegenerateInputException("BacktestSimulator: non-positive month-end price on " +
					   boost::gregorian::to_simple_string(previous.getMonthEndDate()));

	  const Decimal assetReturn = current.getPrice() / previous.getPrice() - DecimalConstants<Decimal>::DecimalOne;
	  const bool invested = current.getPositionForThisMonth() &&
	    (*current.getPositionForThisMonth() == Position::INVESTED);

	  strategy.addPeriod(current.getMonthEndDate(), invested ? assetReturn : cashMonthlyRate, invested);
	  buyAndHold.addPeriod(current.getMonthEndDate(), assetReturn, true);
	}

      return SimulatedCurves<Decimal>(std::move(strategy), std::move(buyAndHold));
    }

  private:
    TrendGuardConfiguration<Decimal> mConfig;
  };
}

#endif
