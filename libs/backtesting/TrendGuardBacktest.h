// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TREND_GUARD_BACKTEST_H
#define __TREND_GUARD_BACKTEST_H 1

#include <ostream>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "MonthlySignalGenerator.h"
#include "BacktestSimulator.h"
#include "PerformanceMetricsCalculator.h"

namespace mkc_markethealth
{
  template <class Decimal>
  class TrendGuardResult
  {
  public:
    TrendGuardResult (const std::string& symbol,
		      std::vector<MonthlyObservation<Decimal>> observations,
		      SimulatedCurves<Decimal> curves,
		      const BacktestResult<Decimal>& strategyResult,
		      const BacktestResult<Decimal>& buyAndHoldResult)
      : mSymbol(symbol),
	mObservations(std::move(observations)),
	mCurves(std::move(curves)),
	mStrategyResult(strategyResult),
	mBuyAndHoldResult(buyAndHoldResult)
    {}

    const std::string& getSymbol() const { return mSymbol; }
    const std::vector<MonthlyObservation<Decimal>>& getObservations() const { return mObservations; }
    const EquityCurve<Decimal>& getStrategyCurve() const { return mCurves.getStrategyCurve(); }
    const EquityCurve<Decimal>& getBuyAndHoldCurve() const { return mCurves.getBuyAndHoldCurve(); }
    const BacktestResult<Decimal>& getStrategyResult() const { return mStrategyResult; }
    const BacktestResult<Decimal>& getBuyAndHoldResult() const { return mBuyAndHoldResult; }

  private:
    std::string mSymbol;
    std::vector<MonthlyObservation<Decimal>> mObservations;
    SimulatedCurves<Decimal> mCurves;
    BacktestResult<Decimal> mStrategyResult;
    BacktestResult<Decimal> mBuyAndHoldResult;
  };

  //
  // class TrendGuardBacktest
  //
  // Signal generation, simulation and metrics for one symbol.
  //
  template <class Decimal>
  class TrendGuardBacktest
  {
  public:
    explicit TrendGuardBacktest (const TrendGuardConfiguration<Decimal>& config =
				 TrendGuardConfiguration<Decimal>())
      : mConfig(config),
	mSignalGenerator(config.getSmaLookbackMonths()),
	mSimulator(config),
	mCalculator(config.getCashMonthlyRate(), 12)
    {}

    const TrendGuardConfiguration<Decimal>& getConfiguration() const
    {
      return mConfig;
    }

    TrendGuardResult<Decimal> run (const PriceSeries<Decimal>& series,
				   std::ostream* diagnostics = nullptr) const
    {
      std::vector<MonthlyObservation<Decimal>> observations = mSignalGenerator.generate(series);
      SimulatedCurves<Decimal> curves = mSimulator.run(observations);

      BacktestResult<Decimal> strategyResult = mCalculator.compute(curves.getStrategyCurve());
      BacktestResult<Decimal> buyAndHoldResult = mCalculator.compute(curves.getBuyAndHoldCurve());

      if (diagnostics)
	*diagnostics << series.getSymbol() << ": " << strategyResult.getMonthCount()
		     << " months simulated from "
		     << boost::gregorian::to_simple_string(strategyResult.getPeriodStart())
		     << " to " << boost::gregorian::to_simple_string(strategyResult.getPeriodEnd())
		     << std::endl;

      return TrendGuardResult<Decimal>(series.getSymbol(), std::move(observations), std::move(curves),
				       strategyResult, buyAndHoldResult);
    }

  private:
    TrendGuardConfiguration<Decimal> mConfig;
    MonthlySignalGenerator<Decimal> mSignalGenerator;
    BacktestSimulator<Decimal> mSimulator;
    PerformanceMetricsCalculator<Decimal> mCalculator;
  };
}

#endif
