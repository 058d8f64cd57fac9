// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PERFORMANCE_METRICS_CALCULATOR_H
#define __PERFORMANCE_METRICS_CALCULATOR_H 1

#include <cmath>
#include <vector>
#include "EquityCurve.h"
#include "StatUtils.h"
#include "number.h"

namespace mkc_markethealth
{
  //
  // class BacktestResult
  //
  // Summary statistics of one equity curve. Fractions throughout:
  // a CAGR of 0.08 is 8% a year, a max drawdown of -0.25 is a 25% decline.
  //
  template <class Decimal>
  class BacktestResult
  {
  public:
    BacktestResult (const Decimal& cagr,
		    const Decimal& maxDrawdown,
		    const Decimal& sharpeRatio,
		    const Decimal& timeInvestedFraction,
		    const TimeSeriesDate& periodStart,
		    const TimeSeriesDate& periodEnd,
		    unsigned long monthCount,
		    const Decimal& initialEquity,
		    const Decimal& finalEquity)
      : mCagr(cagr),
	mMaxDrawdown(maxDrawdown),
	mSharpeRatio(sharpeRatio),
	mTimeInvestedFraction(timeInvestedFraction),
	mPeriodStart(periodStart),
	mPeriodEnd(periodEnd),
	mMonthCount(monthCount),
	mInitialEquity(initialEquity),
	mFinalEquity(finalEquity)
    {}

    const Decimal& getCAGR() const { return mCagr; }
    const Decimal& getMaxDrawdown() const { return mMaxDrawdown; }
    const Decimal& getSharpeRatio() const { return mSharpeRatio; }
    const Decimal& getTimeInvestedFraction() const { return mTimeInvestedFraction; }
    const TimeSeriesDate& getPeriodStart() const { return mPeriodStart; }
    const TimeSeriesDate& getPeriodEnd() const { return mPeriodEnd; }
    unsigned long getMonthCount() const { return mMonthCount; }
    const Decimal& getInitialEquity() const { return mInitialEquity; }
    const Decimal& getFinalEquity() const { return mFinalEquity; }

    Decimal getTotalReturn() const
    {
      return mFinalEquity / mInitialEquity - DecimalConstants<Decimal>::DecimalOne;
    }

  private:
    Decimal mCagr;
    Decimal mMaxDrawdown;
    Decimal mSharpeRatio;
    Decimal mTimeInvestedFraction;
    TimeSeriesDate mPeriodStart;
    TimeSeriesDate mPeriodEnd;
    unsigned long mMonthCount;
    Decimal mInitialEquity;
    Decimal mFinalEquity;
  };

  /**
   * @brief CAGR, max drawdown, Sharpe and time invested of an equity curve.
   *
   * With n return periods, T = n / periodsPerYear years:
   *   CAGR        = (final / initial)^(1/T) - 1
   *   maxDrawdown = min_t equity[t] / runningPeak[t] - 1   (always <= 0)
   *   Sharpe      = mean(r - cashRate) / sampleStdDev(r) * sqrt(periodsPerYear)
   *   timeInvested = invested periods / n
   *
   * Growth and square roots are taken in double and converted back.
   */
  template <class Decimal>
  class PerformanceMetricsCalculator
  {
  public:
    explicit PerformanceMetricsCalculator (const Decimal& cashRatePerPeriod,
					   unsigned int periodsPerYear = 12)
      : mCashRatePerPeriod(cashRatePerPeriod),
	mPeriodsPerYear(periodsPerYear)
    {
      if (mPeriodsPerYear == 0)
	throw ConfigurationException("PerformanceMetricsCalculator: periods per year must be positive");
    }

    const Decimal& getCashRatePerPeriod() const { return mCashRatePerPeriod; }
    unsigned int getPeriodsPerYear() const { return mPeriodsPerYear; }

    /**
     * @throws InsufficientHistoryException if the curve has no return period.
     */
    BacktestResult<Decimal> compute (const EquityCurve<Decimal>& curve) const
    {
      const unsigned long n = curve.getNumPeriods();
      if (n == 0)
	throw InsufficientHistoryException("PerformanceMetricsCalculator: equity curve has no return periods");

      unsigned long investedPeriods = 0;
      for (unsigned long i = 1; i < curve.getNumPoints(); ++i)
	if (curve.getPoint(i).isInvested())
	  ++investedPeriods;

      const Decimal timeInvested = Decimal(static_cast<double>(investedPeriods) / static_cast<double>(n));

      return BacktestResult<Decimal>(computeCAGR(curve),
				     computeMaxDrawdown(curve),
				     computeSharpe(curve),
				     timeInvested,
				     curve.getAnchor().getDate(),
				     curve.getLastPoint().getDate(),
				     n,
				     curve.getInitialEquity(),
				     curve.getFinalEquity());
    }

    Decimal computeCAGR (const EquityCurve<Decimal>& curve) const
    {
      const double years = static_cast<double>(curve.getNumPeriods()) / static_cast<double>(mPeriodsPerYear);
      const double growth = num::ratio(curve.getFinalEquity(), curve.getInitialEquity());
      if (!(growth > 0.0))
	return DecimalConstants<Decimal>::DecimalMinusOne;

      return Decimal(std::pow(growth, 1.0 / years) - 1.0);
    }

    static Decimal computeMaxDrawdown (const EquityCurve<Decimal>& curve)
    {
      Decimal peak = curve.getInitialEquity();
      Decimal maxDrawdown = DecimalConstants<Decimal>::DecimalZero;

      for (const auto& point : curve)
	{
	  if (point.getEquity() > peak)
	    peak = point.getEquity();

	  const Decimal drawdown = point.getEquity() / peak - DecimalConstants<Decimal>::DecimalOne;
	  if (drawdown < maxDrawdown)
	    maxDrawdown = drawdown;
	}

      return maxDrawdown;
    }

    Decimal computeSharpe (const EquityCurve<Decimal>& curve) const
    {
      return StatUtils<Decimal>::sharpeFromReturns(curve.getPeriodReturns(),
						   static_cast<double>(mPeriodsPerYear),
						   num::to_double(mCashRatePerPeriod));
    }

  private:
    Decimal mCashRatePerPeriod;
    unsigned int mPeriodsPerYear;
  };
}

#endif
