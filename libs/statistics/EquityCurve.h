// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EQUITY_CURVE_H
#define __EQUITY_CURVE_H 1

#include <vector>
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "PriceSeriesException.h"

namespace mkc_markethealth
{
  template <class Decimal>
  class EquityPoint
  {
  public:
    EquityPoint (const TimeSeriesDate& date,
		 const Decimal& equity,
		 const Decimal& periodReturn,
		 bool invested)
      : mDate(date),
	mEquity(equity),
	mPeriodReturn(periodReturn),
	mInvested(invested)
    {}

    const TimeSeriesDate& getDate() const { return mDate; }
    const Decimal& getEquity() const { return mEquity; }
    const Decimal& getPeriodReturn() const { return mPeriodReturn; }
    bool isInvested() const { return mInvested; }

  private:
    TimeSeriesDate mDate;
    Decimal mEquity;
    Decimal mPeriodReturn;
    bool mInvested;
  };

  /**
   * @brief Equity through time, one point per period.
   *
   * The first point is the anchor: the starting capital with a zero period
   * return. Every later point compounds the previous equity by its period
   * return. Dates must be strictly increasing.
   */
  template <class Decimal>
  class EquityCurve
  {
  public:
    typedef typename std::vector<EquityPoint<Decimal>>::const_iterator ConstIterator;

    EquityCurve (const TimeSeriesDate& anchorDate, const Decimal& initialEquity)
      : mPoints()
    {
      if (initialEquity <= DecimalConstants<Decimal>::DecimalZero)
	throw DegenerateInputException("EquityCurve: initial equity must be positive");

      mPoints.emplace_back(anchorDate, initialEquity, DecimalConstants<Decimal>::DecimalZero, false);
    }

    // Appends a period and returns the new equity
    const Decimal& addPeriod (const TimeSeriesDate& date, const Decimal& periodReturn, bool invested)
    {
      if (!(mPoints.back().getDate() < date))
	throw NonMonotonicDatesException("EquityCurve: period " + boost::gregorian::to_simple_string(date) +
					 " does not follow " +
					 boost::gregorian::to_simple_string(mPoints.back().getDate()));

      const Decimal equity = mPoints.back().getEquity() * (DecimalConstants<Decimal>::DecimalOne + periodReturn);
      mPoints.emplace_back(date, equity, periodReturn, invested);
      return mPoints.back().getEquity();
    }

    unsigned long getNumPoints() const { return static_cast<unsigned long>(mPoints.size()); }

    // Number of return periods, not counting the anchor
    unsigned long getNumPeriods() const { return getNumPoints() - 1; }

    const EquityPoint<Decimal>& getPoint (unsigned long i) const { return mPoints.at(i); }
    const EquityPoint<Decimal>& getAnchor() const { return mPoints.front(); }
    const EquityPoint<Decimal>& getLastPoint() const { return mPoints.back(); }

    const Decimal& getInitialEquity() const { return mPoints.front().getEquity(); }
    const Decimal& getFinalEquity() const { return mPoints.back().getEquity(); }

    ConstIterator begin() const { return mPoints.begin(); }
    ConstIterator end() const { return mPoints.end(); }

    std::vector<Decimal> getPeriodReturns() const
    {
      std::vector<Decimal> returns;
      returns.reserve(mPoints.size() - 1);
      for (std::size_t i = 1; i < mPoints.size(); ++i)
	returns.push_back(mPoints[i].getPeriodReturn());

      return returns;
    }

  private:
    std::vector<EquityPoint<Decimal>> mPoints;
  };
}

#endif
