// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_H
#define __PRICE_SERIES_H 1

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "PriceBar.h"
#include "PriceSeriesException.h"
#include "DecimalConstants.h"

namespace mkc_markethealth
{
  /**
   * @brief Ordered daily close/volume history for one symbol.
   *
   * The series is validated once at construction and never changes afterwards:
   *  - at least one bar
   *  - strictly increasing dates (no duplicates)
   *  - strictly positive closing prices
   *
   * Every analytical component takes the series by const reference. A bar's
   * position in the series is its session index; session arithmetic (expiration
   * windows, "last 10 sessions") is done on these indices, not on calendar days.
   */
  template <class Decimal> class PriceSeries
  {
  public:
    typedef typename std::vector<PriceBar<Decimal>>::const_iterator ConstIterator;

    PriceSeries (const std::string& symbol, std::vector<PriceBar<Decimal>> bars)
      : mSymbol(symbol),
	mBars(std::move(bars))
    {
      validate();
    }

    PriceSeries (const PriceSeries<Decimal>& rhs) = default;
    PriceSeries (PriceSeries<Decimal>&& rhs) = default;
    ~PriceSeries() = default;

    const std::string& getSymbol() const
    {
      return mSymbol;
    }

    unsigned long getNumEntries() const
    {
      return static_cast<unsigned long>(mBars.size());
    }

    ConstIterator beginSortedAccess() const
    {
      return mBars.begin();
    }

    ConstIterator endSortedAccess() const
    {
      return mBars.end();
    }

    const PriceBar<Decimal>& getEntry (unsigned long sessionIndex) const
    {
      if (sessionIndex >= mBars.size())
	throw std::out_of_range("PriceSeries::getEntry - session index " + std::to_string(sessionIndex) +
				" out of range for " + mSymbol);

      return mBars[sessionIndex];
    }

    const TimeSeriesDate& getFirstDate() const
    {
      return mBars.front().getDate();
    }

    const TimeSeriesDate& getLastDate() const
    {
      return mBars.back().getDate();
    }

    const PriceBar<Decimal>& getLastEntry() const
    {
      return mBars.back();
    }

    std::vector<Decimal> getCloseValues() const
    {
      std::vector<Decimal> closes;
      closes.reserve(mBars.size());
      for (const auto& bar : mBars)
	closes.push_back(bar.getCloseValue());

      return closes;
    }

    bool isDateFound (const TimeSeriesDate& aDate) const
    {
      auto it = findFirstNotBefore(aDate);
      return (it != mBars.end()) && (it->getDate() == aDate);
    }

    /**
     * @brief Session index of the last bar dated on or before aDate.
     * @return empty if aDate precedes the first bar.
     */
    std::optional<unsigned long> getSessionIndex (const TimeSeriesDate& aDate) const
    {
      auto it = std::upper_bound(mBars.begin(), mBars.end(), aDate,
				 [](const TimeSeriesDate& d, const PriceBar<Decimal>& bar) {
				   return d < bar.getDate();
				 });
      if (it == mBars.begin())
	return std::nullopt;

      return static_cast<unsigned long>(std::distance(mBars.begin(), it) - 1);
    }

    /**
     * @brief Session index of an as-of date used for windowed counts.
     *
     * Within the series this is getSessionIndex(asOf). Past the last bar every
     * weekday up to and including asOf counts as one more session, so an as-of
     * date one trading day after the data yields getNumEntries().
     *
     * @throws ConfigurationException if asOf precedes the first bar.
     */
    unsigned long getAsOfSessionIndex (const TimeSeriesDate& asOf) const
    {
      std::optional<unsigned long> index = getSessionIndex(asOf);
      if (!index)
	throw ConfigurationException("PriceSeries: as-of date " + boost::gregorian::to_simple_string(asOf) +
				     " precedes the first session of " + mSymbol);

      const unsigned long lastIndex = getNumEntries() - 1;
      if (*index < lastIndex)
	return *index;

      return lastIndex + weekdaysAfter(getLastDate(), asOf);
    }

  private:
    ConstIterator findFirstNotBefore (const TimeSeriesDate& aDate) const
    {
      return std::lower_bound(mBars.begin(), mBars.end(), aDate,
			      [](const PriceBar<Decimal>& bar, const TimeSeriesDate& d) {
				return bar.getDate() < d;
			      });
    }

    void validate() const
    {
      if (mBars.empty())
	throw InsufficientHistoryException("PriceSeries: series for " + mSymbol + " has no bars");

      for (std::size_t i = 0; i < mBars.size(); ++i)
	{
	  if (mBars[i].getCloseValue() <= DecimalConstants<Decimal>::DecimalZero)
	    throw DegenerateInputException("PriceSeries: non-positive close on " +
					   boost::gregorian::to_simple_string(mBars[i].getDate()) +
					   " for " + mSymbol);

	  if (i > 0 && !(mBars[i - 1].getDate() < mBars[i].getDate()))
	    throw NonMonotonicDatesException("PriceSeries: date " +
					     boost::gregorian::to_simple_string(mBars[i].getDate()) +
					     " does not follow " +
					     boost::gregorian::to_simple_string(mBars[i - 1].getDate()) +
					     " for " + mSymbol);
	}
    }

  private:
    std::string mSymbol;
    std::vector<PriceBar<Decimal>> mBars;
  };
}

#endif
