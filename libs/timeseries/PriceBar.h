// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_BAR_H
#define __PRICE_BAR_H 1

#include <boost/date_time/gregorian/gregorian.hpp>
#include "BoostDateHelper.h"
#include "number.h"

namespace mkc_markethealth
{
  typedef unsigned long long VolumeType;

  //
  // class PriceBar
  //
  // One daily session: closing price and traded volume. Immutable once built.
  //

  template <class Decimal> class PriceBar
  {
  public:
    PriceBar (const TimeSeriesDate& barDate,
	      const Decimal& closePrice,
	      VolumeType volume)
      : mDate(barDate),
	mClose(closePrice),
	mVolume(volume)
    {}

    PriceBar (const PriceBar<Decimal>& rhs) = default;
    PriceBar<Decimal>& operator=(const PriceBar<Decimal>& rhs) = default;
    ~PriceBar() = default;

    const TimeSeriesDate& getDate() const
    {
      return mDate;
    }

    const Decimal& getCloseValue() const
    {
      return mClose;
    }

    VolumeType getVolume() const
    {
      return mVolume;
    }

  private:
    TimeSeriesDate mDate;
    Decimal mClose;
    VolumeType mVolume;
  };

  template <class Decimal>
  bool operator==(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  {
    return ((lhs.getDate() == rhs.getDate()) &&
	    (lhs.getCloseValue() == rhs.getCloseValue()) &&
	    (lhs.getVolume() == rhs.getVolume()));
  }

  template <class Decimal>
  bool operator!=(const PriceBar<Decimal>& lhs, const PriceBar<Decimal>& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
