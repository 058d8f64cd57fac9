// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DISTRIBUTION_DAY_RECORD_H
#define __DISTRIBUTION_DAY_RECORD_H 1

#include <optional>
#include <string>
#include "PriceBar.h"

namespace mkc_markethealth
{
  enum class ExpirationReason { NONE, TIME, PRICE_RECOVERY };

  inline std::string toString (ExpirationReason reason)
  {
    switch (reason)
      {
      case ExpirationReason::TIME:
	return "TIME";
      case ExpirationReason::PRICE_RECOVERY:
	return "PRICE_RECOVERY";
      case ExpirationReason::NONE:
      default:
	return "NONE";
      }
  }

  /**
   * @brief One detected distribution day.
   *
   * Price and volume measures are fixed when the detector creates the record.
   * Only ExpirationFilter changes the expiration state. Expired records stay in
   * the history; they are excluded from aggregation, not deleted.
   *
   * Changes are fractions: percentChange = close/prevClose - 1,
   * volumeChange = volume/prevVolume - 1 (0 when prevVolume is 0),
   * weightedChange = percentChange * (1 + volumeChange).
   */
  template <class Decimal>
  class DistributionDayRecord
  {
  public:
    DistributionDayRecord (const PriceBar<Decimal>& bar,
			   unsigned long sessionIndex,
			   const Decimal& previousClose,
			   VolumeType previousVolume,
			   const Decimal& percentChange,
			   const Decimal& volumeChange,
			   const Decimal& weightedChange)
      : mDate(bar.getDate()),
	mSessionIndex(sessionIndex),
	mClose(bar.getCloseValue()),
	mVolume(bar.getVolume()),
	mPreviousClose(previousClose),
	mPreviousVolume(previousVolume),
	mPercentChange(percentChange),
	mVolumeChange(volumeChange),
	mWeightedChange(weightedChange),
	mExpirationReason(ExpirationReason::NONE),
	mExpirationDate()
    {}

    const TimeSeriesDate& getDate() const { return mDate; }
    unsigned long getSessionIndex() const { return mSessionIndex; }
    const Decimal& getCloseValue() const { return mClose; }
    VolumeType getVolume() const { return mVolume; }
    const Decimal& getPreviousClose() const { return mPreviousClose; }
    VolumeType getPreviousVolume() const { return mPreviousVolume; }
    const Decimal& getPercentChange() const { return mPercentChange; }
    const Decimal& getVolumeChange() const { return mVolumeChange; }
    const Decimal& getWeightedChange() const { return mWeightedChange; }

    bool isExpired() const
    {
      return mExpirationReason != ExpirationReason::NONE;
    }

    ExpirationReason getExpirationReason() const
    {
      return mExpirationReason;
    }

    // Session that triggered expiration; empty when not expired or when the
    // triggering session lies beyond the end of the series.
    const std::optional<TimeSeriesDate>& getExpirationDate() const
    {
      return mExpirationDate;
    }

  private:
    template <class> friend class ExpirationFilter;

    void expire (ExpirationReason reason, const std::optional<TimeSeriesDate>& when)
    {
      mExpirationReason = reason;
      mExpirationDate = when;
    }

    void reinstate()
    {
      mExpirationReason = ExpirationReason::NONE;
      mExpirationDate.reset();
    }

  private:
    TimeSeriesDate mDate;
    unsigned long mSessionIndex;
    Decimal mClose;
    VolumeType mVolume;
    Decimal mPreviousClose;
    VolumeType mPreviousVolume;
    Decimal mPercentChange;
    Decimal mVolumeChange;
    Decimal mWeightedChange;
    ExpirationReason mExpirationReason;
    std::optional<TimeSeriesDate> mExpirationDate;
  };
}

#endif
