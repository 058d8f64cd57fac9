// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DISTRIBUTION_DAY_DETECTOR_H
#define __DISTRIBUTION_DAY_DETECTOR_H 1

#include <vector>
#include "PriceSeries.h"
#include "DistributionDayRecord.h"
#include "DistributionDayConfiguration.h"

namespace mkc_markethealth
{
  /**
   * @brief Finds sessions that closed lower than the prior session on higher volume.
   *
   * This is the footprint of institutional selling. Each qualifying session
   * produces a DistributionDayRecord with its raw and volume weighted decline.
   * The detector is a pure function of the series and the configuration.
   */
  template <class Decimal>
  class DistributionDayDetector
  {
  public:
    explicit DistributionDayDetector (const DistributionDayConfiguration<Decimal>& config =
				      DistributionDayConfiguration<Decimal>())
      : mConfig(config)
    {}

    const DistributionDayConfiguration<Decimal>& getConfiguration() const
    {
      return mConfig;
    }

    /**
     * @brief Scans the whole series.
     * @return records in date order, one per qualifying session.
     * @throws InsufficientHistoryException if the series has fewer than two bars.
     */
    std::vector<DistributionDayRecord<Decimal>> detect (const PriceSeries<Decimal>& series) const
    {
      if (series.getNumEntries() < 2)
	throw InsufficientHistoryException("DistributionDayDetector: " + series.getSymbol() +
					   " needs at least two sessions");

      std::vector<DistributionDayRecord<Decimal>> records;
      const Decimal one(DecimalConstants<Decimal>::DecimalOne);
      const Decimal maxPercentChange = DecimalConstants<Decimal>::DecimalZero - mConfig.getMinimumDecline();

      for (unsigned long i = 1; i < series.getNumEntries(); ++i)
	{
	  const PriceBar<Decimal>& previous = series.getEntry(i - 1);
	  const PriceBar<Decimal>& current = series.getEntry(i);

	  if (!(current.getCloseValue() < previous.getCloseValue()) ||
	      !(current.getVolume() > previous.getVolume()))
	    continue;

	  const Decimal percentChange = current.getCloseValue() / previous.getCloseValue() - one;
	  if (percentChange > maxPercentChange)
	    continue;

	  const Decimal volumeChange = computeVolumeChange(current.getVolume(), previous.getVolume());
	  const Decimal weightedChange = percentChange * (one + volumeChange);

	  const auto& weightedThreshold = mConfig.getWeightedChangeThreshold();
	  if (weightedThreshold && !(weightedChange < *weightedThreshold))
	    continue;

	  records.emplace_back(current, i,
			       previous.getCloseValue(), previous.getVolume(),
			       percentChange, volumeChange, weightedChange);
	}

      return records;
    }

  private:
    // Volumes can exceed the integer range of the decimal type, so the ratio
    // is formed in double. A zero previous volume gives no volume change.
    static Decimal computeVolumeChange (VolumeType volume, VolumeType previousVolume)
    {
      if (previousVolume == 0)
	return DecimalConstants<Decimal>::DecimalZero;

      return Decimal(static_cast<double>(volume) / static_cast<double>(previousVolume) - 1.0);
    }

  private:
    DistributionDayConfiguration<Decimal> mConfig;
  };
}

#endif
