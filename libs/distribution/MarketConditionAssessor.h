// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MARKET_CONDITION_ASSESSOR_H
#define __MARKET_CONDITION_ASSESSOR_H 1

#include <optional>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "DistributionDayRecord.h"
#include "DistributionDayConfiguration.h"

namespace mkc_markethealth
{
  enum class MarketVerdict { HEALTHY, MODERATE_PRESSURE, HIGH_PRESSURE };

  inline std::string toString (MarketVerdict verdict)
  {
    switch (verdict)
      {
      case MarketVerdict::HIGH_PRESSURE:
	return "HIGH_PRESSURE";
      case MarketVerdict::MODERATE_PRESSURE:
	return "MODERATE_PRESSURE";
      case MarketVerdict::HEALTHY:
      default:
	return "HEALTHY";
      }
  }

  inline std::string describeVerdict (MarketVerdict verdict)
  {
    switch (verdict)
      {
      case MarketVerdict::HIGH_PRESSURE:
	return "High distribution: significant institutional selling, consider reducing exposure";
      case MarketVerdict::MODERATE_PRESSURE:
	return "Moderate distribution: some institutional selling, proceed with caution";
      case MarketVerdict::HEALTHY:
      default:
	return "Low distribution: healthy market conditions";
      }
  }

  /**
   * @brief Snapshot of distribution pressure as of one date.
   * Derived from the active records; never persisted.
   */
  template <class Decimal>
  class MarketCondition
  {
  public:
    MarketCondition (const TimeSeriesDate& asOfDate,
		     unsigned int totalCount,
		     unsigned int recentCount,
		     const Decimal& totalWeightedChange,
		     MarketVerdict verdict)
      : mAsOfDate(asOfDate),
	mTotalCount(totalCount),
	mRecentCount(recentCount),
	mTotalWeightedChange(totalWeightedChange),
	mVerdict(verdict)
    {}

    const TimeSeriesDate& getAsOfDate() const { return mAsOfDate; }
    unsigned int getTotalCount() const { return mTotalCount; }
    unsigned int getRecentCount() const { return mRecentCount; }
    const Decimal& getTotalWeightedChange() const { return mTotalWeightedChange; }
    MarketVerdict getVerdict() const { return mVerdict; }

    std::string getDescription() const
    {
      return describeVerdict(mVerdict);
    }

  private:
    TimeSeriesDate mAsOfDate;
    unsigned int mTotalCount;
    unsigned int mRecentCount;
    Decimal mTotalWeightedChange;
    MarketVerdict mVerdict;
  };

  /**
   * @brief Aggregates active distribution days into a market verdict.
   *
   * Only records that are not expired and are dated on or before the as-of
   * date count. The records must already have been passed through
   * ExpirationFilter for the same as-of date.
   *
   * Verdict rules, first match wins:
   *   HIGH_PRESSURE      total >= high, or recent >= recentHigh,
   *                      or weighted sum <= highWeightedChange (if set)
   *   MODERATE_PRESSURE  total >= moderate, or recent >= recentModerate (if set),
   *                      or weighted sum <= moderateWeightedChange (if set)
   *   HEALTHY            otherwise
   */
  template <class Decimal>
  class MarketConditionAssessor
  {
  public:
    explicit MarketConditionAssessor (const MarketConditionThresholds<Decimal>& thresholds =
				      MarketConditionThresholds<Decimal>())
      : mThresholds(thresholds)
    {}

    const MarketConditionThresholds<Decimal>& getThresholds() const
    {
      return mThresholds;
    }

    MarketCondition<Decimal> assess (const std::vector<DistributionDayRecord<Decimal>>& records,
				     const PriceSeries<Decimal>& series) const
    {
      return assess(records, series, series.getLastDate());
    }

    MarketCondition<Decimal> assess (const std::vector<DistributionDayRecord<Decimal>>& records,
				     const PriceSeries<Decimal>& series,
				     const TimeSeriesDate& asOf) const
    {
      const unsigned long asOfSession = series.getAsOfSessionIndex(asOf);

      unsigned int totalCount = 0;
      unsigned int recentCount = 0;
      Decimal totalWeightedChange(DecimalConstants<Decimal>::DecimalZero);

      for (const auto& record : records)
	{
	  if (record.isExpired() || record.getDate() > asOf)
	    continue;

	  ++totalCount;
	  totalWeightedChange += record.getWeightedChange();

	  if (asOfSession - record.getSessionIndex() + 1 <= mThresholds.getRecentWindowSessions())
	    ++recentCount;
	}

      return MarketCondition<Decimal>(asOf, totalCount, recentCount, totalWeightedChange,
				      classify(totalCount, recentCount, totalWeightedChange));
    }

    MarketVerdict classify (unsigned int totalCount,
			    unsigned int recentCount,
			    const Decimal& totalWeightedChange) const
    {
      const auto& highWeighted = mThresholds.getHighWeightedChange();
      if (totalCount >= mThresholds.getHighCount() ||
	  recentCount >= mThresholds.getRecentHighCount() ||
	  (highWeighted && totalWeightedChange <= *highWeighted))
	return MarketVerdict::HIGH_PRESSURE;

      const auto& recentModerate = mThresholds.getRecentModerateCount();
      const auto& moderateWeighted = mThresholds.getModerateWeightedChange();
      if (totalCount >= mThresholds.getModerateCount() ||
	  (recentModerate && recentCount >= *recentModerate) ||
	  (moderateWeighted && totalWeightedChange <= *moderateWeighted))
	return MarketVerdict::MODERATE_PRESSURE;

      return MarketVerdict::HEALTHY;
    }

  private:
    MarketConditionThresholds<Decimal> mThresholds;
  };

  //
  // class DistributionStatistics
  //
  // Summary over every detected record, expired or not.
  //
  template <class Decimal>
  class DistributionStatistics
  {
  public:
    explicit DistributionStatistics (const std::vector<DistributionDayRecord<Decimal>>& records)
      : mDetectedCount(static_cast<unsigned int>(records.size())),
	mTotalWeightedChange(DecimalConstants<Decimal>::DecimalZero),
	mAverageVolumeIncrease()
    {
      Decimal volumeChangeSum(DecimalConstants<Decimal>::DecimalZero);
      for (const auto& record : records)
	{
	  mTotalWeightedChange += record.getWeightedChange();
	  volumeChangeSum += record.getVolumeChange();
	}

      if (!records.empty())
	mAverageVolumeIncrease = volumeChangeSum / Decimal(static_cast<int>(records.size()));
    }

    unsigned int getDetectedCount() const { return mDetectedCount; }
    const Decimal& getTotalWeightedChange() const { return mTotalWeightedChange; }
    const std::optional<Decimal>& getAverageVolumeIncrease() const { return mAverageVolumeIncrease; }

  private:
    unsigned int mDetectedCount;
    Decimal mTotalWeightedChange;
    std::optional<Decimal> mAverageVolumeIncrease;
  };
}

#endif
