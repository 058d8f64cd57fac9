// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DISTRIBUTION_DAY_CONFIGURATION_H
#define __DISTRIBUTION_DAY_CONFIGURATION_H 1

#include <optional>
#include <string>
#include "DecimalConstants.h"
#include "PriceSeriesException.h"
#include "number.h"

namespace mkc_markethealth
{
  /**
   * @brief Qualification and expiration rules for distribution days.
   *
   * Defaults follow the IBD rules of thumb:
   *  - a session qualifies when it closes lower on higher volume
   *    (minimumDecline = 0, no weighted change threshold)
   *  - a distribution day ages out after 25 sessions
   *  - a distribution day is cancelled once price closes 5% above it
   *
   * A minimum decline of 0.002 (0.2%) gives the stricter published IBD rule.
   * A weighted change threshold of -0.005 reproduces the volume weighted filter
   * of the earlier scanner.
   */
  template <class Decimal>
  class DistributionDayConfiguration
  {
  public:
    static constexpr unsigned int DefaultExpirationSessions = 25;

    DistributionDayConfiguration()
      : mMinimumDecline(DecimalConstants<Decimal>::DecimalZero),
	mWeightedChangeThreshold(),
	mExpirationSessions(DefaultExpirationSessions),
	mRecoveryThreshold(DecimalConstants<Decimal>::DefaultRecoveryThreshold)
    {}

    DistributionDayConfiguration(const Decimal& minimumDecline,
				 const std::optional<Decimal>& weightedChangeThreshold,
				 unsigned int expirationSessions,
				 const Decimal& recoveryThreshold)
      : mMinimumDecline(minimumDecline),
	mWeightedChangeThreshold(weightedChangeThreshold),
	mExpirationSessions(expirationSessions),
	mRecoveryThreshold(recoveryThreshold)
    {
      validate();
    }

    const Decimal& getMinimumDecline() const
    {
      return mMinimumDecline;
    }

    const std::optional<Decimal>& getWeightedChangeThreshold() const
    {
      return mWeightedChangeThreshold;
    }

    unsigned int getExpirationSessions() const
    {
      return mExpirationSessions;
    }

    const Decimal& getRecoveryThreshold() const
    {
      return mRecoveryThreshold;
    }

    void setMinimumDecline(const Decimal& minimumDecline)
    {
      mMinimumDecline = minimumDecline;
      validate();
    }

    void setWeightedChangeThreshold(const std::optional<Decimal>& threshold)
    {
      mWeightedChangeThreshold = threshold;
      validate();
    }

    void setExpirationSessions(unsigned int sessions)
    {
      mExpirationSessions = sessions;
      validate();
    }

    void setRecoveryThreshold(const Decimal& threshold)
    {
      mRecoveryThreshold = threshold;
      validate();
    }

  private:
    void validate() const
    {
      if (mMinimumDecline < DecimalConstants<Decimal>::DecimalZero)
	throw ConfigurationException("DistributionDayConfiguration: minimum decline cannot be negative");

      if (mExpirationSessions == 0)
	throw ConfigurationException("DistributionDayConfiguration: expiration window must be at least one session");

      if (mRecoveryThreshold < DecimalConstants<Decimal>::DecimalZero)
	throw ConfigurationException("DistributionDayConfiguration: recovery threshold cannot be negative");
    }

  private:
    Decimal mMinimumDecline;
    std::optional<Decimal> mWeightedChangeThreshold;
    unsigned int mExpirationSessions;
    Decimal mRecoveryThreshold;
  };

  /**
   * @brief Verdict thresholds for MarketConditionAssessor.
   *
   * These are tunable; published IBD guidance moves them with the market regime.
   * Weighted change thresholds are expressed as fractions (-0.10 = -10%) and are
   * disabled unless set.
   */
  template <class Decimal>
  class MarketConditionThresholds
  {
  public:
    static constexpr unsigned int DefaultModerateCount = 5;
    static constexpr unsigned int DefaultHighCount = 8;
    static constexpr unsigned int DefaultRecentHighCount = 4;
    static constexpr unsigned int DefaultRecentWindowSessions = 10;

    MarketConditionThresholds()
      : MarketConditionThresholds(DefaultModerateCount,
				  DefaultHighCount,
				  DefaultRecentHighCount,
				  DefaultRecentWindowSessions)
    {}

    MarketConditionThresholds(unsigned int moderateCount,
			      unsigned int highCount,
			      unsigned int recentHighCount,
			      unsigned int recentWindowSessions)
      : mModerateCount(moderateCount),
	mHighCount(highCount),
	mRecentHighCount(recentHighCount),
	mRecentWindowSessions(recentWindowSessions),
	mRecentModerateCount(),
	mModerateWeightedChange(),
	mHighWeightedChange()
    {
      validate();
    }

    unsigned int getModerateCount() const { return mModerateCount; }
    unsigned int getHighCount() const { return mHighCount; }
    unsigned int getRecentHighCount() const { return mRecentHighCount; }
    unsigned int getRecentWindowSessions() const { return mRecentWindowSessions; }
    const std::optional<unsigned int>& getRecentModerateCount() const { return mRecentModerateCount; }
    const std::optional<Decimal>& getModerateWeightedChange() const { return mModerateWeightedChange; }
    const std::optional<Decimal>& getHighWeightedChange() const { return mHighWeightedChange; }

    void setCountThresholds(unsigned int moderateCount, unsigned int highCount)
    {
      mModerateCount = moderateCount;
      mHighCount = highCount;
      validate();
    }

    void setRecentHighCount(unsigned int recentHighCount)
    {
      mRecentHighCount = recentHighCount;
      validate();
    }

    void setRecentWindowSessions(unsigned int sessions)
    {
      mRecentWindowSessions = sessions;
      validate();
    }

    void setRecentModerateCount(const std::optional<unsigned int>& count)
    {
      mRecentModerateCount = count;
      validate();
    }

    void setWeightedChangeThresholds(const std::optional<Decimal>& moderate,
				     const std::optional<Decimal>& high)
    {
      mModerateWeightedChange = moderate;
      mHighWeightedChange = high;
      validate();
    }

  private:
    void validate() const
    {
      if (mModerateCount == 0 || mHighCount == 0 || mRecentHighCount == 0)
	throw ConfigurationException("MarketConditionThresholds: count thresholds must be positive");

      if (mModerateCount > mHighCount)
	throw ConfigurationException("MarketConditionThresholds: moderate threshold " + std::to_string(mModerateCount) +
				     " exceeds high threshold " + std::to_string(mHighCount));

      if (mRecentWindowSessions == 0)
	throw ConfigurationException("MarketConditionThresholds: recent window must be at least one session");

      if (mRecentModerateCount && (*mRecentModerateCount == 0 || *mRecentModerateCount > mRecentHighCount))
	throw ConfigurationException("MarketConditionThresholds: recent moderate count must be in [1, recent high count]");

      if (mModerateWeightedChange && mHighWeightedChange && (*mHighWeightedChange > *mModerateWeightedChange))
	throw ConfigurationException("MarketConditionThresholds: high weighted change threshold must not be above the moderate threshold");
    }

  private:
    unsigned int mModerateCount;
    unsigned int mHighCount;
    unsigned int mRecentHighCount;
    unsigned int mRecentWindowSessions;
    std::optional<unsigned int> mRecentModerateCount;
    std::optional<Decimal> mModerateWeightedChange;
    std::optional<Decimal> mHighWeightedChange;
  };

  /**
   * @brief Periods and bands for the moving average / RSI snapshot.
   * The period doubles as the minimum history required for the indicator.
   */
  template <class Decimal>
  class TechnicalIndicatorConfiguration
  {
  public:
    TechnicalIndicatorConfiguration()
      : TechnicalIndicatorConfiguration(50, 200, 14,
					DecimalConstants<Decimal>::DefaultOverboughtLevel,
					DecimalConstants<Decimal>::DefaultOversoldLevel)
    {}

    TechnicalIndicatorConfiguration(unsigned int shortMAPeriod,
				    unsigned int longMAPeriod,
				    unsigned int rsiPeriod,
				    const Decimal& overboughtLevel,
				    const Decimal& oversoldLevel)
      : mShortMAPeriod(shortMAPeriod),
	mLongMAPeriod(longMAPeriod),
	mRsiPeriod(rsiPeriod),
	mOverboughtLevel(overboughtLevel),
	mOversoldLevel(oversoldLevel)
    {
      if (mShortMAPeriod == 0 || mLongMAPeriod == 0 || mRsiPeriod == 0)
	throw ConfigurationException("TechnicalIndicatorConfiguration: indicator periods must be positive");

      if (mShortMAPeriod >= mLongMAPeriod)
	throw ConfigurationException("TechnicalIndicatorConfiguration: short moving average period must be below the long period");

      if (!(mOversoldLevel < mOverboughtLevel) ||
	  mOversoldLevel < DecimalConstants<Decimal>::DecimalZero ||
	  mOverboughtLevel > DecimalConstants<Decimal>::DecimalOneHundred)
	throw ConfigurationException("TechnicalIndicatorConfiguration: RSI bands must satisfy 0 <= oversold < overbought <= 100");
    }

    unsigned int getShortMAPeriod() const { return mShortMAPeriod; }
    unsigned int getLongMAPeriod() const { return mLongMAPeriod; }
    unsigned int getRsiPeriod() const { return mRsiPeriod; }
    const Decimal& getOverboughtLevel() const { return mOverboughtLevel; }
    const Decimal& getOversoldLevel() const { return mOversoldLevel; }

  private:
    unsigned int mShortMAPeriod;
    unsigned int mLongMAPeriod;
    unsigned int mRsiPeriod;
    Decimal mOverboughtLevel;
    Decimal mOversoldLevel;
  };
}

#endif
