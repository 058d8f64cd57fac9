// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TECHNICAL_ASSESSOR_H
#define __TECHNICAL_ASSESSOR_H 1

#include <optional>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "TimeSeriesIndicators.h"
#include "DistributionDayConfiguration.h"

namespace mkc_markethealth
{
  enum class TrendState { STRONG_UPTREND, STRONG_DOWNTREND, BULLISH, BEARISH, UNAVAILABLE };
  enum class MomentumState { OVERBOUGHT, OVERSOLD, NEUTRAL, UNAVAILABLE };

  inline std::string toString (TrendState trend)
  {
    switch (trend)
      {
      case TrendState::STRONG_UPTREND:
	return "STRONG_UPTREND";
      case TrendState::STRONG_DOWNTREND:
	return "STRONG_DOWNTREND";
      case TrendState::BULLISH:
	return "BULLISH";
      case TrendState::BEARISH:
	return "BEARISH";
      case TrendState::UNAVAILABLE:
      default:
	return "UNAVAILABLE";
      }
  }

  inline std::string toString (MomentumState momentum)
  {
    switch (momentum)
      {
      case MomentumState::OVERBOUGHT:
	return "OVERBOUGHT";
      case MomentumState::OVERSOLD:
	return "OVERSOLD";
      case MomentumState::NEUTRAL:
	return "NEUTRAL";
      case MomentumState::UNAVAILABLE:
      default:
	return "UNAVAILABLE";
      }
  }

  template <class Decimal>
  class TechnicalSnapshot
  {
  public:
    TechnicalSnapshot (const TimeSeriesDate& asOfDate,
		       const Decimal& lastClose,
		       const std::optional<Decimal>& shortMA,
		       const std::optional<Decimal>& longMA,
		       const std::optional<Decimal>& rsi,
		       TrendState trend,
		       MomentumState momentum)
      : mAsOfDate(asOfDate),
	mLastClose(lastClose),
	mShortMA(shortMA),
	mLongMA(longMA),
	mRsi(rsi),
	mTrend(trend),
	mMomentum(momentum)
    {}

    const TimeSeriesDate& getAsOfDate() const { return mAsOfDate; }
    const Decimal& getLastClose() const { return mLastClose; }
    const std::optional<Decimal>& getShortMA() const { return mShortMA; }
    const std::optional<Decimal>& getLongMA() const { return mLongMA; }
    const std::optional<Decimal>& getRsi() const { return mRsi; }
    TrendState getTrend() const { return mTrend; }
    MomentumState getMomentum() const { return mMomentum; }

  private:
    TimeSeriesDate mAsOfDate;
    Decimal mLastClose;
    std::optional<Decimal> mShortMA;
    std::optional<Decimal> mLongMA;
    std::optional<Decimal> mRsi;
    TrendState mTrend;
    MomentumState mMomentum;
  };

  /**
   * @brief Moving average trend and RSI momentum as of a date.
   *
   * Only bars dated on or before the as-of date are used. Indicators that
   * lack history are reported as unavailable; this never throws for short
   * series.
   */
  template <class Decimal>
  class TechnicalAssessor
  {
  public:
    explicit TechnicalAssessor (const TechnicalIndicatorConfiguration<Decimal>& config =
				TechnicalIndicatorConfiguration<Decimal>())
      : mConfig(config)
    {}

    TechnicalSnapshot<Decimal> assess (const PriceSeries<Decimal>& series) const
    {
      return assess(series, series.getLastDate());
    }

    TechnicalSnapshot<Decimal> assess (const PriceSeries<Decimal>& series,
				       const TimeSeriesDate& asOf) const
    {
      std::optional<unsigned long> lastSession = series.getSessionIndex(asOf);
      if (!lastSession)
	throw ConfigurationException("TechnicalAssessor: as-of date " + boost::gregorian::to_simple_string(asOf) +
				     " precedes the first session of " + series.getSymbol());

      std::vector<Decimal> closes;
      closes.reserve(*lastSession + 1);
      for (unsigned long i = 0; i <= *lastSession; ++i)
	closes.push_back(series.getEntry(i).getCloseValue());

      const Decimal lastClose = closes.back();
      std::optional<Decimal> shortMA = SimpleMovingAverage(closes, mConfig.getShortMAPeriod());
      std::optional<Decimal> longMA = SimpleMovingAverage(closes, mConfig.getLongMAPeriod());
      std::optional<Decimal> rsi = RelativeStrengthIndex(closes, mConfig.getRsiPeriod());

      return TechnicalSnapshot<Decimal>(series.getEntry(*lastSession).getDate(), lastClose,
					shortMA, longMA, rsi,
					classifyTrend(lastClose, shortMA, longMA),
					classifyMomentum(rsi));
    }

    static TrendState classifyTrend (const Decimal& close,
				     const std::optional<Decimal>& shortMA,
				     const std::optional<Decimal>& longMA)
    {
      if (!shortMA || !longMA)
	return TrendState::UNAVAILABLE;

      if (close > *shortMA && *shortMA > *longMA)
	return TrendState::STRONG_UPTREND;

      if (close < *shortMA && *shortMA < *longMA)
	return TrendState::STRONG_DOWNTREND;

      return (*shortMA > *longMA) ? TrendState::BULLISH : TrendState::BEARISH;
    }

    MomentumState classifyMomentum (const std::optional<Decimal>& rsi) const
    {
      if (!rsi)
	return MomentumState::UNAVAILABLE;

      if (*rsi > mConfig.getOverboughtLevel())
	return MomentumState::OVERBOUGHT;

      if (*rsi < mConfig.getOversoldLevel())
	return MomentumState::OVERSOLD;

      return MomentumState::NEUTRAL;
    }

  private:
    TechnicalIndicatorConfiguration<Decimal> mConfig;
  };
}

#endif
