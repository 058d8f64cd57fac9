// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DISTRIBUTION_ANALYZER_H
#define __DISTRIBUTION_ANALYZER_H 1

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "PriceSeries.h"
#include "DistributionDayDetector.h"
#include "ExpirationFilter.h"
#include "MarketConditionAssessor.h"
#include "TechnicalAssessor.h"

namespace mkc_markethealth
{
  //
  // class DistributionAnalysis
  //
  // Everything the distribution pipeline produces for one symbol.
  //
  template <class Decimal>
  class DistributionAnalysis
  {
  public:
    DistributionAnalysis (const std::string& symbol,
			  unsigned long sessionsAnalyzed,
			  std::vector<DistributionDayRecord<Decimal>> records,
			  const MarketCondition<Decimal>& condition,
			  const DistributionStatistics<Decimal>& statistics,
			  const TechnicalSnapshot<Decimal>& technicals)
      : mSymbol(symbol),
	mSessionsAnalyzed(sessionsAnalyzed),
	mRecords(std::move(records)),
	mCondition(condition),
	mStatistics(statistics),
	mTechnicals(technicals)
    {}

    const std::string& getSymbol() const { return mSymbol; }
    unsigned long getSessionsAnalyzed() const { return mSessionsAnalyzed; }
    const std::vector<DistributionDayRecord<Decimal>>& getRecords() const { return mRecords; }
    const MarketCondition<Decimal>& getCondition() const { return mCondition; }
    const DistributionStatistics<Decimal>& getStatistics() const { return mStatistics; }
    const TechnicalSnapshot<Decimal>& getTechnicalSnapshot() const { return mTechnicals; }

  private:
    std::string mSymbol;
    unsigned long mSessionsAnalyzed;
    std::vector<DistributionDayRecord<Decimal>> mRecords;
    MarketCondition<Decimal> mCondition;
    DistributionStatistics<Decimal> mStatistics;
    TechnicalSnapshot<Decimal> mTechnicals;
  };

  /**
   * @brief Detector -> expiration filter -> assessor for a single series.
   *
   * Records dated after the as-of date are dropped from the analysis, and
   * statistics cover the remaining detected days whether expired or not.
   */
  template <class Decimal>
  class DistributionAnalyzer
  {
  public:
    DistributionAnalyzer (const DistributionDayConfiguration<Decimal>& dayConfig =
			  DistributionDayConfiguration<Decimal>(),
			  const MarketConditionThresholds<Decimal>& thresholds =
			  MarketConditionThresholds<Decimal>(),
			  const TechnicalIndicatorConfiguration<Decimal>& technicalConfig =
			  TechnicalIndicatorConfiguration<Decimal>())
      : mDetector(dayConfig),
	mFilter(dayConfig),
	mAssessor(thresholds),
	mTechnicalAssessor(technicalConfig)
    {}

    DistributionAnalysis<Decimal> analyze (const PriceSeries<Decimal>& series,
					   const std::optional<TimeSeriesDate>& asOfDate = std::nullopt,
					   std::ostream* diagnostics = nullptr) const
    {
      const TimeSeriesDate asOf = asOfDate ? *asOfDate : series.getLastDate();

      std::vector<DistributionDayRecord<Decimal>> records = mDetector.detect(series);
      mFilter.apply(records, series, asOf);

      std::vector<DistributionDayRecord<Decimal>> visible;
      visible.reserve(records.size());
      for (const auto& record : records)
	if (record.getDate() <= asOf)
	  visible.push_back(record);

      MarketCondition<Decimal> condition = mAssessor.assess(visible, series, asOf);
      DistributionStatistics<Decimal> statistics(visible);
      TechnicalSnapshot<Decimal> technicals = mTechnicalAssessor.assess(series, asOf);

      const unsigned long sessionsAnalyzed = *series.getSessionIndex(asOf) + 1;

      if (diagnostics)
	*diagnostics << series.getSymbol() << ": " << statistics.getDetectedCount()
		     << " distribution days detected, " << condition.getTotalCount()
		     << " active as of " << boost::gregorian::to_simple_string(asOf)
		     << " (" << toString(condition.getVerdict()) << ")" << std::endl;

      return DistributionAnalysis<Decimal>(series.getSymbol(), sessionsAnalyzed, std::move(visible),
					   condition, statistics, technicals);
    }

  private:
    DistributionDayDetector<Decimal> mDetector;
    ExpirationFilter<Decimal> mFilter;
    MarketConditionAssessor<Decimal> mAssessor;
    TechnicalAssessor<Decimal> mTechnicalAssessor;
  };
}

#endif
