// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __NARRATIVE_SUMMARY_H
#define __NARRATIVE_SUMMARY_H 1

#include <optional>
#include <stdexcept>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "ReportFormatting.h"
#include "DistributionAnalyzer.h"
#include "ComparisonAggregator.h"

namespace mkc_markethealth
{
namespace reporting
{
  /**
   * @brief Flattened numeric summary handed to the narrative writer.
   *
   * An ordered list of key/value strings plus an optional opaque image path.
   * The consumer only sees these strings, so every value is already formatted:
   * percentages with two decimals, unavailable values as "n/a".
   */
  class NarrativeSummary
  {
  public:
    typedef std::vector<std::pair<std::string, std::string>>::const_iterator ConstIterator;

    NarrativeSummary()
      : mEntries(),
	mImageArtifact()
    {}

    void add (const std::string& key, const std::string& value)
    {
      mEntries.emplace_back(key, value);
    }

    std::optional<std::string> getValue (const std::string& key) const
    {
      for (const auto& entry : mEntries)
	if (entry.first == key)
	  return entry.second;

      return std::nullopt;
    }

    std::size_t getNumEntries() const { return mEntries.size(); }
    ConstIterator beginEntries() const { return mEntries.begin(); }
    ConstIterator endEntries() const { return mEntries.end(); }

    void setImageArtifact (const std::string& path) { mImageArtifact = path; }
    const std::optional<std::string>& getImageArtifact() const { return mImageArtifact; }

  private:
    std::vector<std::pair<std::string, std::string>> mEntries;
    std::optional<std::string> mImageArtifact;
  };

  template <class Decimal>
  std::string distributionDayStatus (const DistributionDayRecord<Decimal>& record)
  {
    return record.isExpired() ? ("expired_" + toString(record.getExpirationReason())) : std::string("active");
  }

  template <class Decimal>
  NarrativeSummary buildDistributionNarrative (const std::string& symbol,
					       unsigned long sessionsAnalyzed,
					       const MarketCondition<Decimal>& condition,
					       const DistributionStatistics<Decimal>& statistics,
					       const TechnicalSnapshot<Decimal>& technicals,
					       const std::vector<DistributionDayRecord<Decimal>>& records)
  {
    NarrativeSummary summary;
    summary.add("symbol", symbol);
    summary.add("as_of", formatDate(condition.getAsOfDate()));
    summary.add("sessions_analyzed", std::to_string(sessionsAnalyzed));
    summary.add("distribution_days_detected", std::to_string(statistics.getDetectedCount()));
    summary.add("distribution_days_active", std::to_string(condition.getTotalCount()));
    summary.add("distribution_days_recent", std::to_string(condition.getRecentCount()));
    summary.add("weighted_change_active_pct", formatPercent(condition.getTotalWeightedChange()));
    summary.add("weighted_change_total_pct", formatPercent(statistics.getTotalWeightedChange()));
    summary.add("average_volume_increase_pct", formatPercent(statistics.getAverageVolumeIncrease()));
    summary.add("market_verdict", toString(condition.getVerdict()));
    summary.add("last_close", formatValue(technicals.getLastClose()));
    summary.add("ma_short", formatValue(technicals.getShortMA()));
    summary.add("ma_long", formatValue(technicals.getLongMA()));
    summary.add("rsi", formatValue(technicals.getRsi()));
    summary.add("trend", toString(technicals.getTrend()));
    summary.add("momentum", toString(technicals.getMomentum()));

    unsigned int n = 0;
    for (const auto& record : records)
      summary.add("day_" + std::to_string(++n),
		  formatDate(record.getDate()) + "," +
		  formatValue(record.getCloseValue()) + "," +
		  std::to_string(record.getVolume()) + "," +
		  formatPercent(record.getWeightedChange()) + "," +
		  distributionDayStatus(record));

    return summary;
  }

  template <class Decimal>
  NarrativeSummary buildDistributionNarrative (const DistributionAnalysis<Decimal>& analysis)
  {
    return buildDistributionNarrative(analysis.getSymbol(), analysis.getSessionsAnalyzed(),
				      analysis.getCondition(), analysis.getStatistics(),
				      analysis.getTechnicalSnapshot(), analysis.getRecords());
  }

  /**
   * @throws std::invalid_argument for a failed comparison row.
   */
  template <class Decimal>
  NarrativeSummary buildTrendGuardNarrative (const ComparisonRow<Decimal>& row)
  {
    if (!row.succeeded())
      throw std::invalid_argument("buildTrendGuardNarrative: no result for " + row.getSymbol() +
				  ": " + row.getErrorMessage());

    const BacktestResult<Decimal>& strategy = row.getResult()->getStrategyResult();
    const BacktestResult<Decimal>& buyAndHold = row.getResult()->getBuyAndHoldResult();

    NarrativeSummary summary;
    summary.add("symbol", row.getSymbol());
    summary.add("period_start", formatDate(strategy.getPeriodStart()));
    summary.add("period_end", formatDate(strategy.getPeriodEnd()));
    summary.add("months", std::to_string(strategy.getMonthCount()));
    summary.add("time_invested_pct", formatPercent(strategy.getTimeInvestedFraction()));
    summary.add("cagr_buy_hold_pct", formatPercent(buyAndHold.getCAGR()));
    summary.add("max_dd_buy_hold_pct", formatPercent(buyAndHold.getMaxDrawdown()));
    summary.add("sharpe_buy_hold", formatValue(buyAndHold.getSharpeRatio()));
    summary.add("cagr_strategy_pct", formatPercent(strategy.getCAGR()));
    summary.add("max_dd_strategy_pct", formatPercent(strategy.getMaxDrawdown()));
    summary.add("sharpe_strategy", formatValue(strategy.getSharpeRatio()));
    summary.add("drawdown_reduction_pct", formatPercent(row.getDrawdownReduction()));
    summary.add("sharpe_improvement_pct", formatPercent(row.getSharpeImprovement()));

    return summary;
  }

  // key=value lines, image_artifact last
  inline void writeNarrativeSummary (std::ostream& os, const NarrativeSummary& summary)
  {
    for (auto it = summary.beginEntries(); it != summary.endEntries(); ++it)
      os << it->first << "=" << it->second << "\n";

    if (summary.getImageArtifact())
      os << "image_artifact=" << *summary.getImageArtifact() << "\n";
  }
}
}

#endif
