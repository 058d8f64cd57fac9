// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __REPORT_WRITERS_H
#define __REPORT_WRITERS_H 1

#include <algorithm>
#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "ReportFormatting.h"
#include "MarketBreadthAnalyzer.h"
#include "ComparisonAggregator.h"

namespace mkc_markethealth
{
namespace reporting
{
  inline void writeSectionHeader (std::ostream& os, const std::string& title)
  {
    os << "\n=== " << title << " ===" << std::endl;
  }

  //
  // Text reports
  //

  template <class Decimal>
  void writeDistributionDayTable (std::ostream& os,
				  const std::vector<DistributionDayRecord<Decimal>>& records)
  {
    writeSectionHeader(os, "Distribution Days");
    if (records.empty())
      {
	os << "No distribution days detected." << std::endl;
	return;
      }

    os << std::left
       << std::setw(12) << "Date"
       << std::setw(12) << "Close"
       << std::setw(10) << "Change%"
       << std::setw(10) << "Volume%"
       << std::setw(11) << "Weighted%"
       << std::setw(16) << "Status"
       << "Expired On" << std::endl;

    for (const auto& record : records)
      os << std::left
	 << std::setw(12) << formatDate(record.getDate())
	 << std::setw(12) << formatValue(record.getCloseValue())
	 << std::setw(10) << formatPercent(record.getPercentChange())
	 << std::setw(10) << formatPercent(record.getVolumeChange())
	 << std::setw(11) << formatPercent(record.getWeightedChange())
	 << std::setw(16) << (record.isExpired() ? toString(record.getExpirationReason()) : std::string("ACTIVE"))
	 << (record.isExpired() ? formatDate(record.getExpirationDate()) : std::string(""))
	 << std::endl;
  }

  template <class Decimal>
  void writeMarketCondition (std::ostream& os, const MarketCondition<Decimal>& condition)
  {
    writeSectionHeader(os, "Market Condition as of " + formatDate(condition.getAsOfDate()));
    os << "Active distribution days: " << condition.getTotalCount() << std::endl;
    os << "Recent distribution days: " << condition.getRecentCount() << std::endl;
    os << "Total weighted change:    " << formatPercent(condition.getTotalWeightedChange()) << "%" << std::endl;
    os << "Verdict:                  " << toString(condition.getVerdict()) << std::endl;
    os << "                          " << condition.getDescription() << std::endl;
  }

  template <class Decimal>
  void writeTechnicalAnalysis (std::ostream& os, const TechnicalSnapshot<Decimal>& snapshot)
  {
    writeSectionHeader(os, "Technical Analysis");
    os << "Last close: " << formatValue(snapshot.getLastClose()) << std::endl;
    os << "Short MA:   " << formatValue(snapshot.getShortMA()) << std::endl;
    os << "Long MA:    " << formatValue(snapshot.getLongMA()) << std::endl;
    os << "RSI:        " << formatValue(snapshot.getRsi()) << std::endl;
    os << "Trend:      " << toString(snapshot.getTrend()) << std::endl;
    os << "Momentum:   " << toString(snapshot.getMomentum()) << std::endl;
  }

  template <class Decimal>
  void writeDistributionReport (std::ostream& os, const DistributionAnalysis<Decimal>& analysis)
  {
    os << analysis.getSymbol() << ": " << analysis.getSessionsAnalyzed() << " sessions analyzed" << std::endl;
    writeDistributionDayTable(os, analysis.getRecords());
    writeMarketCondition(os, analysis.getCondition());
    writeTechnicalAnalysis(os, analysis.getTechnicalSnapshot());
  }

  template <class Decimal>
  void writeBreadthSummary (std::ostream& os, const BreadthSummary<Decimal>& summary)
  {
    writeSectionHeader(os, "Market Breadth");
    os << std::left
       << std::setw(10) << "Symbol"
       << std::setw(8) << "Active"
       << std::setw(8) << "Recent"
       << std::setw(20) << "Verdict"
       << "Trend" << std::endl;

    for (const auto& row : summary.getRows())
      {
	os << std::left << std::setw(10) << row.getSymbol();
	if (!row.succeeded())
	  {
	    os << "FAILED: " << row.getErrorMessage() << std::endl;
	    continue;
	  }

	const auto& analysis = *row.getAnalysis();
	os << std::setw(8) << analysis.getCondition().getTotalCount()
	   << std::setw(8) << analysis.getCondition().getRecentCount()
	   << std::setw(20) << toString(analysis.getCondition().getVerdict())
	   << toString(analysis.getTechnicalSnapshot().getTrend()) << std::endl;
      }

    os << "Healthy: " << summary.getHealthyCount()
       << "  Moderate: " << summary.getModerateCount()
       << "  High: " << summary.getHighCount()
       << "  Failed: " << summary.getFailedCount() << std::endl;
  }

  template <class Decimal>
  void writeComparisonTable (std::ostream& os, const std::vector<ComparisonRow<Decimal>>& rows)
  {
    writeSectionHeader(os, "Trend Guard vs Buy & Hold");
    os << std::left
       << std::setw(10) << "Symbol"
       << std::setw(8) << "Months"
       << std::setw(10) << "BH CAGR%"
       << std::setw(10) << "BH MDD%"
       << std::setw(10) << "BH Sharpe"
       << std::setw(10) << "TG CAGR%"
       << std::setw(10) << "TG MDD%"
       << std::setw(10) << "TG Sharpe"
       << std::setw(10) << "DDRed%"
       << "Invested%" << std::endl;

    for (const auto& row : rows)
      {
	os << std::left << std::setw(10) << row.getSymbol();
	if (!row.succeeded())
	  {
	    os << "FAILED: " << row.getErrorMessage() << std::endl;
	    continue;
	  }

	const BacktestResult<Decimal>& bh = row.getResult()->getBuyAndHoldResult();
	const BacktestResult<Decimal>& tg = row.getResult()->getStrategyResult();
	os << std::setw(8) << tg.getMonthCount()
	   << std::setw(10) << formatPercent(bh.getCAGR())
	   << std::setw(10) << formatPercent(bh.getMaxDrawdown())
	   << std::setw(10) << formatValue(bh.getSharpeRatio())
	   << std::setw(10) << formatPercent(tg.getCAGR())
	   << std::setw(10) << formatPercent(tg.getMaxDrawdown())
	   << std::setw(10) << formatValue(tg.getSharpeRatio())
	   << std::setw(10) << formatPercent(row.getDrawdownReduction())
	   << formatPercent(tg.getTimeInvestedFraction()) << std::endl;
      }
  }

  //
  // CSV writers. Values are raw fractions with full precision; missing values
  // are empty fields.
  //

  template <class Decimal>
  std::string csvValue (const std::optional<Decimal>& value)
  {
    return value ? num::toString(*value) : std::string();
  }

  template <class Decimal>
  void writeDistributionDaysCsv (std::ostream& os,
				 const std::vector<DistributionDayRecord<Decimal>>& records)
  {
    os << "Date,Close,Volume,PreviousClose,PreviousVolume,PercentChange,VolumeChange,"
       << "WeightedChange,Expired,ExpirationReason,ExpirationDate" << "\n";

    for (const auto& record : records)
      os << formatDate(record.getDate()) << ","
	 << num::toString(record.getCloseValue()) << ","
	 << record.getVolume() << ","
	 << num::toString(record.getPreviousClose()) << ","
	 << record.getPreviousVolume() << ","
	 << num::toString(record.getPercentChange()) << ","
	 << num::toString(record.getVolumeChange()) << ","
	 << num::toString(record.getWeightedChange()) << ","
	 << (record.isExpired() ? "true" : "false") << ","
	 << toString(record.getExpirationReason()) << ","
	 << (record.getExpirationDate() ? formatDate(*record.getExpirationDate()) : std::string())
	 << "\n";
  }

  /**
   * One line per month. Equity columns are empty before the anchor month,
   * since neither curve exists yet.
   */
  template <class Decimal>
  void writeMonthlyObservationsCsv (std::ostream& os, const TrendGuardResult<Decimal>& result)
  {
    os << "MonthEnd,Price,SMA,RawSignal,Position,StrategyEquity,BuyHoldEquity" << "\n";

    const EquityCurve<Decimal>& strategy = result.getStrategyCurve();
    const EquityCurve<Decimal>& buyAndHold = result.getBuyAndHoldCurve();
    unsigned long point = 0;

    for (const auto& obs : result.getObservations())
      {
	os << formatDate(obs.getMonthEndDate()) << ","
	   << num::toString(obs.getPrice()) << ","
	   << csvValue(obs.getTrailingSMA()) << ","
	   << (obs.getRawSignal() ? toString(*obs.getRawSignal()) : std::string()) << ","
	   << (obs.getPositionForThisMonth() ? toString(*obs.getPositionForThisMonth()) : std::string()) << ",";

	if (point < strategy.getNumPoints() &&
	    strategy.getPoint(point).getDate() == obs.getMonthEndDate())
	  {
	    os << num::toString(strategy.getPoint(point).getEquity()) << ","
	       << num::toString(buyAndHold.getPoint(point).getEquity());
	    ++point;
	  }
	else
	  os << ",";

	os << "\n";
      }
  }

  template <class Decimal>
  void writeComparisonCsv (std::ostream& os, const std::vector<ComparisonRow<Decimal>>& rows)
  {
    os << "Symbol,Succeeded,Error,PeriodStart,PeriodEnd,Months,"
       << "BuyHoldCAGR,BuyHoldMaxDD,BuyHoldSharpe,StrategyCAGR,StrategyMaxDD,StrategySharpe,"
       << "TimeInvested,DrawdownReduction,CagrDelta,SharpeDelta,SharpeImprovement" << "\n";

    for (const auto& row : rows)
      {
	os << row.getSymbol() << "," << (row.succeeded() ? "true" : "false") << ",";
	if (!row.succeeded())
	  {
	    std::string message = row.getErrorMessage();
	    std::replace(message.begin(), message.end(), ',', ';');
	    os << message << ",,,,,,,,,,,,,," << "\n";
	    continue;
	  }

	const BacktestResult<Decimal>& bh = row.getResult()->getBuyAndHoldResult();
	const BacktestResult<Decimal>& tg = row.getResult()->getStrategyResult();
	os << ","
	   << formatDate(tg.getPeriodStart()) << ","
	   << formatDate(tg.getPeriodEnd()) << ","
	   << tg.getMonthCount() << ","
	   << num::toString(bh.getCAGR()) << ","
	   << num::toString(bh.getMaxDrawdown()) << ","
	   << num::toString(bh.getSharpeRatio()) << ","
	   << num::toString(tg.getCAGR()) << ","
	   << num::toString(tg.getMaxDrawdown()) << ","
	   << num::toString(tg.getSharpeRatio()) << ","
	   << num::toString(tg.getTimeInvestedFraction()) << ","
	   << csvValue(row.getDrawdownReduction()) << ","
	   << csvValue(row.getCagrDelta()) << ","
	   << csvValue(row.getSharpeDelta()) << ","
	   << csvValue(row.getSharpeImprovement()) << "\n";
      }
  }
}
}

#endif
