// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __MARKET_BREADTH_ANALYZER_H
#define __MARKET_BREADTH_ANALYZER_H 1

#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "DistributionAnalyzer.h"
#include "IParallelExecutor.h"
#include "ParallelFor.h"

namespace mkc_markethealth
{
  //
  // One symbol of a breadth run. Either the analysis or the error message is set.
  //
  template <class Decimal>
  class BreadthRow
  {
  public:
    explicit BreadthRow (const std::string& symbol)
      : mSymbol(symbol),
	mAnalysis(),
	mErrorMessage()
    {}

    const std::string& getSymbol() const { return mSymbol; }
    bool succeeded() const { return mAnalysis.has_value(); }
    const std::optional<DistributionAnalysis<Decimal>>& getAnalysis() const { return mAnalysis; }
    const std::string& getErrorMessage() const { return mErrorMessage; }

    void setAnalysis (DistributionAnalysis<Decimal> analysis)
    {
      mAnalysis = std::move(analysis);
      mErrorMessage.clear();
    }

    void setError (const std::string& message)
    {
      mAnalysis.reset();
      mErrorMessage = message;
    }

  private:
    std::string mSymbol;
    std::optional<DistributionAnalysis<Decimal>> mAnalysis;
    std::string mErrorMessage;
  };

  template <class Decimal>
  class BreadthSummary
  {
  public:
    BreadthSummary (std::vector<BreadthRow<Decimal>> rows)
      : mRows(std::move(rows)),
	mHealthyCount(0),
	mModerateCount(0),
	mHighCount(0),
	mFailedCount(0)
    {
      for (const auto& row : mRows)
	{
	  if (!row.succeeded())
	    {
	      ++mFailedCount;
	      continue;
	    }

	  switch (row.getAnalysis()->getCondition().getVerdict())
	    {
	    case MarketVerdict::HIGH_PRESSURE:
	      ++mHighCount;
	      break;
	    case MarketVerdict::MODERATE_PRESSURE:
	      ++mModerateCount;
	      break;
	    case MarketVerdict::HEALTHY:
	      ++mHealthyCount;
	      break;
	    }
	}
    }

    const std::vector<BreadthRow<Decimal>>& getRows() const { return mRows; }
    unsigned int getHealthyCount() const { return mHealthyCount; }
    unsigned int getModerateCount() const { return mModerateCount; }
    unsigned int getHighCount() const { return mHighCount; }
    unsigned int getFailedCount() const { return mFailedCount; }

  private:
    std::vector<BreadthRow<Decimal>> mRows;
    unsigned int mHealthyCount;
    unsigned int mModerateCount;
    unsigned int mHighCount;
    unsigned int mFailedCount;
  };

  /**
   * @brief Runs the distribution pipeline over many symbols.
   *
   * Each symbol is independent; the work is forked through the executor and
   * joined before returning. A symbol whose pipeline throws gets a failed row
   * carrying the message while the others complete. Rows keep input order.
   */
  template <class Decimal>
  class MarketBreadthAnalyzer
  {
  public:
    using SeriesPtr = std::shared_ptr<const PriceSeries<Decimal>>;

    MarketBreadthAnalyzer (const DistributionAnalyzer<Decimal>& analyzer,
			   concurrency::IParallelExecutor& executor)
      : mAnalyzer(analyzer),
	mExecutor(executor)
    {}

    BreadthSummary<Decimal> analyze (const std::vector<SeriesPtr>& universe,
				     const std::optional<TimeSeriesDate>& asOf = std::nullopt,
				     std::ostream* diagnostics = nullptr) const
    {
      std::vector<BreadthRow<Decimal>> rows;
      rows.reserve(universe.size());
      for (const auto& series : universe)
	rows.emplace_back(series ? series->getSymbol() : std::string("<null>"));

      concurrency::parallel_for(universe.size(), mExecutor, [&](std::size_t i) {
	  if (!universe[i])
	    {
	      rows[i].setError("no price series supplied");
	      return;
	    }

	  try
	    {
	      rows[i].setAnalysis(mAnalyzer.analyze(*universe[i], asOf));
	    }
	  catch (const std::exception& e)
	    {
	      rows[i].setError(e.what());
	    }
	});

      if (diagnostics)
	for (const auto& row : rows)
	  if (!row.succeeded())
	    *diagnostics << "Warning: " << row.getSymbol() << " skipped: " << row.getErrorMessage() << std::endl;

      return BreadthSummary<Decimal>(std::move(rows));
    }

  private:
    DistributionAnalyzer<Decimal> mAnalyzer;
    concurrency::IParallelExecutor& mExecutor;
  };
}

#endif
