// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __COMPARISON_AGGREGATOR_H
#define __COMPARISON_AGGREGATOR_H 1

#include <algorithm>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "TrendGuardBacktest.h"
#include "IParallelExecutor.h"
#include "ParallelFor.h"

namespace mkc_markethealth
{
  /**
   * @brief Trend Guard against buy-and-hold for one symbol.
   *
   *   drawdownReduction = 1 - strategyMaxDD / buyHoldMaxDD  (empty if buyHoldMaxDD == 0)
   *   cagrDelta         = strategyCAGR - buyHoldCAGR
   *   sharpeDelta       = strategySharpe - buyHoldSharpe
   *   sharpeImprovement = sharpeDelta / |buyHoldSharpe|     (empty if buyHoldSharpe == 0)
   *
   * A failed row carries only the symbol and the error message.
   */
  template <class Decimal>
  class ComparisonRow
  {
  public:
    explicit ComparisonRow (const std::string& symbol)
      : mSymbol(symbol),
	mErrorMessage(),
	mResult(),
	mDrawdownReduction(),
	mCagrDelta(),
	mSharpeDelta(),
	mSharpeImprovement()
    {}

    const std::string& getSymbol() const { return mSymbol; }
    bool succeeded() const { return mResult.has_value(); }
    const std::string& getErrorMessage() const { return mErrorMessage; }
    const std::optional<TrendGuardResult<Decimal>>& getResult() const { return mResult; }
    const std::optional<Decimal>& getDrawdownReduction() const { return mDrawdownReduction; }
    const std::optional<Decimal>& getCagrDelta() const { return mCagrDelta; }
    const std::optional<Decimal>& getSharpeDelta() const { return mSharpeDelta; }
    const std::optional<Decimal>& getSharpeImprovement() const { return mSharpeImprovement; }

    void setResult (TrendGuardResult<Decimal> result)
    {
      const Decimal zero = DecimalConstants<Decimal>::DecimalZero;
      const BacktestResult<Decimal>& strategy = result.getStrategyResult();
      const BacktestResult<Decimal>& buyAndHold = result.getBuyAndHoldResult();

      mDrawdownReduction.reset();
      if (buyAndHold.getMaxDrawdown() != zero)
	mDrawdownReduction = DecimalConstants<Decimal>::DecimalOne -
	  strategy.getMaxDrawdown() / buyAndHold.getMaxDrawdown();

      mCagrDelta = strategy.getCAGR() - buyAndHold.getCAGR();
      mSharpeDelta = strategy.getSharpeRatio() - buyAndHold.getSharpeRatio();

      mSharpeImprovement.reset();
      if (buyAndHold.getSharpeRatio() != zero)
	mSharpeImprovement = *mSharpeDelta / num::abs(buyAndHold.getSharpeRatio());

      mResult = std::move(result);
      mErrorMessage.clear();
    }

    void setError (const std::string& message)
    {
      mResult.reset();
      mDrawdownReduction.reset();
      mCagrDelta.reset();
      mSharpeDelta.reset();
      mSharpeImprovement.reset();
      mErrorMessage = message;
    }

  private:
    std::string mSymbol;
    std::string mErrorMessage;
    std::optional<TrendGuardResult<Decimal>> mResult;
    std::optional<Decimal> mDrawdownReduction;
    std::optional<Decimal> mCagrDelta;
    std::optional<Decimal> mSharpeDelta;
    std::optional<Decimal> mSharpeImprovement;
  };

  enum class ComparisonSortKey { INPUT_ORDER, DRAWDOWN_REDUCTION, CAGR_DELTA, SHARPE_DELTA };

  inline std::string toString (ComparisonSortKey key)
  {
    switch (key)
      {
      case ComparisonSortKey::DRAWDOWN_REDUCTION:
	return "drawdown";
      case ComparisonSortKey::CAGR_DELTA:
	return "cagr";
      case ComparisonSortKey::SHARPE_DELTA:
	return "sharpe";
      case ComparisonSortKey::INPUT_ORDER:
      default:
	return "input";
      }
  }

  /**
   * @brief Descending stable sort on one of the derived measures.
   *
   * Rows without a value (failed symbols, undefined drawdown reduction) go
   * last and keep their relative order.
   */
  template <class Decimal>
  void sortComparisonRows (std::vector<ComparisonRow<Decimal>>& rows, ComparisonSortKey key)
  {
    if (key == ComparisonSortKey::INPUT_ORDER)
      return;

    auto keyOf = [key](const ComparisonRow<Decimal>& row) -> const std::optional<Decimal>& {
      switch (key)
	{
	case ComparisonSortKey::DRAWDOWN_REDUCTION:
	  return row.getDrawdownReduction();
	case ComparisonSortKey::CAGR_DELTA:
	  return row.getCagrDelta();
	case ComparisonSortKey::SHARPE_DELTA:
	default:
	  return row.getSharpeDelta();
	}
    };

    std::stable_sort(rows.begin(), rows.end(),
		     [&keyOf](const ComparisonRow<Decimal>& lhs, const ComparisonRow<Decimal>& rhs) {
		       const std::optional<Decimal>& a = keyOf(lhs);
		       const std::optional<Decimal>& b = keyOf(rhs);
		       if (a && b)
			 return *a > *b;

		       return a.has_value() && !b.has_value();
		     });
  }

  /**
   * @brief Runs Trend Guard for every symbol and joins the comparison rows.
   *
   * Symbols are independent and run through the executor; each task writes
   * only its own pre-allocated row. A symbol whose pipeline throws gets a
   * failed row and the rest still complete. Rows are in input order unless a
   * sort key is given.
   */
  template <class Decimal>
  class ComparisonAggregator
  {
  public:
    using SeriesPtr = std::shared_ptr<const PriceSeries<Decimal>>;

    ComparisonAggregator (const TrendGuardConfiguration<Decimal>& config,
			  concurrency::IParallelExecutor& executor)
      : mBacktest(config),
	mExecutor(executor)
    {}

    std::vector<ComparisonRow<Decimal>> compare (const std::vector<SeriesPtr>& universe,
						 ComparisonSortKey sortKey = ComparisonSortKey::INPUT_ORDER,
						 std::ostream* diagnostics = nullptr) const
    {
      std::vector<ComparisonRow<Decimal>> rows;
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
	      rows[i].setResult(mBacktest.run(*universe[i]));
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

      sortComparisonRows(rows, sortKey);
      return rows;
    }

  private:
    TrendGuardBacktest<Decimal> mBacktest;
    concurrency::IParallelExecutor& mExecutor;
  };
}

#endif
