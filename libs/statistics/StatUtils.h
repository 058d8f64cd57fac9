#pragma once
#include <vector>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <utility>
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_markethealth
{
  template <class Decimal> struct StatUtils;

  /**
   * @brief Mean and unbiased variance in a single pass.
   *
   * Generic fallback; dec::decimal gets a faster specialization below.
   */
  template <class Decimal>
  struct ComputeFast
  {
    static inline std::pair<Decimal, Decimal>
    run(const std::vector<Decimal>& data)
    {
      return StatUtils<Decimal>::computeMeanAndVariance(data);
    }
  };

  /**
   * @brief Welford update on the raw fixed point representation of dec::decimal.
   *
   * The running aggregates are kept in long double and converted back to the
   * decimal type once. Returns {0, 0} for empty input and variance 0 for a
   * single value.
   */
  template <int Prec, class RoundPolicy>
  struct ComputeFast<dec::decimal<Prec, RoundPolicy>>
  {
    using Decimal = dec::decimal<Prec, RoundPolicy>;

    static inline std::pair<Decimal, Decimal>
    run(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return { DecimalConstants<Decimal>::DecimalZero,
		 DecimalConstants<Decimal>::DecimalZero };

      const long double invF = 1.0L / static_cast<long double>(dec::DecimalFactor<Prec>::value);

      long double mean = 0.0L;
      long double m2   = 0.0L;
      std::size_t k    = 0;

      for (const auto& d : data)
	{
	  const long double x = static_cast<long double>(d.getUnbiased()) * invF;
	  ++k;
	  const long double delta  = x - mean;
	  mean += delta / static_cast<long double>(k);
	  m2 += delta * (x - mean);
	}

      const long double var = (k > 1) ? (m2 / static_cast<long double>(k - 1)) : 0.0L;
      return { Decimal(static_cast<double>(mean)),
	       Decimal(static_cast<double>(var)) };
    }
  };

  /**
   * @class StatUtils
   * @brief Summary statistics over return series.
   */
  template<class Decimal>
  struct StatUtils
  {
    static Decimal computeMean(const std::vector<Decimal>& data)
    {
      if (data.empty())
	return DecimalConstants<Decimal>::DecimalZero;

      Decimal sum = std::accumulate(data.begin(), data.end(), DecimalConstants<Decimal>::DecimalZero);
      return sum / Decimal(static_cast<int>(data.size()));
    }

    /**
     * @brief Unbiased sample variance (n - 1 denominator) around a given mean.
     *        Returns 0 when data.size() < 2.
     */
    static Decimal computeVariance(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const std::size_t n = data.size();
      if (n < 2)
	return DecimalConstants<Decimal>::DecimalZero;

      Decimal sqSum = std::accumulate(data.begin(), data.end(), DecimalConstants<Decimal>::DecimalZero,
				      [&mean](const Decimal& acc, const Decimal& val) {
					const Decimal diff = (val - mean);
					return acc + diff * diff;
				      });

      return sqSum / Decimal(static_cast<int>(n - 1));
    }

    static std::pair<Decimal, Decimal> computeMeanAndVariance(const std::vector<Decimal>& data)
    {
      const Decimal mean = computeMean(data);
      return { mean, computeVariance(data, mean) };
    }

    static inline std::pair<Decimal, Decimal>
    computeMeanAndVarianceFast(const std::vector<Decimal>& data)
    {
      return ComputeFast<Decimal>::run(data);
    }

    /**
     * @brief Welford mean and unbiased variance kept in floating point.
     *
     * Used where the variance itself is tiny (monthly returns of a mostly
     * cash strategy) and rounding it to the decimal precision would distort
     * anything derived from it.
     */
    static std::pair<double, double> computeMeanAndVarianceDouble(const std::vector<Decimal>& data)
    {
      long double mean = 0.0L;
      long double m2   = 0.0L;
      std::size_t k    = 0;

      for (const auto& d : data)
	{
	  const long double x = static_cast<long double>(num::to_double(d));
	  ++k;
	  const long double delta = x - mean;
	  mean += delta / static_cast<long double>(k);
	  m2 += delta * (x - mean);
	}

      const long double var = (k > 1) ? (m2 / static_cast<long double>(k - 1)) : 0.0L;
      return { static_cast<double>(mean), static_cast<double>(var) };
    }

    static Decimal computeStdDev(const std::vector<Decimal>& data, const Decimal& mean)
    {
      const double v = num::to_double(computeVariance(data, mean));
      return (v > 0.0) ? Decimal(std::sqrt(v)) : DecimalConstants<Decimal>::DecimalZero;
    }

    /**
     * @brief Annualized Sharpe ratio of a series of periodic returns.
     *
     * (mean(r) - riskFreePerPeriod) / sampleStdDev(r) * sqrt(periodsPerYear).
     * Returns 0 when there are fewer than two returns or the standard deviation
     * is zero.
     */
    static inline Decimal sharpeFromReturns(const std::vector<Decimal>& data,
					    double periodsPerYear,
					    double riskFreePerPeriod)
    {
      if (data.size() < 2)
	return DecimalConstants<Decimal>::DecimalZero;

      auto [mean, var] = computeMeanAndVarianceDouble(data);
      if (!(var > 0.0))
	return DecimalConstants<Decimal>::DecimalZero;

      const double sd = std::sqrt(var);
      const double ann = (periodsPerYear > 1.0) ? std::sqrt(periodsPerYear) : 1.0;
      return Decimal(((mean - riskFreePerPeriod) / sd) * ann);
    }
  };
}
