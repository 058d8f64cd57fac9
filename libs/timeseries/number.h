#ifndef NUMBER_H
#define NUMBER_H

#include <string>
#include "decimal.h"

/**
 * @file number.h
 * @brief Decimal type aliases and conversion helpers used throughout MarketHealth.
 *
 * Prices, returns and equity values are carried as fixed point decimals so that
 * comparisons such as "close is at least 5% above the distribution day close" are
 * not subject to binary floating point drift. Transcendental operations (pow, sqrt)
 * are done in double and converted back at the boundary.
 */
namespace num
{
  /**
   * @brief Default decimal type with 7 decimal places using the default rounding policy.
   * @see dec::decimal
   */
  using DefaultNumber  = dec::decimal<7>;

  /**
   * @brief Converts a DefaultNumber to its string representation.
   */
  inline std::string toString(const DefaultNumber& d) {
    return dec::toString(d);
  }

  /**
   * @brief Converts any dec::decimal to a double.
   * Note: This conversion may result in a loss of precision.
   */
  template <int Prec, class RoundPolicy>
  inline double to_double(const dec::decimal<Prec, RoundPolicy>& d) {
    return d.getAsDouble();
  }

  inline double to_double(double d) {
    return d;
  }

  /**
   * @brief Converts a string representation to a decimal type.
   * @tparam N The target decimal type (e.g., DefaultNumber).
   */
  template<class N>
  inline N fromString(const std::string& s) {
    return ::dec::fromString<N>(s);
  }

  template<typename Decimal>
  inline Decimal abs(const Decimal& d) {
    return d.abs();
  }

  // Ratio of two decimals computed in double, used for returns where the
  // intermediate quotient should not be truncated to the decimal precision.
  template<typename Decimal>
  inline double ratio(const Decimal& numerator, const Decimal& denominator) {
    return to_double(numerator) / to_double(denominator);
  }

} // namespace num

#endif // NUMBER_H
