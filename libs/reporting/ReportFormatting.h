#pragma once

#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "BoostDateHelper.h"
#include "DecimalConstants.h"
#include "number.h"

namespace mkc_markethealth
{
namespace reporting
{
  inline const std::string& notAvailable()
  {
    static const std::string na("n/a");
    return na;
  }

  inline std::string formatFixed (double value, int decimals)
  {
    std::ostringstream os;
    os << std::fixed << std::setprecision(decimals) << value;
    return os.str();
  }

  // Fraction rendered as a percentage: 0.0523 -> "5.23"
  template <class Decimal>
  std::string formatPercent (const Decimal& fraction, int decimals = 2)
  {
    return formatFixed(num::to_double(fraction) * 100.0, decimals);
  }

  template <class Decimal>
  std::string formatPercent (const std::optional<Decimal>& fraction, int decimals = 2)
  {
    return fraction ? formatPercent(*fraction, decimals) : notAvailable();
  }

  template <class Decimal>
  std::string formatValue (const Decimal& value, int decimals = 2)
  {
    return formatFixed(num::to_double(value), decimals);
  }

  template <class Decimal>
  std::string formatValue (const std::optional<Decimal>& value, int decimals = 2)
  {
    return value ? formatValue(*value, decimals) : notAvailable();
  }

  inline std::string formatDate (const TimeSeriesDate& date)
  {
    return boost::gregorian::to_iso_extended_string(date);
  }

  inline std::string formatDate (const std::optional<TimeSeriesDate>& date)
  {
    return date ? formatDate(*date) : notAvailable();
  }
}
}
