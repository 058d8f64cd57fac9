// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_EXCEPTION_H
#define __PRICE_SERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_markethealth
{
  // Base of every error raised by the analytical pipelines
  class MarketHealthException : public std::runtime_error
  {
  public:
    explicit MarketHealthException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~MarketHealthException() = default;
  };

  // Fewer observations than a computation needs (e.g. no tradable month
  // for Trend Guard, fewer than two bars for distribution day detection).
  class InsufficientHistoryException : public MarketHealthException
  {
  public:
    explicit InsufficientHistoryException(const std::string& msg)
      : MarketHealthException(msg) {}
  };

  // Input that cannot produce meaningful output: non-positive prices,
  // non-positive starting equity, malformed series.
  class DegenerateInputException : public MarketHealthException
  {
  public:
    explicit DegenerateInputException(const std::string& msg)
      : MarketHealthException(msg) {}
  };

  // Dates that are duplicated or out of order. This is a contract violation by
  // whoever produced the series and aborts the pipeline for that symbol.
  class NonMonotonicDatesException : public DegenerateInputException
  {
  public:
    explicit NonMonotonicDatesException(const std::string& msg)
      : DegenerateInputException(msg) {}
  };

  // Parameter outside its valid range
  class ConfigurationException : public MarketHealthException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : MarketHealthException(msg) {}
  };

} // namespace mkc_markethealth

#endif // __PRICE_SERIES_EXCEPTION_H
