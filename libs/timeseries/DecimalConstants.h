// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DECIMAL_CONSTANT_H
#define __DECIMAL_CONSTANT_H 1

#include <string>
#include <type_traits>
#include "decimal.h"

namespace mkc_markethealth
{
  template <class Decimal>
  class DecimalConstants
    {
    public:
      static Decimal DecimalZero;
      static Decimal DecimalOne;
      static Decimal DecimalMinusOne;
      static Decimal DecimalTwelve;
      static Decimal DecimalOneHundred;
      static Decimal DefaultRecoveryThreshold;   // 5% price recovery expires a distribution day
      static Decimal DefaultCashAnnualYield;     // 3% per year while in cash
      static Decimal DefaultOverboughtLevel;     // RSI 70
      static Decimal DefaultOversoldLevel;       // RSI 30

      static Decimal createDecimal (const std::string& valueString)
      {
        if constexpr (std::is_floating_point_v<Decimal>) {
          return static_cast<Decimal>(std::stod(valueString));
        } else {
          return dec::fromString<Decimal>(valueString);
        }
      }
    };

  // Values are initialised from strings so the full precision of the decimal
  // type is used rather than a rounded double literal.

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalZero(
      DecimalConstants<Decimal>::createDecimal("0.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOne(
      DecimalConstants<Decimal>::createDecimal("1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalMinusOne(
      DecimalConstants<Decimal>::createDecimal("-1.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalTwelve(
      DecimalConstants<Decimal>::createDecimal("12.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DecimalOneHundred(
      DecimalConstants<Decimal>::createDecimal("100.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultRecoveryThreshold(
      DecimalConstants<Decimal>::createDecimal("0.05"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultCashAnnualYield(
      DecimalConstants<Decimal>::createDecimal("0.03"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultOverboughtLevel(
      DecimalConstants<Decimal>::createDecimal("70.0"));

  template <class Decimal> Decimal
    DecimalConstants<Decimal>::DefaultOversoldLevel(
      DecimalConstants<Decimal>::createDecimal("30.0"));
}

#endif
