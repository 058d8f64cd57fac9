// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __TREND_GUARD_CONFIGURATION_H
#define __TREND_GUARD_CONFIGURATION_H 1

#include <cmath>
#include <string>
#include "DecimalConstants.h"
#include "PriceSeriesException.h"
#include "number.h"

namespace mkc_markethealth
{
  // How the annual cash yield becomes a monthly rate
  enum class CashRateConversion { SIMPLE, COMPOUND };

  inline std::string toString (CashRateConversion conversion)
  {
    return (conversion == CashRateConversion::COMPOUND) ? "COMPOUND" : "SIMPLE";
  }

  /**
   * @brief Parameters of the monthly moving average timing strategy.
   *
   * Defaults: 12 month SMA, 3% annual cash yield converted as annual/12,
   * starting equity 1.0.
   */
  template <class Decimal>
  class TrendGuardConfiguration
  {
  public:
    static constexpr unsigned int DefaultSmaLookbackMonths = 12;

    TrendGuardConfiguration()
      : TrendGuardConfiguration(DefaultSmaLookbackMonths,
				DecimalConstants<Decimal>::DefaultCashAnnualYield,
				CashRateConversion::SIMPLE,
				DecimalConstants<Decimal>::DecimalOne)
    {}

    TrendGuardConfiguration (unsigned int smaLookbackMonths,
			     const Decimal& cashAnnualYield,
			     CashRateConversion conversion,
			     const Decimal& initialCapital)
      : mSmaLookbackMonths(smaLookbackMonths),
	mCashAnnualYield(cashAnnualYield),
	mConversion(conversion),
	mInitialCapital(initialCapital)
    {
      validate();
    }

    unsigned int getSmaLookbackMonths() const { return mSmaLookbackMonths; }
    const Decimal& getCashAnnualYield() const { return mCashAnnualYield; }
    CashRateConversion getCashRateConversion() const { return mConversion; }
    const Decimal& getInitialCapital() const { return mInitialCapital; }

    Decimal getCashMonthlyRate() const
    {
      if (mConversion == CashRateConversion::COMPOUND)
	return Decimal(std::pow(1.0 + num::to_double(mCashAnnualYield), 1.0 / 12.0) - 1.0);

      return mCashAnnualYield / DecimalConstants<Decimal>::DecimalTwelve;
    }

    void setSmaLookbackMonths (unsigned int months)
    {
      mSmaLookbackMonths = months;
      validate();
    }

    void setCashAnnualYield (const Decimal& yield)
    {
      mCashAnnualYield = yield;
      validate();
    }

    void setCashRateConversion (CashRateConversion conversion)
    {
      mConversion = conversion;
    }

    void setInitialCapital (const Decimal& capital)
    {
      mInitialCapital = capital;
      validate();
    }

  private:
    void validate() const
    {
      if (mSmaLookbackMonths < 1)
	throw ConfigurationException("TrendGuardConfiguration: SMA lookback must be at least one month");

      if (mCashAnnualYield <= DecimalConstants<Decimal>::DecimalMinusOne)
	throw ConfigurationException("TrendGuardConfiguration: cash yield must be above -100%");

      if (mInitialCapital <= DecimalConstants<Decimal>::DecimalZero)
	throw ConfigurationException("TrendGuardConfiguration: initial capital must be positive");
    }

  private:
    unsigned int mSmaLookbackMonths;
    Decimal mCashAnnualYield;
    CashRateConversion mConversion;
    Decimal mInitialCapital;
  };
}

#endif
