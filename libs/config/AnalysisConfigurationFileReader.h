// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __ANALYSIS_CONFIGURATION_FILE_READER_H
#define __ANALYSIS_CONFIGURATION_FILE_READER_H 1

#include <string>
#include <utility>
#include <vector>
#include "number.h"
#include "DistributionDayConfiguration.h"
#include "TrendGuardConfiguration.h"

namespace mkc_markethealth
{
  //
  // class AnalysisConfiguration
  //
  // Every tunable parameter of both pipelines, at production precision.
  //
  class AnalysisConfiguration
  {
  public:
    using Decimal = num::DefaultNumber;

    AnalysisConfiguration();
    AnalysisConfiguration (const DistributionDayConfiguration<Decimal>& distributionDays,
			   const MarketConditionThresholds<Decimal>& thresholds,
			   const TechnicalIndicatorConfiguration<Decimal>& technicals,
			   const TrendGuardConfiguration<Decimal>& trendGuard);

    const DistributionDayConfiguration<Decimal>& getDistributionDayConfiguration() const
    {
      return mDistributionDays;
    }

    const MarketConditionThresholds<Decimal>& getMarketConditionThresholds() const
    {
      return mThresholds;
    }

    const TechnicalIndicatorConfiguration<Decimal>& getTechnicalIndicatorConfiguration() const
    {
      return mTechnicals;
    }

    const TrendGuardConfiguration<Decimal>& getTrendGuardConfiguration() const
    {
      return mTrendGuard;
    }

  private:
    DistributionDayConfiguration<Decimal> mDistributionDays;
    MarketConditionThresholds<Decimal> mThresholds;
    TechnicalIndicatorConfiguration<Decimal> mTechnicals;
    TrendGuardConfiguration<Decimal> mTrendGuard;
  };

  typedef std::vector<std::pair<std::string, std::string>> ParameterList;

  /**
   * @brief Reads a two column "Parameter,Value" CSV file.
   *
   * Parameter names are case insensitive and surrounding blanks are ignored.
   * An empty value clears an optional threshold. Omitted parameters keep
   * their defaults. Unknown names and malformed values throw
   * ConfigurationException, as do values the configuration classes reject.
   */
  class AnalysisConfigurationFileReader
  {
  public:
    explicit AnalysisConfigurationFileReader (const std::string& configurationFileName);

    AnalysisConfiguration readConfigurationFile() const;

    const std::string& getFileName() const
    {
      return mConfigurationFileName;
    }

    // Applies name/value pairs on top of base. Used for both the file and
    // the command line overrides.
    static AnalysisConfiguration applyParameters (const ParameterList& parameters,
						  const AnalysisConfiguration& base = AnalysisConfiguration());

    // "name=value" -> (name, value)
    static std::pair<std::string, std::string> parseAssignment (const std::string& assignment);

    static const std::vector<std::string>& getKnownParameters();

  private:
    std::string mConfigurationFileName;
  };
}

#endif
