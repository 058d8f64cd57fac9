// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include <limits>
#include <optional>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include "csv.h"
#include "AnalysisConfigurationFileReader.h"

using Decimal = num::DefaultNumber;

namespace mkc_markethealth
{
  namespace
  {
    // Working copy of every parameter while overrides are applied. The typed
    // configuration objects are only built at the end, so cross-field checks
    // such as moderate <= high see the final values.
    struct ParameterValues
    {
      Decimal minimumDecline;
      std::optional<Decimal> weightedChangeThreshold;
      unsigned int expirationSessions;
      Decimal recoveryThreshold;

      unsigned int moderateCount;
      unsigned int highCount;
      unsigned int recentHighCount;
      unsigned int recentWindowSessions;
      std::optional<unsigned int> recentModerateCount;
      std::optional<Decimal> moderateWeightedChange;
      std::optional<Decimal> highWeightedChange;

      unsigned int shortMAPeriod;
      unsigned int longMAPeriod;
      unsigned int rsiPeriod;
      Decimal overboughtLevel;
      Decimal oversoldLevel;

      unsigned int smaLookbackMonths;
      Decimal cashAnnualYield;
      CashRateConversion cashRateConversion;
      Decimal initialCapital;
    };

    ParameterValues extractValues (const AnalysisConfiguration& config)
    {
      const auto& days = config.getDistributionDayConfiguration();
      const auto& thresholds = config.getMarketConditionThresholds();
      const auto& technicals = config.getTechnicalIndicatorConfiguration();
      const auto& trendGuard = config.getTrendGuardConfiguration();

      return ParameterValues{ days.getMinimumDecline(),
			      days.getWeightedChangeThreshold(),
			      days.getExpirationSessions(),
			      days.getRecoveryThreshold(),
			      thresholds.getModerateCount(),
			      thresholds.getHighCount(),
			      thresholds.getRecentHighCount(),
			      thresholds.getRecentWindowSessions(),
			      thresholds.getRecentModerateCount(),
			      thresholds.getModerateWeightedChange(),
			      thresholds.getHighWeightedChange(),
			      technicals.getShortMAPeriod(),
			      technicals.getLongMAPeriod(),
			      technicals.getRsiPeriod(),
			      technicals.getOverboughtLevel(),
			      technicals.getOversoldLevel(),
			      trendGuard.getSmaLookbackMonths(),
			      trendGuard.getCashAnnualYield(),
			      trendGuard.getCashRateConversion(),
			      trendGuard.getInitialCapital() };
    }

    AnalysisConfiguration buildConfiguration (const ParameterValues& v)
    {
      DistributionDayConfiguration<Decimal> days(v.minimumDecline, v.weightedChangeThreshold,
						 v.expirationSessions, v.recoveryThreshold);

      MarketConditionThresholds<Decimal> thresholds(v.moderateCount, v.highCount,
						    v.recentHighCount, v.recentWindowSessions);
      thresholds.setRecentModerateCount(v.recentModerateCount);
      thresholds.setWeightedChangeThresholds(v.moderateWeightedChange, v.highWeightedChange);

      TechnicalIndicatorConfiguration<Decimal> technicals(v.shortMAPeriod, v.longMAPeriod, v.rsiPeriod,
							  v.overboughtLevel, v.oversoldLevel);

      TrendGuardConfiguration<Decimal> trendGuard(v.smaLookbackMonths, v.cashAnnualYield,
						  v.cashRateConversion, v.initialCapital);

      return AnalysisConfiguration(days, thresholds, technicals, trendGuard);
    }

    // Plain fixed point notation only: dec::fromString stops at an exponent
    bool isFixedPointNumber (const std::string& value)
    {
      std::string::size_type pos = 0;
      if (pos < value.size() && value[pos] == '-')
	++pos;

      bool seenDigit = false;
      bool seenPoint = false;
      for (; pos < value.size(); ++pos)
	{
	  const char c = value[pos];
	  if (c >= '0' && c <= '9')
	    seenDigit = true;
	  else if (c == '.' && !seenPoint)
	    seenPoint = true;
	  else
	    return false;
	}

      return seenDigit;
    }

    Decimal parseDecimal (const std::string& name, const std::string& value)
    {
      if (!isFixedPointNumber(value))
	throw ConfigurationException("AnalysisConfigurationFileReader: parameter " + name +
				     " expects a number, got '" + value + "'");

      return num::fromString<Decimal>(value);
    }

    std::optional<Decimal> parseOptionalDecimal (const std::string& name, const std::string& value)
    {
      if (value.empty() || boost::algorithm::iequals(value, "none"))
	return std::nullopt;

      return parseDecimal(name, value);
    }

    unsigned int parseCount (const std::string& name, const std::string& value)
    {
      std::size_t consumed = 0;
      unsigned long parsed = 0;
      try
	{
	  parsed = std::stoul(value, &consumed);
	}
      catch (const std::logic_error&)
	{
	  consumed = 0;
	}

      if (consumed == 0 || consumed != value.size() || value[0] == '-')
	throw ConfigurationException("AnalysisConfigurationFileReader: parameter " + name +
				     " expects a non-negative integer, got '" + value + "'");

      if (parsed > std::numeric_limits<unsigned int>::max())
	throw ConfigurationException("AnalysisConfigurationFileReader: parameter " + name +
				     " is out of range, got '" + value + "'");

      return static_cast<unsigned int>(parsed);
    }

    std::optional<unsigned int> parseOptionalCount (const std::string& name, const std::string& value)
    {
      if (value.empty() || boost::algorithm::iequals(value, "none"))
	return std::nullopt;

      return parseCount(name, value);
    }

    CashRateConversion parseConversion (const std::string& value)
    {
      if (boost::algorithm::iequals(value, "simple"))
	return CashRateConversion::SIMPLE;

      if (boost::algorithm::iequals(value, "compound"))
	return CashRateConversion::COMPOUND;

      throw ConfigurationException("AnalysisConfigurationFileReader: cash_rate_conversion must be SIMPLE or COMPOUND, got '" +
				   value + "'");
    }

    void applyParameter (ParameterValues& v, const std::string& name, const std::string& value)
    {
      if (name == "minimum_decline")
	v.minimumDecline = parseDecimal(name, value);
      else if (name == "weighted_change_threshold")
	v.weightedChangeThreshold = parseOptionalDecimal(name, value);
      else if (name == "expiration_sessions")
	v.expirationSessions = parseCount(name, value);
      else if (name == "recovery_threshold")
	v.recoveryThreshold = parseDecimal(name, value);
      else if (name == "moderate_count")
	v.moderateCount = parseCount(name, value);
      else if (name == "high_count")
	v.highCount = parseCount(name, value);
      else if (name == "recent_high_count")
	v.recentHighCount = parseCount(name, value);
      else if (name == "recent_window_sessions")
	v.recentWindowSessions = parseCount(name, value);
      else if (name == "recent_moderate_count")
	v.recentModerateCount = parseOptionalCount(name, value);
      else if (name == "moderate_weighted_change")
	v.moderateWeightedChange = parseOptionalDecimal(name, value);
      else if (name == "high_weighted_change")
	v.highWeightedChange = parseOptionalDecimal(name, value);
      else if (name == "short_ma_period")
	v.shortMAPeriod = parseCount(name, value);
      else if (name == "long_ma_period")
	v.longMAPeriod = parseCount(name, value);
      else if (name == "rsi_period")
	v.rsiPeriod = parseCount(name, value);
      else if (name == "overbought_level")
	v.overboughtLevel = parseDecimal(name, value);
      else if (name == "oversold_level")
	v.oversoldLevel = parseDecimal(name, value);
      else if (name == "sma_lookback_months")
	v.smaLookbackMonths = parseCount(name, value);
      else if (name == "cash_annual_yield")
	v.cashAnnualYield = parseDecimal(name, value);
      else if (name == "cash_rate_conversion")
	v.cashRateConversion = parseConversion(value);
      else if (name == "initial_capital")
	v.initialCapital = parseDecimal(name, value);
      else
	throw ConfigurationException("AnalysisConfigurationFileReader: unknown parameter '" + name + "'");
    }
  }

  AnalysisConfiguration::AnalysisConfiguration()
    : mDistributionDays(),
      mThresholds(),
      mTechnicals(),
      mTrendGuard()
  {}

  AnalysisConfiguration::AnalysisConfiguration (const DistributionDayConfiguration<Decimal>& distributionDays,
						const MarketConditionThresholds<Decimal>& thresholds,
						const TechnicalIndicatorConfiguration<Decimal>& technicals,
						const TrendGuardConfiguration<Decimal>& trendGuard)
    : mDistributionDays(distributionDays),
      mThresholds(thresholds),
      mTechnicals(technicals),
      mTrendGuard(trendGuard)
  {}

  AnalysisConfigurationFileReader::AnalysisConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {
    if (!boost::filesystem::exists(boost::filesystem::path(mConfigurationFileName)))
      throw ConfigurationException("AnalysisConfigurationFileReader: configuration file " +
				   mConfigurationFileName + " does not exist");
  }

  AnalysisConfiguration AnalysisConfigurationFileReader::readConfigurationFile() const
  {
    ParameterList parameters;

    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>,
		      io::throw_on_overflow, io::single_and_empty_line_comment<'#'>>
	  csvConfigFile(mConfigurationFileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column, "Parameter", "Value");

	std::string name, value;
	while (csvConfigFile.read_row(name, value))
	  {
	    if (name.empty())
	      continue;

	    parameters.emplace_back(name, value);
	  }
      }
    catch (const io::error::base& e)
      {
	throw ConfigurationException("AnalysisConfigurationFileReader: cannot parse " +
				     mConfigurationFileName + ": " + e.what());
      }

    return applyParameters(parameters);
  }

  AnalysisConfiguration AnalysisConfigurationFileReader::applyParameters (const ParameterList& parameters,
									  const AnalysisConfiguration& base)
  {
    ParameterValues values = extractValues(base);

    for (const auto& parameter : parameters)
      {
	std::string name = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(parameter.first));
	std::string value = boost::algorithm::trim_copy(parameter.second);
	applyParameter(values, name, value);
      }

    return buildConfiguration(values);
  }

  std::pair<std::string, std::string> AnalysisConfigurationFileReader::parseAssignment (const std::string& assignment)
  {
    const std::string::size_type pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0)
      throw ConfigurationException("AnalysisConfigurationFileReader: expected name=value, got '" + assignment + "'");

    return std::make_pair(boost::algorithm::trim_copy(assignment.substr(0, pos)),
			  boost::algorithm::trim_copy(assignment.substr(pos + 1)));
  }

  const std::vector<std::string>& AnalysisConfigurationFileReader::getKnownParameters()
  {
    static const std::vector<std::string> known = {
      "minimum_decline", "weighted_change_threshold", "expiration_sessions", "recovery_threshold",
      "moderate_count", "high_count", "recent_high_count", "recent_window_sessions",
      "recent_moderate_count", "moderate_weighted_change", "high_weighted_change",
      "short_ma_period", "long_ma_period", "rsi_period", "overbought_level", "oversold_level",
      "sma_lookback_months", "cash_annual_yield", "cash_rate_conversion", "initial_capital"
    };

    return known;
  }
}
