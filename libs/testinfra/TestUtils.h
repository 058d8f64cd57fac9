#pragma once

#include <memory>
#include <string>
#include <vector>
#include <boost/date_time.hpp>
#include <boost/filesystem.hpp>
#include "number.h"
#include "BoostDateHelper.h"
#include "PriceBar.h"
#include "PriceSeries.h"

typedef num::DefaultNumber DecimalType;
typedef mkc_markethealth::PriceSeries<DecimalType> SeriesType;

boost::gregorian::date createDate (const std::string& dateString);

DecimalType createDecimal (const std::string& valueString);

mkc_markethealth::PriceBar<DecimalType>
createPriceBar (const std::string& dateString,
		const std::string& closePrice,
		mkc_markethealth::VolumeType volume);

// count weekdays starting at (or after) start
std::vector<boost::gregorian::date>
consecutiveWeekdays (const boost::gregorian::date& start, std::size_t count);

// One bar per weekday beginning at start. closes and volumes must have equal size.
std::shared_ptr<SeriesType>
createDailySeries (const std::string& symbol,
		   const boost::gregorian::date& start,
		   const std::vector<double>& closes,
		   const std::vector<mkc_markethealth::VolumeType>& volumes);

// Daily series with constant volume
std::shared_ptr<SeriesType>
createDailySeries (const std::string& symbol,
		   const boost::gregorian::date& start,
		   const std::vector<double>& closes);

// One bar per month, dated on the last weekday of each month
std::shared_ptr<SeriesType>
createMonthlySeries (const std::string& symbol,
		     int startYear,
		     int startMonth,
		     const std::vector<double>& monthEndPrices);

// Writes contents to a uniquely named file under the temp directory and
// removes it on destruction.
class TemporaryFile
{
public:
  TemporaryFile (const std::string& contents, const std::string& extension = ".csv");
  ~TemporaryFile();

  TemporaryFile (const TemporaryFile&) = delete;
  TemporaryFile& operator= (const TemporaryFile&) = delete;

  std::string getFileName() const { return mPath.string(); }

private:
  boost::filesystem::path mPath;
};
