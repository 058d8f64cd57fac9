#include <fstream>
#include <stdexcept>
#include "TestUtils.h"
#include "DecimalConstants.h"

using namespace boost::gregorian;
using namespace mkc_markethealth;

date createDate (const std::string& dateString)
{
  return from_undelimited_string(dateString);
}

DecimalType createDecimal (const std::string& valueString)
{
  return dec::fromString<DecimalType>(valueString);
}

PriceBar<DecimalType>
createPriceBar (const std::string& dateString,
		const std::string& closePrice,
		VolumeType volume)
{
  return PriceBar<DecimalType>(createDate(dateString), createDecimal(closePrice), volume);
}

std::vector<date>
consecutiveWeekdays (const date& start, std::size_t count)
{
  std::vector<date> dates;
  dates.reserve(count);

  date d = isWeekday(start) ? start : boost_next_weekday(start);
  for (std::size_t i = 0; i < count; ++i)
    {
      dates.push_back(d);
      d = boost_next_weekday(d);
    }

  return dates;
}

std::shared_ptr<SeriesType>
createDailySeries (const std::string& symbol,
		   const date& start,
		   const std::vector<double>& closes,
		   const std::vector<VolumeType>& volumes)
{
  if (closes.size() != volumes.size())
    throw std::invalid_argument("createDailySeries: closes and volumes differ in size");

  const std::vector<date> dates = consecutiveWeekdays(start, closes.size());
  std::vector<PriceBar<DecimalType>> bars;
  bars.reserve(closes.size());
  for (std::size_t i = 0; i < closes.size(); ++i)
    bars.emplace_back(dates[i], DecimalType(closes[i]), volumes[i]);

  return std::make_shared<SeriesType>(symbol, std::move(bars));
}

std::shared_ptr<SeriesType>
createDailySeries (const std::string& symbol,
		   const date& start,
		   const std::vector<double>& closes)
{
  return createDailySeries(symbol, start, closes, std::vector<VolumeType>(closes.size(), 1000000));
}

std::shared_ptr<SeriesType>
createMonthlySeries (const std::string& symbol,
		     int startYear,
		     int startMonth,
		     const std::vector<double>& monthEndPrices)
{
  std::vector<PriceBar<DecimalType>> bars;
  bars.reserve(monthEndPrices.size());

  date monthStart(static_cast<unsigned short>(startYear), static_cast<unsigned short>(startMonth), 1);
  for (double price : monthEndPrices)
    {
      date d = monthStart.end_of_month();
      while (isWeekend(d))
	d = d - date_duration(1);

      bars.emplace_back(d, DecimalType(price), 1000000);
      monthStart = monthStart + months(1);
    }

  return std::make_shared<SeriesType>(symbol, std::move(bars));
}

TemporaryFile::TemporaryFile (const std::string& contents, const std::string& extension)
  : mPath(boost::filesystem::temp_directory_path() /
	  boost::filesystem::unique_path("markethealth-%%%%-%%%%-%%%%" + extension))
{
  std::ofstream out(mPath.string());
  if (!out)
    throw std::runtime_error("TemporaryFile: cannot create " + mPath.string());

  out << contents;
}

TemporaryFile::~TemporaryFile()
{
  boost::system::error_code ec;
  boost::filesystem::remove(mPath, ec);
}
