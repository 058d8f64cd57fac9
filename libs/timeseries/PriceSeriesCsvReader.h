// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PRICE_SERIES_CSV_READER_H
#define __PRICE_SERIES_CSV_READER_H 1

#include <cmath>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/filesystem.hpp>
#include "csv.h"
#include "PriceSeries.h"

namespace mkc_markethealth
{
  class PriceSeriesReaderException : public std::runtime_error
  {
  public:
    explicit PriceSeriesReaderException(const std::string& msg)
      : std::runtime_error(msg)
    {}
  };

  /**
   * @brief Parses a date column value. Accepts "YYYY-MM-DD" (optionally followed by
   * a time component, as written by most data vendors) and "YYYYMMDD".
   */
  inline TimeSeriesDate parseSeriesDate (const std::string& dateStamp)
  {
    std::string trimmed = boost::algorithm::trim_copy(dateStamp);
    if (trimmed.size() >= 10 && trimmed[4] == '-')
      return boost::gregorian::from_simple_string(trimmed.substr(0, 10));

    return boost::gregorian::from_undelimited_string(trimmed);
  }

  //
  // class PriceSeriesCsvReader
  //
  // Reads a daily price file whose header row contains at least the columns
  // Date, Close and Volume. Any other columns (Open, High, Low, Adj Close, ...)
  // are ignored. Rows whose close is empty or "null" are skipped with a warning.
  //

  template <class Decimal>
  class PriceSeriesCsvReader
  {
  public:
    PriceSeriesCsvReader (const std::string& fileName,
			  const std::string& symbol,
			  std::ostream* diagnostics = nullptr)
      : mFileName(fileName),
	mSymbol(symbol),
	mDiagnostics(diagnostics),
	mSkippedRows(0),
	mTimeSeries()
    {
      boost::filesystem::path dataPath (mFileName);
      if (!boost::filesystem::exists (dataPath))
	throw PriceSeriesReaderException("PriceSeriesCsvReader: data file " + mFileName + " does not exist");
    }

    PriceSeriesCsvReader (const PriceSeriesCsvReader& rhs) = default;
    ~PriceSeriesCsvReader() = default;

    const std::string& getFileName() const
    {
      return mFileName;
    }

    unsigned long getNumSkippedRows() const
    {
      return mSkippedRows;
    }

    void readFile()
    {
      io::CSVReader<3, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> csvFile (mFileName);
      csvFile.read_header(io::ignore_extra_column, "Date", "Close", "Volume");

      std::string dateStamp, closeString, volumeString;
      std::vector<PriceBar<Decimal>> bars;
      mSkippedRows = 0;

      while (csvFile.read_row(dateStamp, closeString, volumeString))
	{
	  if (isMissing (closeString))
	    {
	      ++mSkippedRows;
	      if (mDiagnostics)
		*mDiagnostics << "PriceSeriesCsvReader: skipping row dated " << dateStamp
			      << " in " << mFileName << " (no close)" << std::endl;
	      continue;
	    }

	  try
	    {
	      bars.emplace_back(parseSeriesDate(dateStamp),
				num::fromString<Decimal>(closeString),
				parseVolume(volumeString));
	    }
	  catch (const std::exception& e)
	    {
	      throw PriceSeriesReaderException("PriceSeriesCsvReader: malformed row dated '" + dateStamp +
					       "' in " + mFileName + ": " + e.what());
	    }
	}

      if (bars.empty())
	throw PriceSeriesReaderException("PriceSeriesCsvReader: no price rows found in " + mFileName);

      mTimeSeries = std::make_shared<PriceSeries<Decimal>>(mSymbol, std::move(bars));
    }

    std::shared_ptr<PriceSeries<Decimal>> getTimeSeries() const
    {
      if (!mTimeSeries)
	throw PriceSeriesReaderException("PriceSeriesCsvReader: readFile has not been called for " + mFileName);

      return mTimeSeries;
    }

  private:
    static bool isMissing (const std::string& value)
    {
      return value.empty() || boost::algorithm::iequals(value, "null") ||
	boost::algorithm::iequals(value, "nan");
    }

    static VolumeType parseVolume (const std::string& volumeString)
    {
      if (isMissing (volumeString))
	return 0;

      // Some vendors write volume as a floating point number
      const double volume = std::stod(volumeString);
      if (volume < 0.0)
	throw DegenerateInputException("negative volume " + volumeString);

      return static_cast<VolumeType>(std::llround(volume));
    }

  private:
    std::string mFileName;
    std::string mSymbol;
    std::ostream* mDiagnostics;
    unsigned long mSkippedRows;
    std::shared_ptr<PriceSeries<Decimal>> mTimeSeries;
  };
}

#endif
