// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
#ifndef __BOOST_DATE_HELPER_H
#define __BOOST_DATE_HELPER_H 1

#include <boost/date_time.hpp>

namespace mkc_markethealth
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::gregorian::date_duration;

  inline bool isWeekend (const TimeSeriesDate& aDate)
  {
    return (aDate.day_of_week() == boost::date_time::Saturday ||
	    aDate.day_of_week() == boost::date_time::Sunday);
  }

  inline bool isWeekday (const TimeSeriesDate& aDate)
  {
    return !isWeekend(aDate);
  }

  inline TimeSeriesDate boost_next_weekday(const TimeSeriesDate& d)
  {
    int dow = d.day_of_week().as_number();

    date_duration offset;
    if (dow == 5)      // Friday → advance 3 days to Monday
      offset = date_duration(3);
    else if (dow == 6)      // Saturday → advance 2 days to Monday
      offset = date_duration(2);
    else
      offset = date_duration(1);

    return d + offset;
  }

  /**
   * @brief Number of weekdays in the half open interval (fromDate, toDate].
   *
   * Used to estimate trading sessions past the end of a series. Exchange
   * holidays are not known here, so every weekday counts as one session.
   *
   * @return 0 when toDate <= fromDate.
   */
  inline unsigned long weekdaysAfter (const TimeSeriesDate& fromDate,
				      const TimeSeriesDate& toDate)
  {
    if (toDate <= fromDate)
      return 0;

    const long totalDays = (toDate - fromDate).days();
    const long fullWeeks = totalDays / 7;
    unsigned long count = static_cast<unsigned long>(fullWeeks * 5);

    TimeSeriesDate d = fromDate + date_duration(fullWeeks * 7);
    while (d < toDate)
      {
	d = d + date_duration(1);
	if (isWeekday (d))
	  ++count;
      }

    return count;
  }

  inline int yearMonthKey (const TimeSeriesDate& aDate)
  {
    return static_cast<int>(aDate.year()) * 12 + static_cast<int>(aDate.month().as_number()) - 1;
  }

  inline TimeSeriesDate last_of_month (const TimeSeriesDate& aDate)
  {
    return aDate.end_of_month();
  }
}

#endif
