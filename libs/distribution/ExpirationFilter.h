// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __EXPIRATION_FILTER_H
#define __EXPIRATION_FILTER_H 1

#include <deque>
#include <map>
#include <optional>
#include <vector>
#include "PriceSeries.h"
#include "DistributionDayRecord.h"
#include "DistributionDayConfiguration.h"

namespace mkc_markethealth
{
  /**
   * @brief Ages distribution days out of the active count.
   *
   * A record expires for one of two reasons, whichever happens first:
   *
   *  - TIME: its session window (record session through as-of session,
   *    both inclusive) exceeds the configured number of sessions. With the
   *    default of 25, a distribution day counts for itself plus the next 24
   *    sessions and expires on the 25th session after it.
   *
   *  - PRICE_RECOVERY: a later close, on or before the as-of date, reaches
   *    (1 + recoveryThreshold) times the record's close.
   *
   * When both land on the same session the reason is PRICE_RECOVERY.
   *
   * The evaluation is a single forward sweep over sessions. Pending records are
   * kept in a multimap ordered by recovery price, so every close retires all
   * recovered records from the front of the map, and in a FIFO queue ordered by
   * session, so time expiry pops from the front. Each record enters and leaves
   * each structure once.
   */
  template <class Decimal>
  class ExpirationFilter
  {
    using RecordVector = std::vector<DistributionDayRecord<Decimal>>;
    using RecoveryMap = std::multimap<Decimal, std::size_t>;

  public:
    explicit ExpirationFilter (const DistributionDayConfiguration<Decimal>& config =
			       DistributionDayConfiguration<Decimal>())
      : mConfig(config)
    {}

    const DistributionDayConfiguration<Decimal>& getConfiguration() const
    {
      return mConfig;
    }

    // Evaluate against the last session of the series
    void apply (RecordVector& records, const PriceSeries<Decimal>& series) const
    {
      apply(records, series, series.getLastDate());
    }

    /**
     * @brief Sets the expiration state of every record as of a date.
     *
     * Previous expiration state is discarded first, so the call can be repeated
     * with different as-of dates. Records dated after asOf are left active;
     * aggregation ignores them.
     *
     * @throws ConfigurationException if asOf precedes the series.
     * @throws DegenerateInputException if records are not in session order.
     */
    void apply (RecordVector& records,
		const PriceSeries<Decimal>& series,
		const TimeSeriesDate& asOf) const
    {
      for (auto& record : records)
	record.reinstate();

      if (records.empty())
	return;

      for (std::size_t i = 1; i < records.size(); ++i)
	if (!(records[i - 1].getSessionIndex() < records[i].getSessionIndex()))
	  throw DegenerateInputException("ExpirationFilter: distribution day records are not in session order");

      const unsigned long asOfSession = series.getAsOfSessionIndex(asOf);
      const unsigned long lastBarSession = series.getNumEntries() - 1;
      const unsigned long expirationSessions = mConfig.getExpirationSessions();
      const Decimal recoveryMultiplier = DecimalConstants<Decimal>::DecimalOne + mConfig.getRecoveryThreshold();

      RecoveryMap pendingRecovery;
      std::vector<std::optional<typename RecoveryMap::iterator>> recoveryPositions(records.size());
      std::deque<std::size_t> pendingTime;
      std::size_t nextRecord = 0;

      for (unsigned long session = records.front().getSessionIndex(); session <= asOfSession; ++session)
	{
	  std::optional<TimeSeriesDate> sessionDate;
	  if (session <= lastBarSession)
	    {
	      const PriceBar<Decimal>& bar = series.getEntry(session);
	      sessionDate = bar.getDate();

	      auto recovered = pendingRecovery.upper_bound(bar.getCloseValue());
	      for (auto it = pendingRecovery.begin(); it != recovered; ++it)
		{
		  records[it->second].expire(ExpirationReason::PRICE_RECOVERY, sessionDate);
		  recoveryPositions[it->second].reset();
		}
	      pendingRecovery.erase(pendingRecovery.begin(), recovered);
	    }

	  while (!pendingTime.empty() &&
		 records[pendingTime.front()].getSessionIndex() + expirationSessions <= session)
	    {
	      const std::size_t pos = pendingTime.front();
	      pendingTime.pop_front();

	      if (records[pos].isExpired())
		continue;

	      records[pos].expire(ExpirationReason::TIME, sessionDate);
	      if (recoveryPositions[pos])
		{
		  pendingRecovery.erase(*recoveryPositions[pos]);
		  recoveryPositions[pos].reset();
		}
	    }

	  // A record only competes against sessions strictly after its own
	  while (nextRecord < records.size() && records[nextRecord].getSessionIndex() == session)
	    {
	      if (session <= lastBarSession)
		recoveryPositions[nextRecord] =
		  pendingRecovery.emplace(records[nextRecord].getCloseValue() * recoveryMultiplier, nextRecord);

	      pendingTime.push_back(nextRecord);
	      ++nextRecord;
	    }

	  if (nextRecord == records.size() && pendingTime.empty())
	    break;
	}
    }

  private:
    DistributionDayConfiguration<Decimal> mConfig;
  };

  // Records that still count toward market pressure as of a date
  template <class Decimal>
  std::vector<DistributionDayRecord<Decimal>>
  activeDistributionDays (const std::vector<DistributionDayRecord<Decimal>>& records,
			  const TimeSeriesDate& asOf)
  {
    std::vector<DistributionDayRecord<Decimal>> active;
    for (const auto& record : records)
      if (!record.isExpired() && record.getDate() <= asOf)
	active.push_back(record);

    return active;
  }
}

#endif
