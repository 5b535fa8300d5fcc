#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <absl/time/time.h>

namespace tgstats::util {

/*
  Time utilities.

  Instants are carried as std::chrono::system_clock time points; absl::time
  handles the parsing and the IANA timezone database lookups.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// "YYYY-MM-DDTHH:MM:SS" read as UTC. Throws UnparseableDate.
TimePoint ParseMessageDate(std::string_view date);

// "day/month/year", midnight UTC of that day. Throws InvalidArgument.
TimePoint ParseCalendarDate(std::string_view date);

// Throws InvalidArgument for names missing from the zone database.
absl::TimeZone LoadZone(const std::string& name);

// Hour of day (0-23) of tp in the civil time of zone.
int CivilHour(TimePoint tp, const absl::TimeZone& zone);

std::string FormatUtc(TimePoint tp);

} // namespace tgstats::util
