#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/archive.hpp"
#include "internal/util/time.hpp"

namespace tgstats::filter {

/*
  Active predicates are combined with AND. An empty spec keeps every message.
*/
struct FilterSpec {
  std::optional<std::string>     sender;
  std::optional<util::TimePoint> start;
  std::optional<util::TimePoint> end;

  bool HasDateRange() const {
    return start.has_value() || end.has_value();
  }
};

/*
  Returns the messages matching spec, in input order. The input is never
  modified. Throws util::UnparseableDate when a date range is active and a
  message that passed the sender check carries an unparseable date.
*/
std::vector<model::Message> FilterMessages(const std::vector<model::Message>& messages, const FilterSpec& spec);

/*
  Builds a spec from raw command line values, validating the calendar dates
  (day/month/year) up front. Throws util::InvalidArgument.
*/
FilterSpec MakeFilterSpec(const std::optional<std::string>& sender, const std::optional<std::string>& start_date,
                          const std::optional<std::string>& end_date);

} // namespace tgstats::filter
