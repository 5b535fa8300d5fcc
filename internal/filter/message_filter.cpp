#include "message_filter.hpp"

#include "internal/observability/logging.hpp"

namespace tgstats::filter {

namespace {

bool InRange(const model::Message& message, const FilterSpec& spec) {
  const auto date = util::ParseMessageDate(message.date);
  if (spec.start && date < *spec.start) {
    return false;
  }
  if (spec.end && date > *spec.end) {
    return false;
  }
  return true;
}

} // namespace

std::vector<model::Message> FilterMessages(const std::vector<model::Message>& messages, const FilterSpec& spec) {
  std::vector<model::Message> result;

  for (const auto& message : messages) {
    if (spec.sender && message.from != *spec.sender) {
      continue;
    }
    if (spec.HasDateRange() && !InRange(message, spec)) {
      continue;
    }
    result.push_back(message);
  }

  if (result.empty() && !messages.empty()) {
    TGSTATS_LOG_WARN("No message matched the filters", {observability::StringField("sender", spec.sender.value_or("")),
                                                        observability::BoolField("date_range", spec.HasDateRange())});
  }

  TGSTATS_LOG_DEBUG("Filtered messages", {observability::IntField("input", static_cast<std::int64_t>(messages.size())),
                                          observability::IntField("kept", static_cast<std::int64_t>(result.size()))});
  return result;
}

FilterSpec MakeFilterSpec(const std::optional<std::string>& sender, const std::optional<std::string>& start_date,
                          const std::optional<std::string>& end_date) {
  FilterSpec spec;
  spec.sender = sender;
  if (start_date) {
    spec.start = util::ParseCalendarDate(*start_date);
  }
  if (end_date) {
    spec.end = util::ParseCalendarDate(*end_date);
  }

  TGSTATS_LOG_DEBUG("Message filter", {observability::StringField("sender", sender.value_or("")),
                                       observability::StringField("start", spec.start ? util::FormatUtc(*spec.start) : ""),
                                       observability::StringField("end", spec.end ? util::FormatUtc(*spec.end) : "")});
  return spec;
}

} // namespace tgstats::filter
