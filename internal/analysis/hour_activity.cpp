#include "hour_activity.hpp"

#include <cmath>
#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tgstats::analysis {

namespace {

constexpr std::int64_t kMaxScale = std::numeric_limits<std::int64_t>::max() / 100;

} // namespace

HourHistogram ComputeHourActivity(const std::vector<model::Message>& messages, const HourActivityOptions& options) {
  if (options.scale < 0) {
    throw util::InvalidArgument("scale must not be negative, got " + std::to_string(options.scale));
  }
  // A full bar is 100 * scale markers and must fit in the percentage type.
  if (options.scale > kMaxScale) {
    throw util::InvalidArgument("scale " + std::to_string(options.scale) + " is too large, maximum is " + std::to_string(kMaxScale));
  }

  const auto zone = options.timezone ? util::LoadZone(*options.timezone) : absl::UTCTimeZone();

  HourHistogram histogram;
  for (const auto& message : messages) {
    const auto date = util::ParseMessageDate(message.date);
    const int  hour = util::CivilHour(date, zone);

    ++histogram.counts[hour];
    ++histogram.total;
  }

  if (histogram.total == 0) {
    throw util::NoMatchingMessages("no messages matched the filters, cannot compute hourly percentages");
  }

  const double total = static_cast<double>(histogram.total);
  for (int i = 0; i < kHoursPerDay; ++i) {
    // std::llround rounds halves away from zero.
    const auto percent       = std::llround(static_cast<double>(histogram.counts[i]) / total * 100.0);
    histogram.percentages[i] = static_cast<std::int64_t>(percent) * options.scale;
  }

  TGSTATS_LOG_DEBUG("Computed hour activity", {observability::IntField("messages", static_cast<std::int64_t>(histogram.total)),
                                               observability::StringField("timezone", zone.name())});
  return histogram;
}

} // namespace tgstats::analysis
