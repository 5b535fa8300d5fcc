#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/archive.hpp"

namespace tgstats::analysis {

constexpr int kHoursPerDay = 24;

struct HourActivityOptions {
  // IANA name, e.g. "Europe/Paris". Unset means UTC.
  std::optional<std::string> timezone;
  std::int64_t               scale = 1;
};

struct HourHistogram {
  std::array<std::uint64_t, kHoursPerDay> counts{};
  std::uint64_t                           total = 0;

  // round(counts[i] / total * 100) * scale
  std::array<std::int64_t, kHoursPerDay> percentages{};
};

/*
  Buckets messages by civil hour.

  Throws:
    util::InvalidArgument     unknown timezone, negative scale or a scale
                              too large for 100 * scale to fit in int64
    util::UnparseableDate     a message date cannot be read
    util::NoMatchingMessages  messages is empty
*/
HourHistogram ComputeHourActivity(const std::vector<model::Message>& messages, const HourActivityOptions& options);

} // namespace tgstats::analysis
