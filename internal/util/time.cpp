#include "time.hpp"

#include <absl/time/civil_time.h>

#include <charconv>
#include <limits>
#include <vector>

#include "internal/util/errors.hpp"

namespace tgstats::util {

namespace {

constexpr char kMessageDateFormat[] = "%Y-%m-%dT%H:%M:%S";

bool ParseInt(std::string_view text, long long* value) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end   = text.data() + text.size();
  if (*begin == '+') {
    ++begin;
  }
  auto [ptr, ec] = std::from_chars(begin, end, *value);
  return ec == std::errc() && ptr == end && *value >= std::numeric_limits<int>::min() &&
         *value <= std::numeric_limits<int>::max();
}

} // namespace

TimePoint ParseMessageDate(std::string_view date) {
  const std::string input(date);

  absl::Time  parsed;
  std::string err;
  if (!absl::ParseTime(kMessageDateFormat, input, absl::UTCTimeZone(), &parsed, &err)) {
    throw UnparseableDate("unparseable message date '" + input + "': " + err);
  }
  return absl::ToChronoTime(parsed);
}

TimePoint ParseCalendarDate(std::string_view date) {
  std::vector<long long> components;
  std::size_t            start = 0;
  while (true) {
    const auto slash = date.find('/', start);
    const auto part  = date.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);

    long long value = 0;
    if (!ParseInt(part, &value)) {
      throw InvalidArgument("invalid date '" + std::string(date) + "': expected day/month/year");
    }
    components.push_back(value);

    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }

  if (components.size() != 3) {
    throw InvalidArgument("invalid date '" + std::string(date) + "': expected day/month/year");
  }

  // CivilDay normalizes out of range fields, 32/01 rolls into February.
  const absl::CivilDay day(components[2], static_cast<int>(components[1]), static_cast<int>(components[0]));
  return absl::ToChronoTime(absl::FromCivil(day, absl::UTCTimeZone()));
}

absl::TimeZone LoadZone(const std::string& name) {
  absl::TimeZone zone;
  if (!absl::LoadTimeZone(name, &zone)) {
    throw InvalidArgument("invalid timezone code: " + name);
  }
  return zone;
}

int CivilHour(TimePoint tp, const absl::TimeZone& zone) {
  return absl::ToCivilHour(absl::FromChrono(tp), zone).hour();
}

std::string FormatUtc(TimePoint tp) {
  return absl::FormatTime(kMessageDateFormat, absl::FromChrono(tp), absl::UTCTimeZone());
}

} // namespace tgstats::util
