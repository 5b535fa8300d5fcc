#include "internal/analysis/hour_activity.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using tgstats::analysis::ComputeHourActivity;
using tgstats::analysis::HourActivityOptions;
using tgstats::analysis::kHoursPerDay;
using tgstats::model::Message;

Message AtDate(const std::string& date) {
  Message message;
  message.from = "Alice";
  message.date = date;
  return message;
}

void TestTwoMessagesSplitEvenly() {
  const auto histogram = ComputeHourActivity({AtDate("2023-03-01T02:00:00"), AtDate("2023-03-01T14:00:00")}, HourActivityOptions{});

  assert(histogram.total == 2);
  assert(histogram.counts[2] == 1);
  assert(histogram.counts[14] == 1);
  for (int hour = 0; hour < kHoursPerDay; ++hour) {
    if (hour == 2 || hour == 14) {
      assert(histogram.percentages[hour] == 50);
    } else {
      assert(histogram.percentages[hour] == 0);
    }
  }
}

void TestTimezoneShiftsBuckets() {
  HourActivityOptions options;
  options.timezone = "Asia/Tokyo";

  // UTC+9 all year.
  const auto histogram = ComputeHourActivity({AtDate("2023-03-01T02:00:00"), AtDate("2023-03-01T20:30:00")}, options);
  assert(histogram.counts[11] == 1);
  assert(histogram.counts[5] == 1);
  assert(histogram.counts[2] == 0);
}

void TestTimezoneFollowsDaylightSaving() {
  HourActivityOptions options;
  options.timezone = "Europe/Paris";

  const auto winter = ComputeHourActivity({AtDate("2023-01-15T12:00:00")}, options);
  assert(winter.counts[13] == 1);

  const auto summer = ComputeHourActivity({AtDate("2023-07-15T12:00:00")}, options);
  assert(summer.counts[14] == 1);
}

void TestScaleMultipliesRoundedPercentages() {
  HourActivityOptions options;
  options.scale = 3;

  const auto histogram = ComputeHourActivity(
      {AtDate("2023-03-01T01:00:00"), AtDate("2023-03-01T01:10:00"), AtDate("2023-03-01T09:00:00")}, options);

  // 66.67 -> 67, 33.33 -> 33
  assert(histogram.percentages[1] == 67 * 3);
  assert(histogram.percentages[9] == 33 * 3);
}

void TestHalvesRoundAwayFromZero() {
  std::vector<Message> messages;
  for (int i = 0; i < 200; ++i) {
    messages.push_back(AtDate("2023-03-01T05:00:00"));
  }
  messages.push_back(AtDate("2023-03-01T06:00:00"));
  for (int i = 0; i < 199; ++i) {
    messages.push_back(AtDate("2023-03-01T07:00:00"));
  }

  // 1 / 400 = 0.25% -> 0, 200 / 400 = 50%, 199 / 400 = 49.75% -> 50
  const auto histogram = ComputeHourActivity(messages, HourActivityOptions{});
  assert(histogram.percentages[5] == 50);
  assert(histogram.percentages[6] == 0);
  assert(histogram.percentages[7] == 50);

  // 1 / 8 = 12.5% -> 13
  std::vector<Message> eighths;
  eighths.push_back(AtDate("2023-03-01T00:00:00"));
  for (int i = 0; i < 7; ++i) {
    eighths.push_back(AtDate("2023-03-01T23:00:00"));
  }
  const auto rounded = ComputeHourActivity(eighths, HourActivityOptions{});
  assert(rounded.percentages[0] == 13);
  assert(rounded.percentages[23] == 88);
}

void TestCountersSumToTotalAndPercentagesNearHundred() {
  std::vector<Message> messages;
  const char* dates[] = {"2023-03-01T00:15:00", "2023-03-01T03:00:00", "2023-03-02T03:59:59", "2023-03-02T07:00:00",
                         "2023-03-03T11:11:11", "2023-03-04T17:45:00", "2023-03-05T23:59:59"};
  for (const char* date : dates) {
    messages.push_back(AtDate(date));
  }

  const auto histogram = ComputeHourActivity(messages, HourActivityOptions{});

  const auto counted = std::accumulate(histogram.counts.begin(), histogram.counts.end(), std::uint64_t{0});
  assert(counted == histogram.total);
  assert(histogram.total == messages.size());

  const auto percent = std::accumulate(histogram.percentages.begin(), histogram.percentages.end(), std::int64_t{0});
  assert(percent >= 99 && percent <= 101);
}

void TestEmptyInputIsRejected() {
  bool threw = false;
  try {
    (void)ComputeHourActivity({}, HourActivityOptions{});
  } catch (const tgstats::util::NoMatchingMessages&) {
    threw = true;
  }
  assert(threw && "Percentages of nothing must not be emitted.");
}

void TestUnknownTimezoneIsRejected() {
  HourActivityOptions options;
  options.timezone = "Mars/Olympus_Mons";

  bool threw = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-03-01T02:00:00")}, options);
  } catch (const tgstats::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "Unknown zones are a configuration error.");
}

void TestUnparseableDateIsFatal() {
  bool threw = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-03-01T02:00:00"), AtDate("01/03/2023 02:00")}, HourActivityOptions{});
  } catch (const tgstats::util::UnparseableDate&) {
    threw = true;
  }
  assert(threw && "Messages with unreadable dates must not be skipped.");

  threw = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-03-01T02:00:00Z")}, HourActivityOptions{});
  } catch (const tgstats::util::UnparseableDate&) {
    threw = true;
  }
  assert(threw && "Dates carry no zone designator.");
}

void TestNegativeScaleIsRejected() {
  HourActivityOptions options;
  options.scale = -1;

  bool threw = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-03-01T02:00:00")}, options);
  } catch (const tgstats::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestOverflowingScaleIsRejected() {
  HourActivityOptions options;
  options.scale = std::numeric_limits<std::int64_t>::max();

  bool threw = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-01-01T02:00:00")}, options);
  } catch (const tgstats::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "A scale whose full bar overflows must not wrap around.");

  // The largest accepted scale still yields 100 * scale for a full bar.
  options.scale        = std::numeric_limits<std::int64_t>::max() / 100;
  const auto histogram = ComputeHourActivity({AtDate("2023-01-01T02:00:00")}, options);
  assert(histogram.percentages[2] == 100 * options.scale);
  assert(histogram.percentages[2] > 0);

  options.scale = options.scale + 1;
  threw         = false;
  try {
    (void)ComputeHourActivity({AtDate("2023-01-01T02:00:00")}, options);
  } catch (const tgstats::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTwoMessagesSplitEvenly();
  TestTimezoneShiftsBuckets();
  TestTimezoneFollowsDaylightSaving();
  TestScaleMultipliesRoundedPercentages();
  TestHalvesRoundAwayFromZero();
  TestCountersSumToTotalAndPercentagesNearHundred();
  TestEmptyInputIsRejected();
  TestUnknownTimezoneIsRejected();
  TestUnparseableDateIsFatal();
  TestNegativeScaleIsRejected();
  TestOverflowingScaleIsRejected();

  std::cout << "tgstats_unit_hour_activity: pass\n";
  return 0;
}
