#include "report_renderer.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstddef>
#include <stdexcept>
#include <string>

#include "tgstats/report/v1.hpp"

namespace tgstats::report {

namespace {

constexpr char kTimes[] = "\xE2\xA8\x89"; // U+2A09 N-ARY TIMES OPERATOR

} // namespace

void RenderWordCountsText(const std::vector<analysis::WordCount>& counts, std::ostream& out) {
  for (const auto& entry : counts) {
    out << '"' << entry.word << "\" " << kTimes << ' ' << entry.count << '\n';
  }
}

void RenderWordCountsJson(const std::vector<analysis::WordCount>& counts, std::ostream& out) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  if (counts.empty()) {
    out << "[]\n";
    return;
  }

  out << "[\n";
  tgstats::report::v1::WordCountEntry message;
  for (std::size_t i = 0; i < counts.size(); ++i) {
    message.set_word(counts[i].word);
    message.set_count(static_cast<double>(counts[i].count));

    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
      throw std::runtime_error("Failed to serialize word counts: " + std::string(status.message()));
    }
    out << "  " << json << (i + 1 < counts.size() ? ",\n" : "\n");
  }
  out << "]\n";
}

void RenderHourHistogram(const analysis::HourHistogram& histogram, const std::string& marker, std::ostream& out) {
  for (int hour = 0; hour < analysis::kHoursPerDay; ++hour) {
    if (hour < 10) {
      out << '0';
    }
    out << hour << ":00 - ";
    for (std::int64_t i = 0; i < histogram.percentages[hour]; ++i) {
      out << marker;
    }
    out << '\n';
  }
}

} // namespace tgstats::report
