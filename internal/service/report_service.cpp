#include "report_service.hpp"

#include <sstream>

#include "internal/analysis/hour_activity.hpp"
#include "internal/analysis/word_frequency.hpp"
#include "internal/filter/message_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/parser/archive_parser.hpp"
#include "internal/report/report_renderer.hpp"
#include "internal/util/file.hpp"

namespace tgstats::service {

ReportService::ReportService(tgstats::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

model::Archive ReportService::LoadArchive(const std::string& path) const {
  TGSTATS_LOG_DEBUG("Reading chat export", {observability::StringField("path", path)});
  return parser::ParseArchive(util::ReadFile(path));
}

// ------------------------------------------------------------
// word-count
// ------------------------------------------------------------

void ReportService::WordCount(const cli::WordCountCommand& cmd, std::ostream& out) const {
  // Calendar dates are validated before the file is touched.
  const auto spec = filter::MakeFilterSpec(cmd.from, cmd.start_date, cmd.end_date);

  analysis::WordFrequencyOptions options;
  options.limit   = cmd.limit;
  options.reverse = cmd.reverse_sort || config_.word_count().reverse_sort();

  const auto archive  = LoadArchive(cmd.file_path);
  const auto messages = filter::FilterMessages(archive.messages, spec);
  const auto counts   = analysis::CountWords(messages, options);

  std::ostringstream rendered;
  if (cmd.output_json || config_.word_count().output_json()) {
    report::RenderWordCountsJson(counts, rendered);
  } else {
    report::RenderWordCountsText(counts, rendered);
  }
  out << rendered.str();

  TGSTATS_LOG_INFO("Word count report written", {observability::StringField("path", cmd.file_path),
                                                 observability::IntField("messages", static_cast<std::int64_t>(messages.size())),
                                                 observability::IntField("entries", static_cast<std::int64_t>(counts.size()))});
}

// ------------------------------------------------------------
// hour-activity
// ------------------------------------------------------------

void ReportService::HourActivity(const cli::HourActivityCommand& cmd, std::ostream& out) const {
  const auto spec = filter::MakeFilterSpec(cmd.from, cmd.start_date, cmd.end_date);

  const auto& defaults = config_.hour_activity();

  analysis::HourActivityOptions options;
  if (cmd.timezone) {
    options.timezone = cmd.timezone;
  } else if (!defaults.timezone().empty()) {
    options.timezone = defaults.timezone();
  }
  if (cmd.scale) {
    options.scale = *cmd.scale;
  } else if (defaults.has_scale()) {
    options.scale = defaults.scale();
  }

  const auto marker = defaults.marker().empty() ? std::string(report::kDefaultMarker) : defaults.marker();

  const auto archive   = LoadArchive(cmd.file_path);
  const auto messages  = filter::FilterMessages(archive.messages, spec);
  const auto histogram = analysis::ComputeHourActivity(messages, options);

  std::ostringstream rendered;
  report::RenderHourHistogram(histogram, marker, rendered);
  out << rendered.str();

  TGSTATS_LOG_INFO("Hour activity report written", {observability::StringField("path", cmd.file_path),
                                                    observability::IntField("messages", static_cast<std::int64_t>(histogram.total)),
                                                    observability::IntField("scale", options.scale)});
}

}
