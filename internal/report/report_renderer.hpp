#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "internal/analysis/hour_activity.hpp"
#include "internal/analysis/word_frequency.hpp"

namespace tgstats::report {

constexpr char kDefaultMarker[] = "\xE2\x80\xA2"; // U+2022 BULLET

// "word" ⨉ count, one entry per line.
void RenderWordCountsText(const std::vector<analysis::WordCount>& counts, std::ostream& out);

/*
  JSON array of {"word": ..., "count": ...} objects, one object per line.
  Each object is printed from a tgstats.report.v1.WordCountEntry so the key
  order is fixed; an empty list prints "[]".
*/
void RenderWordCountsJson(const std::vector<analysis::WordCount>& counts, std::ostream& out);

// "HH:00 - " followed by percentages[i] markers, hours 0 to 23.
void RenderHourHistogram(const analysis::HourHistogram& histogram, const std::string& marker, std::ostream& out);

} // namespace tgstats::report
