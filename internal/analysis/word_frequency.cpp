#include "word_frequency.hpp"

#include <algorithm>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tgstats::analysis {

std::vector<std::string_view> Tokenize(std::string_view text) {
  std::vector<std::string_view> tokens;
  if (text.empty()) {
    return tokens;
  }

  std::size_t start = 0;
  while (true) {
    const auto space = text.find(' ', start);
    if (space == std::string_view::npos) {
      tokens.push_back(text.substr(start));
      break;
    }
    tokens.push_back(text.substr(start, space - start));
    start = space + 1;
  }
  return tokens;
}

std::string NormalizeWord(std::string_view token) {
  std::string word(token);
  for (auto& c : word) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return word;
}

void SortWordCounts(std::vector<WordCount>* counts, bool reverse) {
  std::sort(counts->begin(), counts->end(), [](const WordCount& a, const WordCount& b) { return a.word < b.word; });

  if (reverse) {
    std::stable_sort(counts->begin(), counts->end(), [](const WordCount& a, const WordCount& b) { return a.count < b.count; });
  } else {
    std::stable_sort(counts->begin(), counts->end(), [](const WordCount& a, const WordCount& b) { return a.count > b.count; });
  }
}

std::vector<WordCount> CountWords(const std::vector<model::Message>& messages, const WordFrequencyOptions& options) {
  std::unordered_map<std::string, std::uint64_t> words;

  for (const auto& message : messages) {
    for (const auto token : Tokenize(message.text_content)) {
      ++words[NormalizeWord(token)];
    }
  }

  std::vector<WordCount> counts;
  counts.reserve(words.size());
  for (auto& [word, count] : words) {
    counts.push_back({word, count});
  }

  SortWordCounts(&counts, options.reverse);

  if (options.limit) {
    const auto limit = *options.limit;
    if (limit < 0 || static_cast<std::uint64_t>(limit) > counts.size()) {
      throw util::InvalidArgument("limit " + std::to_string(limit) + " is out of range for " + std::to_string(counts.size()) +
                                  " distinct words");
    }
    counts.resize(static_cast<std::size_t>(limit));
  }

  TGSTATS_LOG_DEBUG("Counted words", {observability::IntField("messages", static_cast<std::int64_t>(messages.size())),
                                      observability::IntField("entries", static_cast<std::int64_t>(counts.size()))});
  return counts;
}

} // namespace tgstats::analysis
