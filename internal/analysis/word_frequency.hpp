#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/archive.hpp"

namespace tgstats::analysis {

struct WordCount {
  std::string   word;
  std::uint64_t count = 0;

  bool operator==(const WordCount& other) const {
    return word == other.word && count == other.count;
  }
};

struct WordFrequencyOptions {
  std::optional<std::int64_t> limit;

  // Least common words first.
  bool reverse = false;
};

/*
  Splits on every single ' ', so "a  b" yields "a", "", "b". Empty text
  yields no token at all.
*/
std::vector<std::string_view> Tokenize(std::string_view text);

// ASCII lowercase; other bytes are copied as is.
std::string NormalizeWord(std::string_view token);

/*
  Alphabetical pre-sort followed by a stable sort on count, so ties come out
  in ascending word order whichever direction is requested.
*/
void SortWordCounts(std::vector<WordCount>* counts, bool reverse);

/*
  Counts normalized tokens across messages, sorted as above and truncated to
  options.limit. Throws util::InvalidArgument when the limit is negative or
  exceeds the number of distinct words.
*/
std::vector<WordCount> CountWords(const std::vector<model::Message>& messages, const WordFrequencyOptions& options);

} // namespace tgstats::analysis
