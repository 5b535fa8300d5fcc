#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tgstats::model {

/*
  One chat entry.

  text_content is the flattened plain text of the export's structured "text"
  field; analyzers only ever look at this string.
*/
struct Message {
  std::int64_t id = 0;
  std::string  type;

  // UTC, "YYYY-MM-DDTHH:MM:SS", parsed lazily by the consumers that need it.
  std::string date;

  std::string from;
  std::string from_id;

  std::string text_content;
};

/*
  One exported conversation. Built once by the parser, read-only afterwards.
*/
struct Archive {
  std::string  name;
  std::string  type;
  std::int64_t id = 0;

  std::vector<Message> messages;
};

} // namespace tgstats::model
