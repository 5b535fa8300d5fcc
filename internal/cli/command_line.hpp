#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tgstats::cli {

struct HelpCommand {
  // Empty for the top level usage, otherwise the subcommand name.
  std::string topic;
};

struct WordCountCommand {
  std::string file_path;

  std::optional<std::int64_t> limit;
  std::optional<std::string>  from;
  std::optional<std::string>  start_date;
  std::optional<std::string>  end_date;

  bool output_json  = false;
  bool reverse_sort = false;
};

struct HourActivityCommand {
  std::string file_path;

  std::optional<std::string>  timezone;
  std::optional<std::string>  from;
  std::optional<std::string>  start_date;
  std::optional<std::string>  end_date;
  std::optional<std::int64_t> scale;
};

struct Command {
  std::optional<std::string> config_path;

  std::variant<HelpCommand, WordCountCommand, HourActivityCommand> action;
};

/*
  Parses argv. Options accept both "--name value" and "--name=value".
  Throws util::UsageError.
*/
Command ParseCommandLine(int argc, const char* const* argv);

std::string UsageText(const std::string& topic = {});

} // namespace tgstats::cli
