#include "command_line.hpp"

#include <charconv>
#include <sstream>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace tgstats::cli {

namespace {

constexpr char kWordCount[]    = "word-count";
constexpr char kHourActivity[] = "hour-activity";

/*
  Walks the arguments of one subcommand, splitting "--name=value" forms and
  handing out option values.
*/
class ArgumentCursor {
 public:
  ArgumentCursor(std::vector<std::string> args, std::string subcommand)
      : args_(std::move(args)), subcommand_(std::move(subcommand)) {
  }

  bool Next() {
    if (index_ >= args_.size()) {
      return false;
    }
    const auto& arg = args_[index_++];
    inline_value_.reset();

    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      name_         = arg.substr(0, eq);
      inline_value_ = arg.substr(eq + 1);
    } else {
      name_ = arg;
    }
    return true;
  }

  const std::string& Name() const {
    return name_;
  }

  bool IsOption() const {
    return name_.size() > 1 && name_[0] == '-';
  }

  std::string Value() {
    if (inline_value_) {
      return *inline_value_;
    }
    if (index_ >= args_.size()) {
      throw util::UsageError(subcommand_ + ": missing value for " + name_);
    }
    return args_[index_++];
  }

  std::int64_t IntValue() {
    const auto   text  = Value();
    std::int64_t value = 0;
    auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
      throw util::UsageError(subcommand_ + ": " + name_ + " expects an integer, got '" + text + "'");
    }
    return value;
  }

  void NoValue() const {
    if (inline_value_) {
      throw util::UsageError(subcommand_ + ": " + name_ + " does not take a value");
    }
  }

  [[noreturn]] void Unknown() const {
    throw util::UsageError(subcommand_ + ": unknown option " + name_);
  }

  void SetPositional(std::string* file_path) const {
    if (!file_path->empty()) {
      throw util::UsageError(subcommand_ + ": unexpected argument " + name_);
    }
    *file_path = name_;
  }

  const std::string& Subcommand() const {
    return subcommand_;
  }

 private:
  std::vector<std::string>   args_;
  std::string                subcommand_;
  std::size_t                index_ = 0;
  std::string                name_;
  std::optional<std::string> inline_value_;
};

bool IsHelp(const std::string& arg) {
  return arg == "-h" || arg == "--help";
}

void RequireFile(const std::string& file_path, const std::string& subcommand) {
  if (file_path.empty()) {
    throw util::UsageError(subcommand + ": missing path of the JSON export");
  }
}

std::variant<HelpCommand, WordCountCommand, HourActivityCommand> ParseWordCount(ArgumentCursor cursor) {
  WordCountCommand cmd;
  while (cursor.Next()) {
    const auto& name = cursor.Name();
    if (!cursor.IsOption()) {
      cursor.SetPositional(&cmd.file_path);
    } else if (IsHelp(name)) {
      return HelpCommand{kWordCount};
    } else if (name == "-l" || name == "--limit") {
      cmd.limit = cursor.IntValue();
    } else if (name == "--from") {
      cmd.from = cursor.Value();
    } else if (name == "--start-date") {
      cmd.start_date = cursor.Value();
    } else if (name == "--end-date") {
      cmd.end_date = cursor.Value();
    } else if (name == "--output-json") {
      cursor.NoValue();
      cmd.output_json = true;
    } else if (name == "--reverse-sort") {
      cursor.NoValue();
      cmd.reverse_sort = true;
    } else {
      cursor.Unknown();
    }
  }
  RequireFile(cmd.file_path, cursor.Subcommand());
  return cmd;
}

std::variant<HelpCommand, WordCountCommand, HourActivityCommand> ParseHourActivity(ArgumentCursor cursor) {
  HourActivityCommand cmd;
  while (cursor.Next()) {
    const auto& name = cursor.Name();
    if (!cursor.IsOption()) {
      cursor.SetPositional(&cmd.file_path);
    } else if (IsHelp(name)) {
      return HelpCommand{kHourActivity};
    } else if (name == "--timezone") {
      cmd.timezone = cursor.Value();
    } else if (name == "--from") {
      cmd.from = cursor.Value();
    } else if (name == "--start-date") {
      cmd.start_date = cursor.Value();
    } else if (name == "--end-date") {
      cmd.end_date = cursor.Value();
    } else if (name == "--scale") {
      cmd.scale = cursor.IntValue();
    } else {
      cursor.Unknown();
    }
  }
  RequireFile(cmd.file_path, cursor.Subcommand());
  return cmd;
}

} // namespace

Command ParseCommandLine(int argc, const char* const* argv) {
  Command command;

  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (IsHelp(arg)) {
      command.action = HelpCommand{};
      return command;
    }
    if (arg == "--config") {
      if (i + 1 >= argc) {
        throw util::UsageError("missing value for --config");
      }
      command.config_path = argv[++i];
    } else if (arg.rfind("--config=", 0) == 0) {
      command.config_path = arg.substr(std::string_view("--config=").size());
    } else {
      break;
    }
  }

  if (i >= argc) {
    throw util::UsageError("missing subcommand");
  }

  const std::string        subcommand = argv[i];
  std::vector<std::string> rest(argv + i + 1, argv + argc);

  if (subcommand == kWordCount) {
    command.action = ParseWordCount(ArgumentCursor(std::move(rest), subcommand));
  } else if (subcommand == kHourActivity) {
    command.action = ParseHourActivity(ArgumentCursor(std::move(rest), subcommand));
  } else {
    throw util::UsageError("unknown subcommand: " + subcommand);
  }
  return command;
}

std::string UsageText(const std::string& topic) {
  std::ostringstream out;
  if (topic == kWordCount) {
    out << "Count the number of occurrences of individual words.\n"
        << "Words are extracted by splitting each message on a single space and lowercased.\n\n"
        << "Usage:\n"
        << "  tgstats [--config <file.yaml>] word-count <file> [options]\n\n"
        << "Options:\n"
        << "  -l, --limit <n>         Limit output to the first n results\n"
        << "  --from <name>           Only include messages from the specified user\n"
        << "  --start-date <d/m/y>    Only include messages sent on or after this day (UTC)\n"
        << "  --end-date <d/m/y>      Only include messages sent up to this day (UTC)\n"
        << "  --output-json           Outputs the results in JSON\n"
        << "  --reverse-sort          Output the least common words first\n";
  } else if (topic == kHourActivity) {
    out << "Show a graph with the message percentage by hour.\n\n"
        << "Usage:\n"
        << "  tgstats [--config <file.yaml>] hour-activity <file> [options]\n\n"
        << "Options:\n"
        << "  --timezone <tz>         TZ database name to convert to (eg: Europe/Paris)\n"
        << "  --from <name>           Only include messages from the specified user\n"
        << "  --start-date <d/m/y>    Start date in dd/mm/yyyy format\n"
        << "  --end-date <d/m/y>      End date in dd/mm/yyyy format\n"
        << "  --scale <n>             Scale the graph by the specified integer (default 1)\n";
  } else {
    out << "Make statistics about Telegram conversations.\n\n"
        << "Usage:\n"
        << "  tgstats [--config <file.yaml>] word-count <file> [options]\n"
        << "  tgstats [--config <file.yaml>] hour-activity <file> [options]\n"
        << "  tgstats <subcommand> --help\n";
  }
  return out.str();
}

} // namespace tgstats::cli
