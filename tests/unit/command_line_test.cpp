#include "internal/cli/command_line.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/cli/exit_status.hpp"
#include "internal/util/errors.hpp"

namespace {

using tgstats::cli::Command;
using tgstats::cli::ExitStatus;
using tgstats::cli::HelpCommand;
using tgstats::cli::HourActivityCommand;
using tgstats::cli::ParseCommandLine;
using tgstats::cli::WordCountCommand;

Command Parse(std::vector<const char*> args) {
  args.insert(args.begin(), "tgstats");
  return ParseCommandLine(static_cast<int>(args.size()), args.data());
}

bool ThrowsUsage(std::vector<const char*> args) {
  try {
    (void)Parse(std::move(args));
  } catch (const tgstats::util::UsageError&) {
    return true;
  }
  return false;
}

void TestWordCountOptions() {
  const auto command = Parse({"word-count", "export.json", "-l", "5", "--from", "Alice", "--output-json", "--reverse-sort"});
  assert(!command.config_path);

  const auto& cmd = std::get<WordCountCommand>(command.action);
  assert(cmd.file_path == "export.json");
  assert(cmd.limit && *cmd.limit == 5);
  assert(cmd.from && *cmd.from == "Alice");
  assert(cmd.output_json);
  assert(cmd.reverse_sort);
  assert(!cmd.start_date && !cmd.end_date);
}

void TestWordCountDefaults() {
  const auto  command = Parse({"word-count", "export.json"});
  const auto& cmd     = std::get<WordCountCommand>(command.action);
  assert(!cmd.limit);
  assert(!cmd.from);
  assert(!cmd.output_json);
  assert(!cmd.reverse_sort);
}

void TestHourActivityOptions() {
  const auto command = Parse({"--config", "tgstats.yaml", "hour-activity", "--timezone=Europe/Paris", "--from", "Bob", "--start-date",
                              "01/01/2023", "--end-date", "31/12/2023", "--scale", "2", "export.json"});
  assert(command.config_path && *command.config_path == "tgstats.yaml");

  const auto& cmd = std::get<HourActivityCommand>(command.action);
  assert(cmd.file_path == "export.json");
  assert(cmd.timezone && *cmd.timezone == "Europe/Paris");
  assert(cmd.from && *cmd.from == "Bob");
  assert(cmd.start_date && *cmd.start_date == "01/01/2023");
  assert(cmd.end_date && *cmd.end_date == "31/12/2023");
  assert(cmd.scale && *cmd.scale == 2);
}

void TestHelp() {
  assert(std::holds_alternative<HelpCommand>(Parse({"--help"}).action));
  assert(std::get<HelpCommand>(Parse({"hour-activity", "-h"}).action).topic == "hour-activity");
  assert(tgstats::cli::UsageText("word-count").find("--reverse-sort") != std::string::npos);
}

void TestUsageErrors() {
  assert(ThrowsUsage({}));
  assert(ThrowsUsage({"frequency", "export.json"}));
  assert(ThrowsUsage({"word-count"}));
  assert(ThrowsUsage({"word-count", "a.json", "b.json"}));
  assert(ThrowsUsage({"word-count", "export.json", "--limit"}));
  assert(ThrowsUsage({"word-count", "export.json", "--limit", "ten"}));
  assert(ThrowsUsage({"word-count", "export.json", "--timezone", "UTC"}));
  assert(ThrowsUsage({"word-count", "export.json", "--output-json=yes"}));
  assert(ThrowsUsage({"hour-activity", "export.json", "--scale", "1.5"}));
  assert(ThrowsUsage({"--config"}));
}

void TestExitStatusMapping() {
  using tgstats::cli::ToExitStatus;

  assert(ToExitStatus(tgstats::util::UsageError("x")) == ExitStatus::kUsage);
  assert(ToExitStatus(tgstats::util::FileReadError("x")) == ExitStatus::kFileRead);
  assert(ToExitStatus(tgstats::util::ParseError("x")) == ExitStatus::kParse);
  assert(ToExitStatus(tgstats::util::InvalidArgument("x")) == ExitStatus::kInvalidArgument);
  assert(ToExitStatus(tgstats::util::NoMatchingMessages("x")) == ExitStatus::kNoMatchingMessages);
  assert(ToExitStatus(tgstats::util::UnparseableDate("x")) == ExitStatus::kUnparseableDate);
  assert(ToExitStatus(std::runtime_error("x")) == ExitStatus::kInternal);
  assert(tgstats::cli::ToExitCode(ExitStatus::kOk) == 0);
}

} // namespace

int main() {
  TestWordCountOptions();
  TestWordCountDefaults();
  TestHourActivityOptions();
  TestHelp();
  TestUsageErrors();
  TestExitStatusMapping();

  std::cout << "tgstats_unit_command_line: pass\n";
  return 0;
}
