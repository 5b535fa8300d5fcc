#include <iostream>
#include <string>
#include <type_traits>
#include <variant>

#include "config/config.pb.h"
#include "internal/cli/command_line.hpp"
#include "internal/cli/exit_status.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/report_service.hpp"
#include "internal/util/errors.hpp"

using tgstats::cli::ExitStatus;
using tgstats::cli::ToExitCode;

int main(int argc, char** argv) {
  tgstats::runtime::config::RuntimeConfig config;

  // Defaults until the config file, if any, has been read.
  tgstats::observability::InitializeLogging(config);

  try {
    auto command = tgstats::cli::ParseCommandLine(argc, argv);

    if (command.config_path) {
      config = tgstats::config::ConfigLoader::LoadFromYaml(*command.config_path);
      tgstats::observability::InitializeLogging(config);
      TGSTATS_LOG_DEBUG("Loaded configuration", {tgstats::observability::StringField("path", *command.config_path)});
    }

    tgstats::service::ReportService service(config);

    std::visit(
        [&](const auto& action) {
          using T = std::decay_t<decltype(action)>;
          if constexpr (std::is_same_v<T, tgstats::cli::HelpCommand>) {
            std::cout << tgstats::cli::UsageText(action.topic);
          } else if constexpr (std::is_same_v<T, tgstats::cli::WordCountCommand>) {
            service.WordCount(action, std::cout);
          } else {
            service.HourActivity(action, std::cout);
          }
        },
        command.action);
  } catch (const tgstats::util::UsageError& e) {
    TGSTATS_LOG_ERROR("Invalid usage", {tgstats::observability::StringField("error", e.what())});
    std::cerr << tgstats::cli::UsageText();
    tgstats::observability::ShutdownLogging();
    return ToExitCode(ExitStatus::kUsage);
  } catch (const std::exception& e) {
    TGSTATS_LOG_ERROR("Fatal error", {tgstats::observability::StringField("error", e.what())});
    tgstats::observability::ShutdownLogging();
    return ToExitCode(tgstats::cli::ToExitStatus(e));
  }

  std::cout.flush();
  tgstats::observability::ShutdownLogging();
  return ToExitCode(ExitStatus::kOk);
}
