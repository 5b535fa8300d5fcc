#pragma once

#include <ostream>
#include <string>

#include "config/config.pb.h"
#include "internal/cli/command_line.hpp"
#include "internal/model/archive.hpp"

namespace tgstats::service {

/*
  Runs one report end to end: read -> parse -> filter -> analyze -> render.

  Command line values win over the runtime config, which wins over the
  built-in defaults. Any failure throws before anything is written to out.
*/
class ReportService {
public:
  explicit ReportService(tgstats::runtime::config::RuntimeConfig config);

  void WordCount(const cli::WordCountCommand& cmd, std::ostream& out) const;

  void HourActivity(const cli::HourActivityCommand& cmd, std::ostream& out) const;

private:
  model::Archive LoadArchive(const std::string& path) const;

  tgstats::runtime::config::RuntimeConfig config_;
};

}
