#pragma once

#include <exception>

namespace tgstats::cli {

enum class ExitStatus : int {
  kOk                 = 0,
  kUsage              = 1,
  kInternal           = 2,
  kFileRead           = 3,
  kParse              = 4,
  kInvalidArgument    = 5,
  kNoMatchingMessages = 6,
  kUnparseableDate    = 7,
};

/*
  Converts internal exceptions into process exit codes.
*/
ExitStatus ToExitStatus(const std::exception& e);

inline int ToExitCode(ExitStatus status) {
  return static_cast<int>(status);
}

} // namespace tgstats::cli
