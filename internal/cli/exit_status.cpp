#include "exit_status.hpp"

#include "internal/util/errors.hpp"

namespace tgstats::cli {

ExitStatus ToExitStatus(const std::exception& e) {
  using namespace tgstats::util;

  if (dynamic_cast<const UsageError*>(&e)) {
    return ExitStatus::kUsage;
  }
  if (dynamic_cast<const FileReadError*>(&e)) {
    return ExitStatus::kFileRead;
  }
  if (dynamic_cast<const ParseError*>(&e)) {
    return ExitStatus::kParse;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return ExitStatus::kInvalidArgument;
  }
  if (dynamic_cast<const NoMatchingMessages*>(&e)) {
    return ExitStatus::kNoMatchingMessages;
  }
  if (dynamic_cast<const UnparseableDate*>(&e)) {
    return ExitStatus::kUnparseableDate;
  }

  return ExitStatus::kInternal;
}

} // namespace tgstats::cli
