#pragma once

#include <stdexcept>
#include <string>

namespace tgstats::util {

/*
  Central error types.

  Every one of them is fatal for the run; main() translates them into a
  process exit status (see internal/cli/exit_status.hpp).
*/

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FileReadError : public std::runtime_error {
 public:
  explicit FileReadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoMatchingMessages : public std::runtime_error {
 public:
  explicit NoMatchingMessages(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnparseableDate : public std::runtime_error {
 public:
  explicit UnparseableDate(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace tgstats::util
