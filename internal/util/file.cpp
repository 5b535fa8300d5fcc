#include "file.hpp"

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace tgstats::util {

std::string ReadFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    throw FileReadError("cannot read " + path.string() + ": is a directory");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw FileReadError("cannot open " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw FileReadError("failed reading " + path.string());
  }
  return buffer.str();
}

} // namespace tgstats::util
