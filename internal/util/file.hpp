#pragma once

#include <filesystem>
#include <string>

namespace tgstats::util {

/*
  Reads the whole file into memory. Throws FileReadError.
*/
std::string ReadFile(const std::filesystem::path& path);

} // namespace tgstats::util
