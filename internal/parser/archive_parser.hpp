#pragma once

#include <string_view>

#include "internal/model/archive.hpp"

namespace tgstats::parser {

/*
  Decodes a Telegram export JSON document.

  Unknown fields are skipped, missing ones keep their zero value. Syntax
  errors and type mismatches on known fields throw util::ParseError; nothing
  is returned in that case.
*/
model::Archive ParseArchive(std::string_view json);

} // namespace tgstats::parser
