#include "archive_parser.hpp"

#include <google/protobuf/util/json_util.h>

#include <string>

#include "internal/model/message_text.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "tgstats/archive/v1.hpp"

namespace tgstats::parser {

using namespace tgstats::archive::v1;

namespace {

model::Message ToModel(const Message& message) {
  model::Message out;
  out.id           = message.id();
  out.type         = message.type();
  out.date         = message.date();
  out.from         = message.from();
  out.from_id      = message.from_id();
  out.text_content = message.has_text() ? model::FlattenText(message.text()) : std::string();
  return out;
}

} // namespace

model::Archive ParseArchive(std::string_view json) {
  TelegramExport decoded;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &decoded, options);
  if (!status.ok()) {
    throw util::ParseError("Invalid chat export: " + std::string(status.message()));
  }

  model::Archive archive;
  archive.name = decoded.name();
  archive.type = decoded.type();
  archive.id   = decoded.id();

  archive.messages.reserve(decoded.messages_size());
  for (const auto& message : decoded.messages()) {
    archive.messages.push_back(ToModel(message));
  }

  TGSTATS_LOG_DEBUG("Parsed chat export", {observability::StringField("name", archive.name),
                                           observability::IntField("messages", static_cast<std::int64_t>(archive.messages.size()))});
  return archive;
}

} // namespace tgstats::parser
