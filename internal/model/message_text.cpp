#include "message_text.hpp"

#include <google/protobuf/struct.pb.h>

namespace tgstats::model {

namespace {

void AppendEntity(const google::protobuf::Value& entity, std::string* out) {
  switch (entity.kind_case()) {
    case google::protobuf::Value::kStringValue:
      out->append(entity.string_value());
      break;

    case google::protobuf::Value::kStructValue: {
      const auto& fields = entity.struct_value().fields();
      auto        it     = fields.find("text");
      if (it != fields.end() && it->second.kind_case() == google::protobuf::Value::kStringValue) {
        out->append(it->second.string_value());
      }
      break;
    }

    default:
      break;
  }
}

} // namespace

std::string FlattenText(const google::protobuf::Value& text) {
  switch (text.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return text.string_value();

    case google::protobuf::Value::kListValue: {
      std::string flattened;
      for (const auto& entity : text.list_value().values()) {
        AppendEntity(entity, &flattened);
      }
      return flattened;
    }

    default:
      return {};
  }
}

} // namespace tgstats::model
