#pragma once

#include <string>

namespace google::protobuf {
class Value;
}

namespace tgstats::model {

/*
  Flattens the export's "text" value to plain text.

    null / unset        -> ""
    "plain"             -> "plain"
    ["a", {"text": "b"}] -> "ab"
    anything else       -> ""
*/
std::string FlattenText(const google::protobuf::Value& text);

} // namespace tgstats::model
