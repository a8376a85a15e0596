#include "value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cstdlib>

namespace graphflow::util {

google::protobuf::Value NumberValue(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

google::protobuf::Value StringValue(const std::string& v) {
  google::protobuf::Value value;
  value.set_string_value(v);
  return value;
}

google::protobuf::Value BoolValue(bool v) {
  google::protobuf::Value value;
  value.set_bool_value(v);
  return value;
}

google::protobuf::Value NullValue() {
  google::protobuf::Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

bool ValueEquals(const google::protobuf::Value& a, const google::protobuf::Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

std::string ValueToString(const google::protobuf::Value& v) {
  switch (v.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return v.string_value();
    case google::protobuf::Value::kBoolValue:
      return v.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return "null";
    default: {
      std::string json;
      if (!google::protobuf::util::MessageToJsonString(v, &json).ok()) return {};
      return json;
    }
  }
}

google::protobuf::Value ParseLiteral(const std::string& raw) {
  auto begin = raw.find_first_not_of(" \t");
  auto end   = raw.find_last_not_of(" \t");
  if (begin == std::string::npos) return StringValue("");
  std::string text = raw.substr(begin, end - begin + 1);

  if (text == "true" || text == "false") return BoolValue(text == "true");
  if (text == "null") return NullValue();

  if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
    return StringValue(text.substr(1, text.size() - 2));
  }

  char*        endptr        = nullptr;
  const double numeric_value = std::strtod(text.c_str(), &endptr);
  if (endptr && *endptr == '\0') return NumberValue(numeric_value);

  return StringValue(text);
}

std::string StructToJson(const google::protobuf::Struct& s) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(s, &json).ok()) return "{}";
  return json;
}

} // namespace graphflow::util
