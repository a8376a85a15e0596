#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace graphflow::util {

/*
  google::protobuf::Value helpers used for state data, trace payloads and
  condition evaluation.
*/

google::protobuf::Value NumberValue(double v);
google::protobuf::Value StringValue(const std::string& v);
google::protobuf::Value BoolValue(bool v);
google::protobuf::Value NullValue();

bool ValueEquals(const google::protobuf::Value& a, const google::protobuf::Value& b);

// Compact JSON rendering; strings are rendered without quotes.
std::string ValueToString(const google::protobuf::Value& v);

// Parses a condition literal: true/false/null, a number, a quoted or bare string.
google::protobuf::Value ParseLiteral(const std::string& text);

std::string StructToJson(const google::protobuf::Struct& s);

} // namespace graphflow::util
