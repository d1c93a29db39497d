#pragma once

#include <google/protobuf/message.h>

#include <string>

namespace dispatch::util {

/*
  Protobuf JSON used for bus payloads and cache values.
*/

std::string ToJson(const google::protobuf::Message& message);

// Throws util::InvalidArgument when json does not parse into message.
void FromJson(const std::string& json, google::protobuf::Message* message);

} // namespace dispatch::util
