#pragma once
#include "batch.pb.h"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

namespace lfly::wire {

template <class Message> std::string to_json(const Message &msg) {
  using namespace google::protobuf::util;
  JsonPrintOptions print_options;
  print_options.add_whitespace = false;
  print_options.preserve_proto_field_names = true;

  std::string ret;
  if (!MessageToJsonString(msg, &ret, print_options).ok()) {
    throw std::runtime_error("cannot convert protobuf to json");
  }
  return ret;
}

// Unknown fields are ignored.
template <class Message> void from_json(const std::string &data, Message &dest) {
  using namespace google::protobuf::util;
  JsonParseOptions parse_options;
  parse_options.ignore_unknown_fields = true;

  const auto status = JsonStringToMessage(data, &dest, parse_options);
  if (!status.ok()) {
    throw std::runtime_error("cannot convert json to protobuf: " + status.ToString());
  }
}

} // namespace lfly::wire
