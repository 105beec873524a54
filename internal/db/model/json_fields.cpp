#include "json_fields.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace geocache::db::model {

namespace {

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
void FromJson(const std::string& json, Message* message) {
  auto status = google::protobuf::util::JsonStringToMessage(json, message);
  if (!status.ok()) {
    throw std::runtime_error("json decode failed: " + std::string(status.message()));
  }
}

} // namespace

std::string EncodeFlags(const std::vector<std::string>& flags) {
  google::protobuf::ListValue list;
  for (const auto& flag : flags) {
    list.add_values()->set_string_value(flag);
  }
  return ToJson(list);
}

std::vector<std::string> DecodeFlags(const std::string& json) {
  std::vector<std::string> flags;
  if (json.empty()) return flags;

  google::protobuf::ListValue list;
  FromJson(json, &list);
  flags.reserve(static_cast<size_t>(list.values_size()));
  for (const auto& value : list.values()) {
    flags.push_back(value.string_value());
  }
  return flags;
}

std::string EncodeMetadata(const std::map<std::string, std::string>& metadata) {
  google::protobuf::Struct object;
  for (const auto& [key, value] : metadata) {
    (*object.mutable_fields())[key].set_string_value(value);
  }
  return ToJson(object);
}

std::map<std::string, std::string> DecodeMetadata(const std::string& json) {
  std::map<std::string, std::string> metadata;
  if (json.empty()) return metadata;

  google::protobuf::Struct object;
  FromJson(json, &object);
  for (const auto& [key, value] : object.fields()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kStringValue:
        metadata[key] = value.string_value();
        break;
      case google::protobuf::Value::kNullValue:
        metadata[key] = "";
        break;
      default:
        metadata[key] = ToJson(value);
        break;
    }
  }
  return metadata;
}

} // namespace geocache::db::model
