#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace geocache::config {

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string scalar_value = ConfigLoader::ExpandEnvironment(node.Scalar());

  // quoted in the source document
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigurationError("unsupported YAML node");
  }
}

geocache::runtime::config::RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  geocache::runtime::config::RuntimeConfig config;
  if (!yaml || yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw util::ConfigurationError("invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::ConfigurationError("invalid configuration: " + std::string(status.message()));
  }
  return config;
}

} // namespace

std::string ConfigLoader::ExpandEnvironment(const std::string& value) {
  std::string out;
  std::size_t pos = 0;
  while (pos < value.size()) {
    const auto open = value.find("${", pos);
    if (open == std::string::npos) {
      out.append(value, pos, std::string::npos);
      break;
    }
    const auto close = value.find('}', open + 2);
    if (close == std::string::npos) {
      throw util::ConfigurationError("unterminated ${...} in '" + value + "'");
    }
    out.append(value, pos, open - pos);

    const std::string expr  = value.substr(open + 2, close - open - 2);
    const auto        colon = expr.find(':');
    const std::string name  = expr.substr(0, colon);
    if (name.empty()) {
      throw util::ConfigurationError("empty variable name in '" + value + "'");
    }

    if (const char* env = std::getenv(name.c_str())) {
      out += env;
    } else if (colon != std::string::npos) {
      out += expr.substr(colon + 1);
    } else {
      throw util::ConfigurationError("environment variable " + name + " is not set");
    }
    pos = close + 1;
  }
  return out;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

geocache::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError("failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

geocache::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::ConfigurationError(std::string("failed to parse YAML config: ") + e.what());
  }
  return FromYamlNode(yaml);
}

} // namespace geocache::config
