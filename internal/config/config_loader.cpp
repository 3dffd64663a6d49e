#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fleet::config {
namespace {

using fleet::runtime::config::RuntimeConfig;

// Key path of the node being converted, for error messages: schedules[2].trigger.cron
class NodePath {
 public:
  explicit NodePath(std::string path = {}) : path_(std::move(path)) {
  }

  std::string Key(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
  }

  std::string Index(size_t i) const {
    return path_ + "[" + std::to_string(i) + "]";
  }

  const std::string& str() const {
    return path_;
  }

 private:
  std::string path_;
};

void ConvertNode(const YAML::Node& node, const NodePath& path, google::protobuf::Value* value);

void ConvertScalar(const YAML::Node& node, const NodePath& path, google::protobuf::Value* value) {
  std::string scalar;
  try {
    scalar = ConfigLoader::ExpandEnvironment(node.Scalar());
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument(path.str() + ": " + e.what());
  }

  if (node.Tag() == "!") {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (!scalar.empty() && end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void ConvertNode(const YAML::Node& node, const NodePath& path, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ConvertScalar(node, path, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        ConvertNode(node[i], NodePath(path.Index(i)), list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        const auto key = entry.first.Scalar();
        ConvertNode(entry.second, NodePath(path.Key(key)), &(*fields)[key]);
      }
      return;
    }
  }
  throw util::InvalidArgument(path.str() + ": unsupported YAML node");
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml, const std::string& source) {
  RuntimeConfig config;
  // empty document: all defaults
  if (yaml.IsNull() || !yaml.IsDefined()) return config;

  const std::string prefix = "Invalid configuration (" + source + "): ";
  if (!yaml.IsMap()) throw util::InvalidArgument(prefix + "top level must be a mapping");

  google::protobuf::Value document;
  try {
    ConvertNode(yaml, NodePath(), &document);
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument(prefix + e.what());
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(document, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw util::InvalidArgument(prefix + std::string(status.message()));
  }

  FLEET_LOG_DEBUG("Configuration loaded",
                  {observability::StringField("source", source),
                   observability::IntField("robots", config.robots_size()),
                   observability::IntField("calendars", config.calendars_size()),
                   observability::IntField("schedules", config.schedules_size())});
  return config;
}

} // namespace

std::string ConfigLoader::ExpandEnvironment(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  size_t pos = 0;
  while (pos < text.size()) {
    const size_t start = text.find("${", pos);
    if (start == std::string::npos) {
      out.append(text, pos, std::string::npos);
      break;
    }
    out.append(text, pos, start - pos);

    const size_t close = text.find('}', start + 2);
    if (close == std::string::npos) {
      throw util::InvalidArgument("unterminated environment reference in '" + text + "'");
    }

    std::string                name = text.substr(start + 2, close - start - 2);
    std::optional<std::string> fallback;
    if (const size_t sep = name.find(":-"); sep != std::string::npos) {
      fallback = name.substr(sep + 2);
      name.resize(sep);
    }
    if (name.empty()) {
      throw util::InvalidArgument("empty environment reference in '" + text + "'");
    }

    const char* env = std::getenv(name.c_str());
    if (env && *env) {
      out += env;
    } else if (fallback) {
      out += *fallback;
    } else {
      throw util::InvalidArgument("environment variable " + name + " is not set");
    }
    pos = close + 1;
  }
  return out;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + path + ": " + e.what());
  }
  return FromYamlNode(yaml, path);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml, "<string>");
}

} // namespace fleet::config
