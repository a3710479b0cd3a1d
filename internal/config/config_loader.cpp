#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace stagesync::config {

namespace cfg = stagesync::runtime::config;

namespace {

google::protobuf::Value ToValue(const YAML::Node& node);

google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const std::string&      text = node.Scalar();

  // Quoted scalars carry the non-specific tag "!" and are always strings.
  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }
  if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end && *end == '\0') {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      break;
    case YAML::NodeType::Scalar:
      value = ScalarToValue(node);
      break;
    case YAML::NodeType::Sequence: {
      auto* list = value.mutable_list_value();
      for (const auto& item : node) *list->add_values() = ToValue(item);
      break;
    }
    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) fields[entry.first.Scalar()] = ToValue(entry.second);
      break;
    }
    default:
      throw std::runtime_error("Unsupported YAML node");
  }
  return value;
}

// ------------------------------------------------------------
// Environment and validation
// ------------------------------------------------------------

void ApplyEnvironment(cfg::RuntimeConfig& config) {
  if (const char* value = std::getenv("STAGESYNC_BIND_ADDRESS")) config.mutable_server()->set_bind_address(value);
  if (const char* value = std::getenv("STAGESYNC_EVENT_ID")) config.mutable_event()->set_event_id(value);
  if (const char* value = std::getenv("STAGESYNC_PERFORMANCE_DATE")) config.mutable_event()->set_performance_date(value);
}

bool IsCalendarDate(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
  }
  const int month = std::stoi(text.substr(5, 2));
  const int day   = std::stoi(text.substr(8, 2));
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

void ValidateStore(const char* name, const cfg::DocumentStoreConfig& store) {
  if (store.has_object() && store.object().root_path().empty()) {
    throw std::runtime_error(std::string("Invalid configuration: storage.") + name + ".object.root_path is required");
  }
}

void Validate(const cfg::RuntimeConfig& config) {
  const auto& event = config.event();
  if (event.event_id().find('/') != std::string::npos) {
    throw std::runtime_error("Invalid configuration: event.event_id must not contain '/'");
  }
  if (!event.performance_date().empty() && !IsCalendarDate(event.performance_date())) {
    throw std::runtime_error("Invalid configuration: event.performance_date must be YYYY-MM-DD, got " + event.performance_date());
  }
  if (!event.performance_date().empty() && event.event_id().empty()) {
    throw std::runtime_error("Invalid configuration: event.performance_date requires event.event_id");
  }
  ValidateStore("local", config.storage().local());
  ValidateStore("cloud", config.storage().cloud());
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cfg::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  cfg::RuntimeConfig config;
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
    }

    std::string json;
    auto        to_json = google::protobuf::util::MessageToJsonString(ToValue(yaml), &json);
    if (!to_json.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;
    auto parsed                   = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!parsed.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(parsed.message()));
    }
  }

  ApplyEnvironment(config);
  Validate(config);
  return config;
}

} // namespace stagesync::config
