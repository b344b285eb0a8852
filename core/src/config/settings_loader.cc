#include "emitcore/config/settings_loader.h"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

#include "emitcore/util/yaml_to_json.h"

namespace emitcore::config {

static void SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
}

bool ParseSettingsJson(const std::string& json, emitcore::v1::HostSettings& out,
                       std::string* error) {
  google::protobuf::util::JsonParseOptions opts;
  opts.ignore_unknown_fields = false;

  emitcore::v1::HostSettings parsed;
  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, opts);
  if (!status.ok()) {
    SetError(error, "json → protobuf parse failed: " + status.ToString());
    return false;
  }

  out = std::move(parsed);
  return true;
}

bool ParseSettingsYaml(const std::string& yaml, emitcore::v1::HostSettings& out,
                       std::string* error) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    SetError(error, std::string("yaml parse error: ") + e.what());
    return false;
  }

  // An empty document means "no settings"
  if (root.IsNull()) {
    out.Clear();
    return true;
  }

  if (!root.IsMap()) {
    SetError(error, "settings document must be a mapping");
    return false;
  }

  std::stringstream json;
  util::yaml_to_json(root, json);

  return ParseSettingsJson(json.str(), out, error);
}

bool LoadSettingsFile(const std::string& path, emitcore::v1::HostSettings& out,
                      std::string* error) {
  const bool is_yaml = path.ends_with(".yaml") || path.ends_with(".yml");
  if (!is_yaml && !path.ends_with(".json")) {
    SetError(error, "unsupported settings file type (use .yaml or .json): " + path);
    return false;
  }

  std::ifstream in(path);
  if (!in) {
    SetError(error, "failed to open settings file: " + path);
    return false;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  return is_yaml ? ParseSettingsYaml(buffer.str(), out, error)
                 : ParseSettingsJson(buffer.str(), out, error);
}

}  // namespace emitcore::config
