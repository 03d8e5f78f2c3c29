#include "taskweave/config/config.hpp"

#include "taskweave/config/yaml_utils.hpp"
#include "taskweave/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<taskweave::DocumentConfig> {
  static bool decode(const Node& node, taskweave::DocumentConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.path = taskweave::yaml_get_or<std::string>(node, "path",
                                                 "tasks/tasks.json");
    d.backup = taskweave::yaml_get_or(node, "backup", false);
    return true;
  }
};

template <>
struct convert<taskweave::ReferenceConfig> {
  static bool decode(const Node& node, taskweave::ReferenceConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.sibling_shorthand = taskweave::yaml_get_or(node, "sibling_shorthand", false);
    r.sibling_limit =
        taskweave::yaml_get_or<taskweave::NodeId>(node, "sibling_limit", 100);
    return true;
  }
};

template <>
struct convert<taskweave::RepairConfig> {
  static bool decode(const Node& node, taskweave::RepairConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.remove_duplicates = taskweave::yaml_get_or(node, "remove_duplicates", true);
    return true;
  }
};

template <>
struct convert<taskweave::LogConfig> {
  static bool decode(const Node& node, taskweave::LogConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = taskweave::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<taskweave::EngineConfig> {
  static bool decode(const Node& node, taskweave::EngineConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto document = node["document"]) {
      c.document = document.as<taskweave::DocumentConfig>();
    }
    if (auto references = node["references"]) {
      c.references = references.as<taskweave::ReferenceConfig>();
    }
    if (auto repair = node["repair"]) {
      c.repair = repair.as<taskweave::RepairConfig>();
    }
    if (auto log = node["log"]) {
      c.log = log.as<taskweave::LogConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace taskweave {

namespace {

const EngineConfig kDefaults{};

void to_yaml(YAML::Emitter& out, const DocumentConfig& d) {
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "path", d.path, kDefaults.document.path);
  yaml_emit_if_changed(out, "backup", d.backup, kDefaults.document.backup);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ReferenceConfig& r) {
  out << YAML::BeginMap;
  yaml_emit_if_changed(out, "sibling_shorthand", r.sibling_shorthand,
                       kDefaults.references.sibling_shorthand);
  yaml_emit_if_changed(out, "sibling_limit", r.sibling_limit,
                       kDefaults.references.sibling_limit);
  out << YAML::EndMap;
}

[[nodiscard]] auto differs(const DocumentConfig& d) -> bool {
  return d.path != kDefaults.document.path ||
         d.backup != kDefaults.document.backup;
}

[[nodiscard]] auto differs(const ReferenceConfig& r) -> bool {
  return r.sibling_shorthand != kDefaults.references.sibling_shorthand ||
         r.sibling_limit != kDefaults.references.sibling_limit;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<EngineConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<EngineConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      // An empty file selects every default
      return ok(EngineConfig{});
    }
    if (!root.IsMap()) {
      log::error("Config root must be a mapping");
      return fail(Error::ParseError);
    }
    EngineConfig config = root.as<EngineConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto ConfigLoader::to_string(const EngineConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  if (differs(config.document)) {
    out << YAML::Key << "document" << YAML::Value;
    to_yaml(out, config.document);
  }
  if (differs(config.references)) {
    out << YAML::Key << "references" << YAML::Value;
    to_yaml(out, config.references);
  }
  if (config.repair.remove_duplicates != kDefaults.repair.remove_duplicates) {
    out << YAML::Key << "repair" << YAML::Value << YAML::BeginMap;
    yaml_emit(out, "remove_duplicates", config.repair.remove_duplicates);
    out << YAML::EndMap;
  }
  if (config.log.level != kDefaults.log.level) {
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    yaml_emit(out, "level", config.log.level);
    out << YAML::EndMap;
  }

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace taskweave
