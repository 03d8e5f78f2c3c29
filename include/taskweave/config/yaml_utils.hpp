#pragma once

#include <yaml-cpp/yaml.h>

#include <string>
#include <string_view>

namespace taskweave {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || field.IsNull()) {
    return default_val;
  }
  return field.as<T>();
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

template <typename T>
void yaml_emit_if_changed(YAML::Emitter& out, std::string_view key,
                          const T& value, const T& default_val) {
  if (value != default_val) {
    yaml_emit(out, key, value);
  }
}

}  // namespace taskweave
