#pragma once

#include "taskweave/config/engine_config.hpp"
#include "taskweave/core/error.hpp"

#include <string>
#include <string_view>

namespace taskweave {

using Config = EngineConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<EngineConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<EngineConfig>;
  // Emits only values that differ from the defaults.
  [[nodiscard]] static auto to_string(const EngineConfig& config)
      -> std::string;
};

}  // namespace taskweave
