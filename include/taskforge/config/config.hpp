#pragma once

#include "taskforge/config/system_config.hpp"
#include "taskforge/core/error.hpp"

#include <string_view>

namespace taskforge {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  /// Parses TOML, applies TASKFORGE_* environment overrides, then validates.
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
};

} // namespace taskforge
