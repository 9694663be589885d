#pragma once

#include "ciforge/config/system_config.hpp"
#include "ciforge/core/error.hpp"

#include <filesystem>
#include <string_view>

namespace ciforge {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(const std::filesystem::path &path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  /// Defaults plus CIFORGE_* environment overrides, for runs without a
  /// config file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;
};

} // namespace ciforge
