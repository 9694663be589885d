#pragma once

#include "ciforge/core/error.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace ciforge {

/// Parses and statically validates TOML pipeline definitions.
///
/// Malformed TOML fails with ParseError; a well-formed file that breaks a
/// structural rule fails with ValidationError. When `diagnostic` is given it
/// receives every human-readable problem, one per line.
class DefinitionLoader {
public:
  [[nodiscard]] static auto load(std::string_view toml_text,
                                 std::string *diagnostic = nullptr)
      -> Result<PipelineDefinition>;

  /// Like load(); a definition without `name` is named after the file stem.
  [[nodiscard]] static auto load_from_file(const std::filesystem::path &path,
                                           std::string *diagnostic = nullptr)
      -> Result<PipelineDefinition>;

  [[nodiscard]] static auto load_shared(std::string_view toml_text,
                                        std::string *diagnostic = nullptr)
      -> Result<std::shared_ptr<const PipelineDefinition>>;
};

} // namespace ciforge
