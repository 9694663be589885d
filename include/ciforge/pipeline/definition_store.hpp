#pragma once

#include "ciforge/core/error.hpp"
#include "ciforge/pipeline/pipeline_definition.hpp"

#include <ankerl/unordered_dense.h>

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

struct DefinitionLoadFailure {
  std::string file;
  std::error_code error;
  std::string diagnostic;
};

/// Named set of validated pipeline definitions. Readers may run on any
/// thread; a reload swaps definitions without disturbing runs that already
/// hold the previous ones.
class DefinitionStore {
public:
  using DefinitionPtr = std::shared_ptr<const PipelineDefinition>;

  /// Loads every `*.toml` in `directory`. Invalid files are reported in
  /// failures() and skipped; a missing directory is FileNotFound.
  [[nodiscard]] auto load_directory(const std::filesystem::path &directory)
      -> Result<std::size_t>;

  /// Adds or replaces the definition with the same name.
  auto put(DefinitionPtr definition) -> void;

  [[nodiscard]] auto get(std::string_view name) const -> Result<DefinitionPtr>;
  [[nodiscard]] auto all() const -> std::vector<DefinitionPtr>;
  [[nodiscard]] auto matching(const TriggerEvent &event) const
      -> std::vector<DefinitionPtr>;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto failures() const -> std::vector<DefinitionLoadFailure>;

private:
  mutable std::shared_mutex mu_;
  ankerl::unordered_dense::map<std::string, DefinitionPtr> definitions_;
  std::vector<DefinitionLoadFailure> failures_;
};

} // namespace ciforge
