#include "ciforge/pipeline/definition_store.hpp"

#include "ciforge/pipeline/definition_loader.hpp"
#include "ciforge/util/log.hpp"

#include <algorithm>
#include <mutex>
#include <system_error>

namespace ciforge {

auto DefinitionStore::load_directory(const std::filesystem::path &directory)
    -> Result<std::size_t> {
  std::error_code fs_ec;
  if (!std::filesystem::is_directory(directory, fs_ec)) {
    log::warn("Pipeline directory does not exist: {}", directory.string());
    return fail(Error::FileNotFound);
  }

  std::vector<std::filesystem::path> files;
  for (const auto &entry :
       std::filesystem::directory_iterator(directory, fs_ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".toml") {
      files.push_back(entry.path());
    }
  }
  if (fs_ec) {
    log::error("Cannot list {}: {}", directory.string(), fs_ec.message());
    return fail(Error::FileNotFound);
  }
  std::ranges::sort(files);

  ankerl::unordered_dense::map<std::string, DefinitionPtr> loaded;
  std::vector<DefinitionLoadFailure> failures;
  for (const auto &path : files) {
    std::string diagnostic;
    auto def = DefinitionLoader::load_from_file(path, &diagnostic);
    if (!def) {
      log::warn("Skipping pipeline {}: {}", path.string(),
                def.error().message());
      failures.push_back({path.string(), def.error(), std::move(diagnostic)});
      continue;
    }
    if (loaded.contains(def->name)) {
      log::warn("Skipping pipeline {}: name '{}' already defined",
                path.string(), def->name);
      failures.push_back({path.string(), make_error_code(Error::ValidationError),
                          "duplicate pipeline name '" + def->name + "'"});
      continue;
    }
    auto name = def->name;
    loaded.emplace(std::move(name),
                   std::make_shared<const PipelineDefinition>(std::move(*def)));
  }

  const auto count = loaded.size();
  {
    std::unique_lock lock(mu_);
    definitions_ = std::move(loaded);
    failures_ = std::move(failures);
  }
  log::info("Loaded {} pipeline(s) from {}", count, directory.string());
  return ok(count);
}

auto DefinitionStore::put(DefinitionPtr definition) -> void {
  std::unique_lock lock(mu_);
  auto name = definition->name;
  definitions_.insert_or_assign(std::move(name), std::move(definition));
}

auto DefinitionStore::get(std::string_view name) const
    -> Result<DefinitionPtr> {
  std::shared_lock lock(mu_);
  auto it = definitions_.find(std::string(name));
  if (it == definitions_.end()) {
    return fail(Error::NotFound);
  }
  return ok(it->second);
}

auto DefinitionStore::all() const -> std::vector<DefinitionPtr> {
  std::vector<DefinitionPtr> out;
  {
    std::shared_lock lock(mu_);
    out.reserve(definitions_.size());
    for (const auto &[name, def] : definitions_) {
      out.push_back(def);
    }
  }
  std::ranges::sort(out, {}, [](const DefinitionPtr &d) -> const std::string & {
    return d->name;
  });
  return out;
}

auto DefinitionStore::matching(const TriggerEvent &event) const
    -> std::vector<DefinitionPtr> {
  auto defs = all();
  std::erase_if(defs, [&](const DefinitionPtr &d) { return !d->matches(event); });
  return defs;
}

auto DefinitionStore::size() const -> std::size_t {
  std::shared_lock lock(mu_);
  return definitions_.size();
}

auto DefinitionStore::failures() const -> std::vector<DefinitionLoadFailure> {
  std::shared_lock lock(mu_);
  return failures_;
}

} // namespace ciforge
