#pragma once

#include "ciforge/core/error.hpp"
#include "ciforge/util/log.hpp"

#include <glaze/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

// Shared by the system config, pipeline definitions and `run --event-file`.
namespace ciforge::toml_util {

// FileNotFound for anything that cannot be opened.
[[nodiscard]] inline auto read_file(const std::filesystem::path &path)
    -> Result<std::string> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return fail(Error::FileNotFound);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return ok(std::move(contents).str());
}

/// Reads TOML `text` into the glaze-described raw struct `Raw`. Keys `Raw`
/// does not declare are skipped. On failure `diagnostic` gets glaze's
/// message with the offending line.
template <typename Raw>
[[nodiscard]] auto parse_toml(std::string_view text,
                              std::string *diagnostic = nullptr)
    -> Result<Raw> {
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  Raw raw{};
  if (auto ec = glz::read<kOpts>(raw, text)) {
    std::string detail = glz::format_error(ec, text);
    log::debug("TOML parse error: {}", detail);
    if (diagnostic != nullptr) {
      *diagnostic = std::move(detail);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

} // namespace ciforge::toml_util
