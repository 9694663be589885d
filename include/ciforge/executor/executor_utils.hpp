#pragma once

#include "ciforge/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace ciforge {

/// Truncate a command string for log preview (max 80 chars, first line).
[[nodiscard]] inline auto cmd_preview(std::string_view cmd) -> std::string {
  auto first_line = cmd.substr(0, cmd.find('\n'));
  if (first_line.size() <= 80 && first_line.size() == cmd.size())
    return std::string(first_line);
  return std::string(first_line.substr(0, 80)) + "...";
}

/// Validate an environment variable key (POSIX: [A-Za-z_][A-Za-z0-9_]*).
[[nodiscard]] inline auto is_valid_env_key(std::string_view key) -> bool {
  if (key.empty())
    return false;
  if (!std::isalpha(static_cast<unsigned char>(key[0])) && key[0] != '_')
    return false;
  return std::ranges::all_of(key, [](char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_';
  });
}

/// Split an `exec` step command into argv. Whitespace separates words;
/// single quotes are literal, double quotes allow `\"` and `\\` escapes,
/// and a backslash outside quotes escapes the next character.
/// Fails with InvalidArgument on unterminated quotes or an empty result.
[[nodiscard]] auto split_command_line(std::string_view command)
    -> Result<std::vector<std::string>>;

} // namespace ciforge
