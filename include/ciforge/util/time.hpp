#pragma once

#include <chrono>
#include <format>
#include <string>

namespace ciforge::util {

// ISO 8601 UTC with milliseconds; empty for an unset time point.
[[nodiscard]] inline auto
format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
  if (tp == std::chrono::system_clock::time_point{})
    return {};
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

// Human-readable duration: "850ms", "12.3s", "4m05s".
[[nodiscard]] inline auto format_duration(std::chrono::milliseconds d)
    -> std::string {
  const auto ms = d.count();
  if (ms < 1000) {
    return std::format("{}ms", ms);
  }
  if (ms < 60'000) {
    return std::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
  }
  return std::format("{}m{:02}s", ms / 60'000, (ms % 60'000) / 1000);
}

} // namespace ciforge::util
