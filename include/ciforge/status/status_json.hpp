#pragma once

#include "ciforge/run/run.hpp"
#include "ciforge/status/status.hpp"
#include "ciforge/util/json.hpp"

namespace ciforge {

[[nodiscard]] auto to_json(const StatusUpdate &update) -> JsonValue;
[[nodiscard]] auto to_json(const OutputChunk &chunk) -> JsonValue;
[[nodiscard]] auto to_json(const RunSummary &summary) -> JsonValue;
/// Full run document, including per-job and per-step results.
[[nodiscard]] auto to_json(const Run &run, bool include_output = true)
    -> JsonValue;

} // namespace ciforge
