#pragma once

#include "ciforge/run/run.hpp"
#include "ciforge/util/enum.hpp"
#include "ciforge/util/id.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ciforge {

enum class StatusScope : std::uint8_t { Run, Job, Step };
BOOST_DESCRIBE_ENUM(StatusScope, Run, Job, Step)
CIFORGE_DEFINE_ENUM_SERDE(StatusScope, StatusScope::Run)

enum class OutputStream : std::uint8_t { Stdout, Stderr };
BOOST_DESCRIBE_ENUM(OutputStream, Stdout, Stderr)
CIFORGE_DEFINE_ENUM_SERDE(OutputStream, OutputStream::Stdout)

/// One state transition. `status` holds the snake_case name of the
/// RunStatus, JobStatus or StepStatus matching `scope`; steps additionally
/// report "running" when they start.
struct StatusUpdate {
  RunId run_id;
  std::string pipeline;
  StatusScope scope{StatusScope::Run};
  std::string status;
  std::chrono::system_clock::time_point timestamp{};
  std::optional<std::string> job;
  std::optional<std::string> step;
  std::optional<FailureReason> reason;
  std::optional<int> exit_code;
};

struct OutputChunk {
  RunId run_id;
  std::string job;
  std::string step;
  OutputStream stream{OutputStream::Stdout};
  std::string data;
};

} // namespace ciforge
