#pragma once

#include "ciforge/core/error.hpp"
#include "ciforge/status/status.hpp"

#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace ciforge {

class IStatusSink {
public:
  virtual ~IStatusSink() = default;

  virtual auto on_status(const StatusUpdate &update) -> void = 0;
  virtual auto on_output(const OutputChunk & /*chunk*/) -> void {}
};

/// Fans status updates and output chunks out to every registered sink.
/// Sinks are registered before publishing starts; publishing happens on the
/// scheduler strand.
class StatusReporter {
public:
  auto add_sink(std::shared_ptr<IStatusSink> sink) -> void;
  [[nodiscard]] auto sink_count() const noexcept -> std::size_t {
    return sinks_.size();
  }

  auto publish(const StatusUpdate &update) -> void;
  auto publish_output(const OutputChunk &chunk) -> void;

  auto run_changed(const Run &run) -> void;
  auto job_changed(const Run &run, const JobExecution &job) -> void;
  auto step_started(const RunId &run_id, std::string_view pipeline,
                    std::string_view job, std::string_view step) -> void;
  auto step_finished(const RunId &run_id, std::string_view pipeline,
                     std::string_view job, const StepResult &result) -> void;

private:
  std::vector<std::shared_ptr<IStatusSink>> sinks_;
};

/// Writes one log line per transition; optionally echoes output chunks.
class LogStatusSink final : public IStatusSink {
public:
  explicit LogStatusSink(bool log_output = false) : log_output_(log_output) {}

  auto on_status(const StatusUpdate &update) -> void override;
  auto on_output(const OutputChunk &chunk) -> void override;

private:
  bool log_output_;
};

/// Appends one JSON document per update or chunk to a file.
class JsonLinesStatusSink final : public IStatusSink {
  struct OpenTag {};

public:
  JsonLinesStatusSink(OpenTag, FILE *file) : file_(file) {}
  [[nodiscard]] static auto open(const std::filesystem::path &path)
      -> Result<std::shared_ptr<JsonLinesStatusSink>>;
  ~JsonLinesStatusSink() override;

  JsonLinesStatusSink(const JsonLinesStatusSink &) = delete;
  auto operator=(const JsonLinesStatusSink &) -> JsonLinesStatusSink & = delete;

  auto on_status(const StatusUpdate &update) -> void override;
  auto on_output(const OutputChunk &chunk) -> void override;

private:
  auto write_line(std::string_view line) -> void;

  std::mutex mu_;
  FILE *file_;
};

class CallbackStatusSink final : public IStatusSink {
public:
  using StatusCallback = std::move_only_function<void(const StatusUpdate &)>;
  using OutputCallback = std::move_only_function<void(const OutputChunk &)>;

  explicit CallbackStatusSink(StatusCallback on_status,
                              OutputCallback on_output = {})
      : status_cb_(std::move(on_status)), output_cb_(std::move(on_output)) {}

  auto on_status(const StatusUpdate &update) -> void override {
    if (status_cb_) {
      status_cb_(update);
    }
  }
  auto on_output(const OutputChunk &chunk) -> void override {
    if (output_cb_) {
      output_cb_(chunk);
    }
  }

private:
  StatusCallback status_cb_;
  OutputCallback output_cb_;
};

} // namespace ciforge
