#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace ciforge {

namespace detail {
class CancellationState;
} // namespace detail

/// RAII handle for a callback registered on a CancellationToken; the callback
/// is unregistered when the handle is destroyed.
class CancellationRegistration {
public:
  CancellationRegistration() = default;
  CancellationRegistration(std::shared_ptr<detail::CancellationState> state,
                           std::uint64_t id) noexcept
      : state_(std::move(state)), id_(id) {}
  ~CancellationRegistration();

  CancellationRegistration(CancellationRegistration &&other) noexcept
      : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}
  auto operator=(CancellationRegistration &&other) noexcept
      -> CancellationRegistration &;

  CancellationRegistration(const CancellationRegistration &) = delete;
  auto operator=(const CancellationRegistration &)
      -> CancellationRegistration & = delete;

  auto reset() noexcept -> void;

private:
  std::shared_ptr<detail::CancellationState> state_;
  std::uint64_t id_{0};
};

/// Observer side of a cancellation. A default-constructed token is never
/// cancelled.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  [[nodiscard]] auto is_cancelled() const noexcept -> bool;

  /// Runs `callback` once when cancellation is requested. If cancellation
  /// already happened, runs it immediately on the calling thread.
  [[nodiscard]] auto on_cancel(std::move_only_function<void()> callback) const
      -> CancellationRegistration;

private:
  std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
  CancellationSource();

  [[nodiscard]] auto token() const -> CancellationToken;
  [[nodiscard]] auto is_cancelled() const noexcept -> bool;

  /// Returns false if cancellation had already been requested.
  auto cancel() -> bool;

private:
  std::shared_ptr<detail::CancellationState> state_;
};

namespace detail {

class CancellationState {
public:
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    std::scoped_lock lock(mu_);
    return cancelled_;
  }

  auto add(std::move_only_function<void()> callback) -> std::uint64_t;
  auto remove(std::uint64_t id) noexcept -> void;
  auto cancel() -> bool;

private:
  mutable std::mutex mu_;
  bool cancelled_{false};
  std::uint64_t next_id_{1};
  std::vector<std::pair<std::uint64_t, std::move_only_function<void()>>>
      callbacks_;
};

} // namespace detail

} // namespace ciforge
