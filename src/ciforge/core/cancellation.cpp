#include "ciforge/core/cancellation.hpp"

#include <algorithm>

namespace ciforge {

namespace detail {

auto CancellationState::add(std::move_only_function<void()> callback)
    -> std::uint64_t {
  {
    std::scoped_lock lock(mu_);
    if (!cancelled_) {
      const auto id = next_id_++;
      callbacks_.emplace_back(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

auto CancellationState::remove(std::uint64_t id) noexcept -> void {
  std::scoped_lock lock(mu_);
  std::erase_if(callbacks_, [id](const auto &entry) { return entry.first == id; });
}

auto CancellationState::cancel() -> bool {
  decltype(callbacks_) pending;
  {
    std::scoped_lock lock(mu_);
    if (cancelled_) {
      return false;
    }
    cancelled_ = true;
    pending.swap(callbacks_);
  }
  // Callbacks run outside the lock; they may register or drop other
  // registrations on this state.
  for (auto &[id, callback] : pending) {
    callback();
  }
  return true;
}

} // namespace detail

CancellationRegistration::~CancellationRegistration() { reset(); }

auto CancellationRegistration::operator=(
    CancellationRegistration &&other) noexcept -> CancellationRegistration & {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = std::exchange(other.id_, 0);
  }
  return *this;
}

auto CancellationRegistration::reset() noexcept -> void {
  if (state_ && id_ != 0) {
    state_->remove(id_);
  }
  state_.reset();
  id_ = 0;
}

auto CancellationToken::is_cancelled() const noexcept -> bool {
  return state_ && state_->is_cancelled();
}

auto CancellationToken::on_cancel(std::move_only_function<void()> callback) const
    -> CancellationRegistration {
  if (!state_) {
    return {};
  }
  const auto id = state_->add(std::move(callback));
  if (id == 0) {
    return {};
  }
  return {state_, id};
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

auto CancellationSource::token() const -> CancellationToken {
  return CancellationToken{state_};
}

auto CancellationSource::is_cancelled() const noexcept -> bool {
  return state_->is_cancelled();
}

auto CancellationSource::cancel() -> bool { return state_->cancel(); }

} // namespace ciforge
