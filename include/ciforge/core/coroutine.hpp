#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ciforge {

/// Step processes, runner leases, scheduler hops and HTTP handlers are all
/// coroutines on the shared runtime.
template <typename T = void> using task = boost::asio::awaitable<T>;

// Top-level coroutine handed to Runtime::spawn or spawn_on.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::use_awaitable;

} // namespace ciforge
