#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ciforge {

// Completion token that yields `(error_code, results...)` instead of
// throwing; pipe reads, process waits and timers check the code themselves.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

// `a && b && c` joins a step's pipe readers with its process wait; the job
// deadline is a separate timer that kills the process group.
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

} // namespace ciforge
