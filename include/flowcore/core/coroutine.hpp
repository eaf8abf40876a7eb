#pragma once

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace flowcore {

// Runner invocations, step bodies and the scheduler tick are all asio
// coroutines.
template <typename T = void> using task = boost::asio::awaitable<T>;

// Step and loop coroutines are spawned with a completion handler and never
// awaited directly.
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;

// Timer and process waits report errors as a tuple element instead of
// throwing, so a cancelled wait reads as an error code.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

} // namespace flowcore
