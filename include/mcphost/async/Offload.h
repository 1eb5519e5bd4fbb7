//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Offload.h
// Purpose: Coroutine helpers bridging blocking work, Asio awaitables and std::future
//==========================================================================================================

#pragma once

#include <exception>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcphost {
namespace async {

namespace net = boost::asio;

//==========================================================================================================
// RunBlocking
// Purpose: Runs fn on a pool thread and resumes the awaiting coroutine on its own executor with the
//          result. Exceptions thrown by fn are rethrown at the co_await.
//==========================================================================================================
template <typename Fn>
net::awaitable<std::invoke_result_t<Fn&>> RunBlocking(net::thread_pool& pool, Fn fn) {
    using R = std::invoke_result_t<Fn&>;
    co_return co_await net::co_spawn(
        pool.get_executor(),
        [fn = std::move(fn)]() mutable -> net::awaitable<R> { co_return fn(); },
        net::use_awaitable);
}

//==========================================================================================================
// SpawnFuture
// Purpose: Starts an awaitable on the given executor and exposes its completion as a std::future.
//==========================================================================================================
template <typename Executor, typename T>
std::future<T> SpawnFuture(const Executor& ex, net::awaitable<T> work) {
    auto promise = std::make_shared<std::promise<T>>();
    std::future<T> fut = promise->get_future();
    if constexpr (std::is_void_v<T>) {
        net::co_spawn(ex, std::move(work), [promise](std::exception_ptr eptr) {
            if (eptr) {
                promise->set_exception(eptr);
            } else {
                promise->set_value();
            }
        });
    } else {
        net::co_spawn(ex, std::move(work), [promise](std::exception_ptr eptr, T value) {
            if (eptr) {
                promise->set_exception(eptr);
            } else {
                promise->set_value(std::move(value));
            }
        });
    }
    return fut;
}

} // namespace async
} // namespace mcphost
