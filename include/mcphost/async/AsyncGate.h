//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AsyncGate.h
// Purpose: FIFO asynchronous mutex for coroutines running on one io_context thread
//==========================================================================================================

#pragma once

#include <chrono>
#include <deque>
#include <memory>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcphost {
namespace async {

namespace net = boost::asio;

//==========================================================================================================
// AsyncGate
// Purpose: At most one holder at a time; waiters park on a timer that Release() cancels.
// Notes:
//   Not thread-safe by itself. All Acquire/Release calls must run on the same single-threaded executor.
//   Ownership passes directly to the woken waiter, so no barging is possible.
//==========================================================================================================
class AsyncGate {
public:
    class Holder {
    public:
        explicit Holder(AsyncGate* g) : gate(g) {}
        Holder(Holder&& other) noexcept : gate(other.gate) { other.gate = nullptr; }
        Holder(const Holder&) = delete;
        Holder& operator=(const Holder&) = delete;
        Holder& operator=(Holder&&) = delete;
        ~Holder() {
            if (gate) {
                gate->Release();
            }
        }
    private:
        AsyncGate* gate;
    };

    net::awaitable<Holder> Acquire() {
        if (!busy) {
            busy = true;
            co_return Holder(this);
        }
        auto timer = std::make_shared<net::steady_timer>(co_await net::this_coro::executor,
                                                         net::steady_timer::time_point::max());
        waiters.push_back(timer);
        boost::system::error_code ec;
        co_await timer->async_wait(net::redirect_error(net::use_awaitable, ec));
        // Woken by Release(): ownership was handed over without clearing busy
        co_return Holder(this);
    }

    bool Busy() const { return busy; }

private:
    void Release() {
        if (waiters.empty()) {
            busy = false;
            return;
        }
        auto next = waiters.front();
        waiters.pop_front();
        next->cancel();
    }

    bool busy{false};
    std::deque<std::shared_ptr<net::steady_timer>> waiters;
};

} // namespace async
} // namespace mcphost
