//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: detail/OutboundQueue.hpp
// Purpose: Per-client outbound message queue drained by a coroutine on a single-threaded io_context.
//==========================================================================================================
#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcplease {
namespace detail {

//==========================================================================================================
// OutboundQueue
// Purpose: Thread-safe FIFO with an awaitable wakeup.
// Notes:
//   Push/Close may be called from any thread; the wakeup is posted to the owning executor.
//   Wait() must only be awaited from that executor, and only after Pop() returned nullopt, so a
//   wakeup cannot slip in between the emptiness check and the wait.
//==========================================================================================================
class OutboundQueue : public std::enable_shared_from_this<OutboundQueue> {
public:
    OutboundQueue(boost::asio::any_io_executor ex, std::size_t maxMessages)
        : executor(ex), signal(ex), maxMessages(maxMessages) {}

    // Returns false when closed or when the queue is full (the caller drops the client).
    bool Push(std::string msg) {
        {
            std::lock_guard<std::mutex> lk(mtx);
            if (closed || queue.size() >= maxMessages) return false;
            queue.push_back(std::move(msg));
        }
        notify();
        return true;
    }

    std::optional<std::string> Pop() {
        std::lock_guard<std::mutex> lk(mtx);
        if (queue.empty()) return std::nullopt;
        std::string msg = std::move(queue.front());
        queue.pop_front();
        return msg;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lk(mtx);
            closed = true;
        }
        notify();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lk(mtx);
        return closed;
    }

    // Suspends until Push/Close or timeout. Returns false on timeout.
    boost::asio::awaitable<bool> Wait(std::chrono::milliseconds timeout) {
        boost::system::error_code ec;
        signal.expires_after(timeout);
        co_await signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        co_return ec == boost::asio::error::operation_aborted;
    }

private:
    void notify() {
        auto self = shared_from_this();
        boost::asio::post(executor, [self]() { self->signal.cancel(); });
    }

    boost::asio::any_io_executor executor;
    boost::asio::steady_timer signal;
    mutable std::mutex mtx;
    std::deque<std::string> queue;
    std::size_t maxMessages;
    bool closed{false};
};

} // namespace detail
} // namespace mcplease
