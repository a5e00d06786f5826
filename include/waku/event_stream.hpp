// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file event_stream.hpp
 * @brief Persistent engine callback exposed as an asynchronous sequence
 *
 * The engine delivers node events (received messages, connection changes)
 * through one persistent callback per node, from any thread and at any
 * rate. EventStream turns that callback into an unbounded
 * multi-producer/single-consumer channel:
 *
 * @code
 * waku::EventStream events = node.event_stream();
 * for (;;) {
 *     waku::Response r = co_await events.next();
 *     handle(waku::parse_event(r));
 * }
 * @endcode
 *
 * The stream never completes and cannot be restarted. Buffering is
 * unbounded because the engine cannot be paused.
 */

#ifndef WAKU_EVENT_STREAM_HPP
#define WAKU_EVENT_STREAM_HPP

#include <waku/fwd.hpp>
#include <waku/response.hpp>
#include <waku/detail/resume_executor.hpp>

#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace waku {

namespace detail {

/**
 * Unbounded MPSC queue of responses with one awaiting consumer
 *
 * Thread-safe for any number of producers. Pushing never resumes the
 * consumer on the producer's thread; a suspended consumer is handed to
 * the resume workers instead. Always owned by a shared_ptr.
 */
class EventChannel : public std::enable_shared_from_this<EventChannel> {
  public:
    void push(Response response) {
        bool schedule = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(response));
            if (waiter_ && !scheduled_) {
                scheduled_ = true;
                schedule = true;
            }
        }
        if (schedule) {
            resume_executor().post([self = shared_from_this()] { self->resume_consumer(); });
        }
    }

    /// @return False if an item is already queued (do not suspend)
    [[nodiscard]] bool arm(std::coroutine_handle<> waiter) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            return false;
        }
        waiter_ = waiter;
        return true;
    }

    void detach(std::coroutine_handle<> waiter) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (waiter_ == waiter) {
            waiter_ = {};
        }
    }

    [[nodiscard]] std::optional<Response> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        Response front = std::move(queue_.front());
        queue_.pop_front();
        return front;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

  private:
    void resume_consumer() {
        std::coroutine_handle<> waiter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scheduled_ = false;
            waiter = std::exchange(waiter_, {});
        }
        if (waiter) {
            waiter.resume();
        }
    }

    mutable std::mutex mutex_;
    std::deque<Response> queue_;
    std::coroutine_handle<> waiter_;
    bool scheduled_ = false;
};

/**
 * The node's single event sink
 *
 * Its address is the user_data registered with the engine and stays
 * stable for the lifetime of the owning NodeContext. Replacing the handler
 * is last-write-wins; the previous handler may still be running on another
 * thread when set() returns.
 */
class EventSlot {
  public:
    using Handler = std::function<void(Response)>;

    void set(Handler handler) {
        auto next = std::make_shared<const Handler>(std::move(handler));
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(next);
    }

    void dispatch(Response response) const {
        std::shared_ptr<const Handler> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        if (handler && *handler) {
            (*handler)(std::move(response));
        }
    }

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const Handler> handler_;
};

} // namespace detail

/**
 * Consumer end of a node's event channel
 *
 * Move-only. Only one coroutine may await next() at a time.
 */
class EventStream {
  public:
    /**
     * Awaitable returned by next()
     */
    class NextAwaitable {
      public:
        explicit NextAwaitable(std::shared_ptr<detail::EventChannel> channel)
            : channel_(std::move(channel)) {}

        NextAwaitable(const NextAwaitable &) = delete;
        NextAwaitable &operator=(const NextAwaitable &) = delete;

        ~NextAwaitable() {
            if (channel_ && waiter_) {
                channel_->detach(waiter_);
            }
        }

        bool await_ready() const noexcept { return false; }

        bool await_suspend(std::coroutine_handle<> handle) {
            waiter_ = handle;
            return channel_->arm(handle);
        }

        Response await_resume() {
            waiter_ = {};
            // Single consumer: the item that woke us cannot have been taken
            auto item = channel_->try_pop();
            return item ? std::move(*item) : Response::missing_callback();
        }

      private:
        std::shared_ptr<detail::EventChannel> channel_;
        std::coroutine_handle<> waiter_;
    };

    explicit EventStream(std::shared_ptr<detail::EventChannel> channel)
        : channel_(std::move(channel)) {}

    EventStream(EventStream &&) noexcept = default;
    EventStream &operator=(EventStream &&) noexcept = default;
    EventStream(const EventStream &) = delete;
    EventStream &operator=(const EventStream &) = delete;

    /// Wait for the next event; suspends while the channel is empty
    [[nodiscard]] NextAwaitable next() { return NextAwaitable(channel_); }

    /// Take the next event without waiting
    [[nodiscard]] std::optional<Response> try_next() { return channel_->try_pop(); }

    /// Number of events received but not yet consumed
    [[nodiscard]] size_t buffered() const { return channel_->size(); }

  private:
    std::shared_ptr<detail::EventChannel> channel_;
};

} // namespace waku

/**
 * C callback trampoline for the persistent event callback
 *
 * user_data is the node's detail::EventSlot. Handlers must not throw.
 */
extern "C" inline void waku_detail_event_trampoline(int ret, const char *msg, size_t len,
                                                    void *user_data) {
    auto *slot = static_cast<const waku::detail::EventSlot *>(user_data);
    if (!slot) {
        return;
    }
    try {
        slot->dispatch(waku::Response::from_native(ret, msg, len));
    } catch (...) {
        // Exceptions cannot propagate through extern "C" (UB)
        std::terminate();
    }
}

#endif // WAKU_EVENT_STREAM_HPP
