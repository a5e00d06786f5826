// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file coro.hpp
 * @brief C++20 coroutine support for waku-cpp
 *
 * Every engine operation is exposed as a lazy Task. Awaiting a bridged
 * call suspends the coroutine until the engine delivers its callback. The
 * callback only stores the response; the coroutine is resumed on one of
 * the binding's resume workers (detail::resume_executor()), never on the
 * engine's callback thread. A call whose callback fires before the engine
 * function returns does not suspend at all.
 *
 * Dropping a Task that is suspended on an engine call abandons the
 * operation: the waiter is detached from its completion cell and the late
 * callback completes into the cell without resuming anything. If that
 * callback is already resuming the task on a worker, the drop waits for
 * the task to suspend again before destroying it.
 *
 * Example:
 * @code
 * waku::Task<std::string> print_version(waku::NodeHandle<waku::Initialized> &node) {
 *     std::string version = co_await node.version();
 *     co_return version;
 * }
 *
 * std::string v = waku::sync_wait(print_version(node));
 * @endcode
 */

#ifndef WAKU_CORO_HPP
#define WAKU_CORO_HPP

#include <waku/fwd.hpp>
#include <waku/error.hpp>
#include <waku/log.hpp>
#include <waku/native.hpp>
#include <waku/response.hpp>
#include <waku/detail/callback_storage.hpp>

#include <condition_variable>
#include <coroutine>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace waku {

/**
 * Simple task type for coroutines
 *
 * Represents a lazy coroutine that produces a value of type T.
 * For void tasks, use Task<void> or just Task<>.
 */
template <typename T> class Task {
  public:
    struct promise_type {
        std::variant<std::monostate, T, std::exception_ptr> result;
        std::coroutine_handle<> continuation_; /**< Caller to resume on completion */
        std::shared_ptr<detail::SuspendPoint> suspend_point =
            std::make_shared<detail::SuspendPoint>(); /**< Shared with the awaiting chain */

        Task get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() const noexcept { return false; }
            std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                if (h.promise().continuation_) {
                    return h.promise().continuation_;
                }
                return std::noop_coroutine();
            }
            void await_resume() noexcept {}
        };
        FinalAwaiter final_suspend() noexcept { return {}; }

        void return_value(T value) { result = std::move(value); }

        void unhandled_exception() { result = std::current_exception(); }
    };

    Task() = default;
    explicit Task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    Task(Task &&other) noexcept : handle_(other.handle_) { other.handle_ = nullptr; }

    Task &operator=(Task &&other) noexcept {
        if (this != &other) {
            destroy_frame();
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    ~Task() { destroy_frame(); }

    // Non-copyable
    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    /**
     * Resume the coroutine
     * @return True if coroutine is still running
     */
    bool resume() {
        if (handle_ && !handle_.done()) {
            handle_.resume();
            return !handle_.done();
        }
        return false;
    }

    /**
     * Check if coroutine is done
     */
    [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }

    /**
     * Get the result (after coroutine completes)
     *
     * This is a destructive operation: the result is moved out and
     * subsequent calls will throw std::logic_error("Task result already consumed").
     *
     * @return The value produced by co_return (moved)
     * @throws std::logic_error if the task is not complete or result was already consumed
     * @throws Any exception that was thrown in the coroutine
     */
    T get() {
        if (!handle_ || !handle_.done()) {
            throw std::logic_error("Task not complete");
        }

        auto &result = handle_.promise().result;
        if (std::holds_alternative<std::exception_ptr>(result)) {
            auto ex = std::get<std::exception_ptr>(result);
            result = std::monostate{};
            std::rethrow_exception(ex);
        }
        if (!std::holds_alternative<T>(result)) {
            throw std::logic_error("Task result already consumed");
        }
        T value = std::move(std::get<T>(result));
        result = std::monostate{};
        return value;
    }

    /**
     * Awaiter for co_await on Task
     */
    struct Awaiter {
        std::coroutine_handle<promise_type> handle;

        bool await_ready() const noexcept { return handle.done(); }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> caller) noexcept {
            if constexpr (requires { caller.promise().suspend_point; }) {
                handle.promise().suspend_point = caller.promise().suspend_point;
            }
            handle.promise().continuation_ = caller;
            return handle;
        }

        T await_resume() {
            auto &result = handle.promise().result;
            if (std::holds_alternative<std::exception_ptr>(result)) {
                auto ex = std::get<std::exception_ptr>(result);
                result = std::monostate{};
                std::rethrow_exception(ex);
            }
            if (!std::holds_alternative<T>(result)) {
                throw std::logic_error("Task result not available");
            }
            T value = std::move(std::get<T>(result));
            result = std::monostate{};
            return value;
        }
    };

    auto operator co_await() {
        if (!handle_) {
            throw std::logic_error("co_await on empty Task");
        }
        return Awaiter{handle_};
    }

  private:
    // No engine callback may resume the chain once its frames are gone
    void destroy_frame() {
        if (handle_) {
            handle_.promise().suspend_point->cancel();
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    std::coroutine_handle<promise_type> handle_;
};

/**
 * Specialization for void tasks
 */
template <> class Task<void> {
  public:
    struct promise_type {
        std::exception_ptr exception;
        std::coroutine_handle<> continuation_; /**< Caller to resume on completion */
        std::shared_ptr<detail::SuspendPoint> suspend_point =
            std::make_shared<detail::SuspendPoint>(); /**< Shared with the awaiting chain */

        Task get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() const noexcept { return false; }
            std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                if (h.promise().continuation_) {
                    return h.promise().continuation_;
                }
                return std::noop_coroutine();
            }
            void await_resume() noexcept {}
        };
        FinalAwaiter final_suspend() noexcept { return {}; }

        void return_void() {}

        void unhandled_exception() { exception = std::current_exception(); }
    };

    Task() = default;
    explicit Task(std::coroutine_handle<promise_type> h) : handle_(h) {}

    Task(Task &&other) noexcept : handle_(other.handle_) { other.handle_ = nullptr; }

    Task &operator=(Task &&other) noexcept {
        if (this != &other) {
            destroy_frame();
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    ~Task() { destroy_frame(); }

    Task(const Task &) = delete;
    Task &operator=(const Task &) = delete;

    bool resume() {
        if (handle_ && !handle_.done()) {
            handle_.resume();
            return !handle_.done();
        }
        return false;
    }

    [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }

    void get() {
        if (!handle_ || !handle_.done()) {
            throw std::logic_error("Task not complete");
        }
        if (handle_.promise().exception) {
            auto ex = handle_.promise().exception;
            handle_.promise().exception = nullptr;
            std::rethrow_exception(ex);
        }
    }

    struct Awaiter {
        std::coroutine_handle<promise_type> handle;

        bool await_ready() const noexcept { return handle.done(); }

        template <typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> caller) noexcept {
            if constexpr (requires { caller.promise().suspend_point; }) {
                handle.promise().suspend_point = caller.promise().suspend_point;
            }
            handle.promise().continuation_ = caller;
            return handle;
        }

        void await_resume() {
            if (handle.promise().exception) {
                auto ex = handle.promise().exception;
                handle.promise().exception = nullptr;
                std::rethrow_exception(ex);
            }
        }
    };

    auto operator co_await() {
        if (!handle_) {
            throw std::logic_error("co_await on empty Task");
        }
        return Awaiter{handle_};
    }

  private:
    // No engine callback may resume the chain once its frames are gone
    void destroy_frame() {
        if (handle_) {
            handle_.promise().suspend_point->cancel();
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    std::coroutine_handle<promise_type> handle_;
};

/**
 * Awaitable for one single-shot engine call
 *
 * Returned by detail::call_native(). co_await yields the Success payload,
 * or throws waku::Error (engine_failure / missing_callback).
 *
 * The invoke callable receives the C trampoline and an opaque token and
 * must return the engine's return code. Everything it references is owned
 * by the awaitable, so payload strings stay valid for the whole
 * synchronous part of the engine call.
 *
 * @warning Do NOT store NativeCall objects. They must be consumed
 * immediately via co_await.
 */
class NativeCall {
  public:
    using Invoke = std::function<int(NativeCallback, void *)>;

    NativeCall(std::string_view operation, Invoke invoke)
        : operation_(operation), invoke_(std::move(invoke)) {}

    NativeCall(const NativeCall &) = delete;
    NativeCall &operator=(const NativeCall &) = delete;
    NativeCall(NativeCall &&) = delete;
    NativeCall &operator=(NativeCall &&) = delete;

    ~NativeCall() {
        if (cell_) {
            cell_->detach();
        }
    }

    bool await_ready() const noexcept { return false; }

    template <typename Promise> bool await_suspend(std::coroutine_handle<Promise> handle) {
        auto &pool = detail::pending_calls();
        cell_ = std::make_shared<detail::CompletionCell>();
        void *token = pool.allocate(cell_);

        int rc;
        try {
            rc = invoke_(waku_detail_call_trampoline, token);
        } catch (...) {
            (void)pool.claim(token);
            throw;
        }

        if (rc == kRetMissingCallback) {
            // The engine refused the call without invoking the callback
            if (auto unclaimed = pool.claim(token)) {
                (void)unclaimed->complete(Response::missing_callback());
            }
        }
        if constexpr (requires { handle.promise().suspend_point; }) {
            handle.promise().suspend_point->set(cell_);
        }
        // If the callback already fired, don't suspend (return false)
        return cell_->arm(handle);
    }

    std::string await_resume() {
        Response response = cell_->take();
        switch (response.kind()) {
        case Response::Kind::Success:
            return response.take_text();
        case Response::Kind::Failure:
            log_emit(LogLevel::Debug, operation_, response.text());
            throw Error(Errc::engine_failure, response.text());
        case Response::Kind::MissingCallback:
            break;
        }
        log_emit(LogLevel::Error, operation_, "engine returned without invoking the callback");
        throw Error(Errc::missing_callback, operation_);
    }

  private:
    std::string operation_;
    Invoke invoke_;
    std::shared_ptr<detail::CompletionCell> cell_;
};

namespace detail {

/**
 * Bridge one single-shot engine call into an awaitable
 *
 * @param operation Name used in logs and error context
 * @param invoke Callable issuing the engine call: int(NativeCallback, void *)
 */
template <typename F> [[nodiscard]] NativeCall call_native(std::string_view operation, F &&invoke) {
    return NativeCall(operation, NativeCall::Invoke(std::forward<F>(invoke)));
}

struct SyncWaitState {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
};

/// Eager-on-resume driver coroutine that signals a SyncWaitState when it finishes
class SyncWaitDriver {
  public:
    struct promise_type {
        SyncWaitState *state = nullptr;

        SyncWaitDriver get_return_object() {
            return SyncWaitDriver{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        struct FinalAwaiter {
            bool await_ready() const noexcept { return false; }
            void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                SyncWaitState *state = h.promise().state;
                std::lock_guard<std::mutex> lock(state->mutex);
                state->done = true;
                state->cv.notify_all();
            }
            void await_resume() noexcept {}
        };
        FinalAwaiter final_suspend() noexcept { return {}; }

        void return_void() {}

        // The driver body catches everything it awaits
        void unhandled_exception() { std::terminate(); }
    };

    explicit SyncWaitDriver(std::coroutine_handle<promise_type> h) : handle_(h) {}
    SyncWaitDriver(const SyncWaitDriver &) = delete;
    SyncWaitDriver &operator=(const SyncWaitDriver &) = delete;
    ~SyncWaitDriver() {
        if (handle_) {
            handle_.destroy();
        }
    }

    void run(SyncWaitState &state) {
        handle_.promise().state = &state;
        handle_.resume();
        std::unique_lock<std::mutex> lock(state.mutex);
        state.cv.wait(lock, [&state] { return state.done; });
    }

  private:
    std::coroutine_handle<promise_type> handle_;
};

template <typename T>
SyncWaitDriver make_sync_wait_driver(Task<T> &task, std::optional<T> &value,
                                     std::exception_ptr &error) {
    try {
        value.emplace(co_await task);
    } catch (...) {
        error = std::current_exception();
    }
}

inline SyncWaitDriver make_sync_wait_driver(Task<void> &task, std::exception_ptr &error) {
    try {
        co_await task;
    } catch (...) {
        error = std::current_exception();
    }
}

} // namespace detail

/**
 * Run a task to completion, blocking the calling thread
 *
 * Intended for code outside the coroutine world (main, tests). The task
 * starts on the calling thread and may complete on a resume worker; this
 * thread only waits. Must not be called from a resume worker.
 *
 * @return The task's value
 * @throws Whatever the task threw
 */
template <typename T> T sync_wait(Task<T> task) {
    detail::SyncWaitState state;
    std::exception_ptr error;
    if constexpr (std::is_void_v<T>) {
        auto driver = detail::make_sync_wait_driver(task, error);
        driver.run(state);
        if (error) {
            std::rethrow_exception(error);
        }
    } else {
        std::optional<T> value;
        auto driver = detail::make_sync_wait_driver(task, value, error);
        driver.run(state);
        if (error) {
            std::rethrow_exception(error);
        }
        return std::move(*value);
    }
}

} // namespace waku

#endif // WAKU_CORO_HPP
