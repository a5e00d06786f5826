// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file context.hpp
 * @brief Owner of one native node handle
 */

#ifndef WAKU_CONTEXT_HPP
#define WAKU_CONTEXT_HPP

#include <waku/fwd.hpp>
#include <waku/error.hpp>
#include <waku/event_stream.hpp>
#include <waku/native.hpp>

#include <atomic>
#include <memory>
#include <string_view>
#include <utility>

namespace waku {

/**
 * Node context
 *
 * Holds the opaque handle returned by the engine, the engine itself and
 * the node's single event slot. Non-copyable and non-movable: the engine
 * keeps the event slot's address as user_data, so the context is owned
 * through std::unique_ptr and shared only by reference.
 *
 * The handle is read by every operation and written only by construction
 * and reset_handle().
 */
class NodeContext {
  public:
    /**
     * @param engine Engine that produced the handle
     * @param handle Handle returned by NativeEngine::create_node()
     */
    NodeContext(std::shared_ptr<NativeEngine> engine, void *handle) noexcept
        : engine_(std::move(engine)), handle_(handle) {}

    NodeContext(const NodeContext &) = delete;
    NodeContext &operator=(const NodeContext &) = delete;
    NodeContext(NodeContext &&) = delete;
    NodeContext &operator=(NodeContext &&) = delete;

    /**
     * Get the native handle
     * @return Handle, or nullptr after reset_handle()
     */
    [[nodiscard]] void *handle() const noexcept { return handle_.load(std::memory_order_acquire); }

    /**
     * Get the native handle for an operation
     * @throws Error(invalid_state) if the handle was invalidated
     */
    [[nodiscard]] void *checked_handle(std::string_view operation) const {
        void *h = handle();
        if (!h) {
            throw Error(Errc::invalid_state, operation);
        }
        return h;
    }

    [[nodiscard]] NativeEngine &engine() const noexcept { return *engine_; }

    /// Invalidate the handle; every later operation is rejected
    void reset_handle() noexcept { handle_.store(nullptr, std::memory_order_release); }

    [[nodiscard]] bool valid() const noexcept { return handle() != nullptr; }

    /**
     * Register the node's event handler
     *
     * Replaces the previously registered handler (single subscriber).
     *
     * @throws Error(invalid_state) if the handle was invalidated
     */
    void set_event_handler(detail::EventSlot::Handler handler) {
        void *h = checked_handle("set_event_callback");
        events_.set(std::move(handler));
        engine_->set_event_callback(h, waku_detail_event_trampoline, &events_);
    }

  private:
    std::shared_ptr<NativeEngine> engine_;
    std::atomic<void *> handle_;
    detail::EventSlot events_;
};

} // namespace waku

#endif // WAKU_CONTEXT_HPP
