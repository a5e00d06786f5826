// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file node.hpp
 * @brief Lifecycle-tagged node handle
 *
 * A node is either Initialized or Running, and each state is a distinct
 * type. Operations that need a running node only exist on
 * NodeHandle<Running>; calling them on an Initialized handle does not
 * compile. Transitions consume the old handle:
 *
 * @code
 * auto node = co_await waku::NodeHandle<waku::Initialized>::create(engine, config);
 * auto running = co_await std::move(node).start();
 * co_await running.relay_subscribe("/waku/2/rs/16/32");
 * auto stopped = co_await std::move(running).stop();
 * co_await std::move(stopped).destroy();
 * @endcode
 *
 * Every operation is a lazy Task. It reads its handle only when it first
 * runs, up to its first engine call; from then on it holds the node
 * itself, so the handle may be moved while the call is pending. Keep the
 * handle in place until the task has started. Transitions (start, stop,
 * destroy) consume the handle and hand the node back when they finish.
 */

#ifndef WAKU_NODE_HPP
#define WAKU_NODE_HPP

#include <waku/fwd.hpp>
#include <waku/config.hpp>
#include <waku/context.hpp>
#include <waku/coro.hpp>
#include <waku/error.hpp>
#include <waku/event_stream.hpp>
#include <waku/libwaku.hpp>
#include <waku/log.hpp>
#include <waku/native.hpp>
#include <waku/response.hpp>
#include <waku/store.hpp>
#include <waku/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace waku {

/// Node has been instantiated (or stopped) but is not running
struct Initialized {};

/// Node has been started
struct Running {};

namespace detail {

/**
 * Convert a timeout to the engine's millisecond argument
 *
 * Zero or negative means no timeout (0). The comparison against INT32_MAX
 * milliseconds happens before any conversion, so durations too large for
 * std::chrono::milliseconds clamp instead of wrapping. Positive values
 * below one millisecond round up to 1.
 */
template <typename Rep, typename Period>
[[nodiscard]] int clamp_timeout_ms(std::chrono::duration<Rep, Period> timeout) noexcept {
    using FloatMs = std::chrono::duration<long double, std::milli>;
    constexpr auto kMax = std::numeric_limits<int32_t>::max();
    if (!(timeout > std::chrono::duration<Rep, Period>::zero())) {
        return 0;
    }
    if (FloatMs(timeout) >= FloatMs(kMax)) {
        return kMax;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
    return ms < 1 ? 1 : static_cast<int>(ms);
}

} // namespace detail

/**
 * Timeout argument of connect(), relay_publish() and store_query()
 *
 * Implicitly built from any std::chrono::duration and clamped on
 * construction; default-constructed or std::nullopt means no timeout.
 */
class Timeout {
  public:
    Timeout() noexcept = default;
    Timeout(std::nullopt_t) noexcept {}

    template <typename Rep, typename Period>
    Timeout(std::chrono::duration<Rep, Period> timeout) noexcept
        : ms_(detail::clamp_timeout_ms(timeout)) {}

    /// Engine argument: 0 for none, otherwise 1..INT32_MAX
    [[nodiscard]] int milliseconds() const noexcept { return ms_; }

    [[nodiscard]] bool unlimited() const noexcept { return ms_ == 0; }

  private:
    int ms_ = 0;
};

namespace detail {

/**
 * Decode the engine's listen address payload
 *
 * Accepts a JSON array of strings; anything that is not JSON is read as a
 * comma-separated list. Surrounding whitespace and empty entries are dropped.
 *
 * @throws Error(decode_failure) for JSON that is not an array of strings
 */
[[nodiscard]] inline std::vector<std::string> parse_listen_addresses(std::string_view payload) {
    auto doc = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
    if (!doc.is_discarded()) {
        if (!doc.is_array()) {
            throw Error(Errc::decode_failure, "listen addresses: expected a JSON array");
        }
        std::vector<std::string> out;
        for (const auto &entry : doc) {
            if (!entry.is_string()) {
                throw Error(Errc::decode_failure, "listen addresses: expected strings");
            }
            if (!entry.get_ref<const std::string &>().empty()) {
                out.push_back(entry.get<std::string>());
            }
        }
        return out;
    }

    std::vector<std::string> out;
    while (!payload.empty()) {
        size_t comma = payload.find(',');
        std::string_view item = payload.substr(0, comma);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
            item.remove_prefix(1);
        }
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t' ||
                                 item.back() == '\n' || item.back() == '\r')) {
            item.remove_suffix(1);
        }
        if (!item.empty()) {
            out.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        payload.remove_prefix(comma + 1);
    }
    return out;
}

[[nodiscard]] inline std::string content_topics_json(const std::vector<ContentTopic> &topics) {
    return nlohmann::json(topics).dump();
}

} // namespace detail

/**
 * Node handle in lifecycle state State
 *
 * Owns the node's NodeContext. Move-only; a moved-from handle rejects
 * every operation with Error(invalid_state).
 *
 * A handle that is dropped while it still owns a live node (neither
 * destroyed nor moved from) logs a warning and leaks the context: the
 * engine may still deliver events into it.
 *
 * @tparam State Initialized or Running
 */
template <typename State> class NodeHandle {
    static_assert(std::is_same_v<State, Initialized> || std::is_same_v<State, Running>,
                  "NodeHandle state must be Initialized or Running");

  public:
    NodeHandle(NodeHandle &&) noexcept = default;

    NodeHandle &operator=(NodeHandle &&other) noexcept {
        if (this != &other) {
            release_live_context();
            ctx_ = std::move(other.ctx_);
            config_ = std::move(other.config_);
        }
        return *this;
    }

    NodeHandle(const NodeHandle &) = delete;
    NodeHandle &operator=(const NodeHandle &) = delete;

    ~NodeHandle() { release_live_context(); }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * Instantiate a node
     *
     * The configuration is serialized once and handed to the engine.
     *
     * @param engine Engine to run the node on
     * @param config Node configuration
     * @return Initialized handle
     * @throws Error on engine failure or a missing callback
     */
    [[nodiscard]] static Task<NodeHandle> create(std::shared_ptr<NativeEngine> engine,
                                                 NodeConfig config)
        requires std::same_as<State, Initialized>
    {
        if (!engine) {
            throw Error(Errc::invalid_argument, "create: null engine");
        }
        std::string config_json = config.to_json_string();
        void *handle = nullptr;

        co_await detail::call_native("create", [&](NativeCallback cb, void *user_data) {
            handle = engine->create_node(config_json.c_str(), cb, user_data);
            // A null handle with no callback delivered means the engine refused the call
            return handle ? kRetOk : kRetMissingCallback;
        });

        if (!handle) {
            throw Error(Errc::engine_failure, "create: engine returned a null node handle");
        }
        log_emit(LogLevel::Info, "node instantiated");
        co_return NodeHandle(std::make_unique<NodeContext>(std::move(engine), handle),
                             std::move(config));
    }

    /**
     * Instantiate a node on the installed libwaku
     *
     * Requires linking waku_cpp_libwaku.
     */
    [[nodiscard]] static Task<NodeHandle> create(NodeConfig config)
        requires std::same_as<State, Initialized>
    {
        return create(libwaku_engine(), std::move(config));
    }

    /**
     * Start the node
     *
     * On failure this handle still owns the node and must be destroyed.
     */
    [[nodiscard]] Task<NodeHandle<Running>> start() &&
        requires std::same_as<State, Initialized>
    {
        void *handle = context("start").checked_handle("start");
        NativeEngine &engine = ctx_->engine();
        co_await detail::call_native("start", [&engine, handle](NativeCallback cb, void *ud) {
            return engine.start(handle, cb, ud);
        });
        log_emit(LogLevel::Info, "node started");
        co_return NodeHandle<Running>(std::move(ctx_), std::move(config_));
    }

    /**
     * Stop the node
     *
     * On failure this handle still owns the running node.
     */
    [[nodiscard]] Task<NodeHandle<Initialized>> stop() &&
        requires std::same_as<State, Running>
    {
        void *handle = context("stop").checked_handle("stop");
        NativeEngine &engine = ctx_->engine();
        co_await detail::call_native("stop", [&engine, handle](NativeCallback cb, void *ud) {
            return engine.stop(handle, cb, ud);
        });
        log_emit(LogLevel::Info, "node stopped");
        co_return NodeHandle<Initialized>(std::move(ctx_), std::move(config_));
    }

    /**
     * Tear the node down
     *
     * The handle is invalidated whether or not the engine call succeeds;
     * an engine error is rethrown afterwards.
     */
    [[nodiscard]] Task<> destroy() && {
        void *handle = context("destroy").checked_handle("destroy");
        NativeEngine &engine = ctx_->engine();

        std::exception_ptr error;
        try {
            co_await detail::call_native("destroy", [&engine, handle](NativeCallback cb, void *ud) {
                return engine.destroy(handle, cb, ud);
            });
        } catch (...) {
            error = std::current_exception();
        }

        ctx_->reset_handle();
        if (error) {
            // The engine may still hold the event slot
            log_emit(LogLevel::Warning, "destroy", "engine teardown failed, leaking node context");
            (void)ctx_.release();
            std::rethrow_exception(error);
        }
        ctx_.reset();
        log_emit(LogLevel::Info, "node destroyed");
    }

    // =========================================================================
    // Any state
    // =========================================================================

    /// Engine version string
    [[nodiscard]] Task<std::string> version() {
        void *handle = context("version").checked_handle("version");
        NativeEngine &engine = ctx_->engine();
        co_return co_await detail::call_native(
            "version",
            [&engine, handle](NativeCallback cb, void *ud) { return engine.version(handle, cb, ud); });
    }

    /// Configuration the node was created with
    [[nodiscard]] const NodeConfig &config() const noexcept { return config_; }

    /// True unless moved from or destroyed
    [[nodiscard]] bool valid() const noexcept { return ctx_ && ctx_->valid(); }

    /// Underlying context (for advanced use)
    [[nodiscard]] NodeContext &context() const { return context("context"); }

    // =========================================================================
    // Initialized only
    // =========================================================================

    /**
     * Register a plain callable as the node's event sink
     *
     * Replaces any previously registered sink, including an event stream.
     * The callable runs on engine threads and must not throw.
     *
     * @throws Error(invalid_state) on a moved-from or destroyed handle
     */
    template <typename F>
    void set_event_callback(F &&handler)
        requires std::same_as<State, Initialized> && std::invocable<F &, Response>
    {
        context("set_event_callback").set_event_handler(std::forward<F>(handler));
    }

    /**
     * Route the node's events into a new stream
     *
     * Replaces any previously registered sink. If registration fails, the
     * stream yields a single Failure response.
     */
    [[nodiscard]] EventStream event_stream()
        requires std::same_as<State, Initialized>
    {
        auto channel = std::make_shared<detail::EventChannel>();
        try {
            context("event_stream").set_event_handler(
                [channel](Response response) { channel->push(std::move(response)); });
        } catch (const Error &e) {
            channel->push(Response::failure(e.what()));
        }
        return EventStream(std::move(channel));
    }

    // =========================================================================
    // Running only
    // =========================================================================

    /// Multiaddresses the node listens on
    [[nodiscard]] Task<std::vector<std::string>> listen_addresses()
        requires std::same_as<State, Running>
    {
        void *handle = context("listen_addresses").checked_handle("listen_addresses");
        NativeEngine &engine = ctx_->engine();
        std::string payload = co_await detail::call_native(
            "listen_addresses", [&engine, handle](NativeCallback cb, void *ud) {
                return engine.listen_addresses(handle, cb, ud);
            });
        co_return detail::parse_listen_addresses(payload);
    }

    /**
     * Dial a peer
     *
     * @param address Peer multiaddress
     * @param timeout Absent or zero for no timeout; clamped to INT32_MAX ms
     */
    [[nodiscard]] Task<> connect(std::string address, Timeout timeout = {})
        requires std::same_as<State, Running>
    {
        void *handle = context("connect").checked_handle("connect");
        NativeEngine &engine = ctx_->engine();
        int timeout_ms = timeout.milliseconds();
        co_await detail::call_native("connect", [&](NativeCallback cb, void *ud) {
            return engine.connect(handle, address.c_str(), timeout_ms, cb, ud);
        });
    }

    /**
     * Publish a message over relay
     *
     * @return Hash of the published message
     * @throws Error(relay_disabled) unless relay was enabled in the configuration
     */
    [[nodiscard]] Task<MessageHash>
    relay_publish(PubsubTopic pubsub_topic, Message message, Timeout timeout = {})
        requires std::same_as<State, Running>
    {
        void *handle = relay_handle("relay_publish");
        NativeEngine &engine = ctx_->engine();
        int timeout_ms = timeout.milliseconds();
        std::string message_json = nlohmann::json(message).dump();
        std::string hash = co_await detail::call_native("relay_publish", [&](NativeCallback cb,
                                                                             void *ud) {
            return engine.relay_publish(handle, pubsub_topic.c_str(), message_json.c_str(),
                                        timeout_ms, cb, ud);
        });
        co_return MessageHash(std::move(hash));
    }

    /// @throws Error(relay_disabled) unless relay was enabled in the configuration
    [[nodiscard]] Task<> relay_subscribe(PubsubTopic pubsub_topic)
        requires std::same_as<State, Running>
    {
        void *handle = relay_handle("relay_subscribe");
        NativeEngine &engine = ctx_->engine();
        co_await detail::call_native("relay_subscribe", [&](NativeCallback cb, void *ud) {
            return engine.relay_subscribe(handle, pubsub_topic.c_str(), cb, ud);
        });
    }

    /// @throws Error(relay_disabled) unless relay was enabled in the configuration
    [[nodiscard]] Task<> relay_unsubscribe(PubsubTopic pubsub_topic)
        requires std::same_as<State, Running>
    {
        void *handle = relay_handle("relay_unsubscribe");
        NativeEngine &engine = ctx_->engine();
        co_await detail::call_native("relay_unsubscribe", [&](NativeCallback cb, void *ud) {
            return engine.relay_unsubscribe(handle, pubsub_topic.c_str(), cb, ud);
        });
    }

    [[nodiscard]] Task<> filter_subscribe(PubsubTopic pubsub_topic,
                                          std::vector<ContentTopic> content_topics)
        requires std::same_as<State, Running>
    {
        void *handle = context("filter_subscribe").checked_handle("filter_subscribe");
        NativeEngine &engine = ctx_->engine();
        std::string topics_json = detail::content_topics_json(content_topics);
        co_await detail::call_native("filter_subscribe", [&](NativeCallback cb, void *ud) {
            return engine.filter_subscribe(handle, pubsub_topic.c_str(), topics_json.c_str(), cb,
                                           ud);
        });
    }

    [[nodiscard]] Task<> filter_unsubscribe(PubsubTopic pubsub_topic,
                                            std::vector<ContentTopic> content_topics)
        requires std::same_as<State, Running>
    {
        void *handle = context("filter_unsubscribe").checked_handle("filter_unsubscribe");
        NativeEngine &engine = ctx_->engine();
        std::string topics_json = detail::content_topics_json(content_topics);
        co_await detail::call_native("filter_unsubscribe", [&](NativeCallback cb, void *ud) {
            return engine.filter_unsubscribe(handle, pubsub_topic.c_str(), topics_json.c_str(), cb,
                                             ud);
        });
    }

    [[nodiscard]] Task<> filter_unsubscribe_all()
        requires std::same_as<State, Running>
    {
        void *handle = context("filter_unsubscribe_all").checked_handle("filter_unsubscribe_all");
        NativeEngine &engine = ctx_->engine();
        co_await detail::call_native("filter_unsubscribe_all",
                                     [&engine, handle](NativeCallback cb, void *ud) {
                                         return engine.filter_unsubscribe_all(handle, cb, ud);
                                     });
    }

    /**
     * Publish a message through a light-push service node
     * @return Hash of the published message
     */
    [[nodiscard]] Task<MessageHash> lightpush_publish(PubsubTopic pubsub_topic, Message message)
        requires std::same_as<State, Running>
    {
        void *handle = context("lightpush_publish").checked_handle("lightpush_publish");
        NativeEngine &engine = ctx_->engine();
        std::string message_json = nlohmann::json(message).dump();
        std::string hash = co_await detail::call_native("lightpush_publish", [&](NativeCallback cb,
                                                                                 void *ud) {
            return engine.lightpush_publish(handle, pubsub_topic.c_str(), message_json.c_str(), cb,
                                            ud);
        });
        co_return MessageHash(std::move(hash));
    }

    /**
     * Retrieve the full history matching a query from a store peer
     *
     * Pages are requested until the peer returns no cursor. Results are
     * oldest first. The same timeout applies to every page request.
     *
     * @param query Filter and paging parameters
     * @param peer_address Multiaddress of the store peer
     * @param timeout Absent or zero for no timeout; clamped to INT32_MAX ms
     * @throws Error if any page fails; nothing is returned in that case
     */
    [[nodiscard]] Task<std::vector<StoreMessage>>
    store_query(StoreQuery query, std::string peer_address, Timeout timeout = {})
        requires std::same_as<State, Running>
    {
        void *handle = context("store_query").checked_handle("store_query");
        NativeEngine &engine = ctx_->engine();
        int timeout_ms = timeout.milliseconds();

        co_return co_await paginate<StoreMessage, MessageHash>(
            [&engine, handle, &query, &peer_address,
             timeout_ms](const std::optional<MessageHash> &cursor) {
                StoreQueryRequest request;
                request.include_data(query.include_data)
                    .pubsub_topic(query.pubsub_topic)
                    .content_topics(query.content_topics)
                    .time_start(query.time_start)
                    .time_end(query.time_end)
                    .pagination_cursor(cursor)
                    .pagination_forward(true)
                    .pagination_limit(query.page_size);
                return fetch_store_page(engine, handle, std::move(request), peer_address,
                                        timeout_ms);
            });
    }

  private:
    template <typename> friend class NodeHandle;

    NodeHandle(std::unique_ptr<NodeContext> ctx, NodeConfig config) noexcept
        : ctx_(std::move(ctx)), config_(std::move(config)) {}

    NodeContext &context(std::string_view operation) const {
        if (!ctx_) {
            throw Error(Errc::invalid_state, operation);
        }
        return *ctx_;
    }

    void *relay_handle(std::string_view operation) const {
        void *handle = context(operation).checked_handle(operation);
        if (!config_.relay_enabled()) {
            throw Error(Errc::relay_disabled, operation);
        }
        return handle;
    }

    void release_live_context() noexcept {
        if (ctx_ && ctx_->valid()) {
            log_emit(LogLevel::Warning, "node handle dropped without destroy(), leaking node context");
            (void)ctx_.release();
        }
        ctx_.reset();
    }

    static Task<Page<StoreMessage, MessageHash>> fetch_store_page(NativeEngine &engine,
                                                                  void *handle,
                                                                  StoreQueryRequest request,
                                                                  std::string peer_address,
                                                                  int timeout_ms) {
        std::string query_json = request.to_json().dump();
        std::string payload = co_await detail::call_native("store_query", [&](NativeCallback cb,
                                                                              void *ud) {
            return engine.store_query(handle, query_json.c_str(), peer_address.c_str(), timeout_ms,
                                      cb, ud);
        });
        co_return StoreResponse::parse(payload).into_page();
    }

    std::unique_ptr<NodeContext> ctx_;
    NodeConfig config_;
};

} // namespace waku

#endif // WAKU_NODE_HPP
