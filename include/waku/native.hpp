// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file native.hpp
 * @brief Abstract interface to the native Waku node engine
 *
 * Mirrors the libwaku C API one method per entry point. Every
 * single-shot method takes a C callback plus an opaque user_data pointer
 * and must invoke the callback exactly once, either before returning or
 * later from any thread. set_event_callback() registers a persistent
 * callback that may fire any number of times for the node lifetime.
 *
 * The production implementation is returned by waku::libwaku_engine();
 * tests substitute their own.
 */

#ifndef WAKU_NATIVE_HPP
#define WAKU_NATIVE_HPP

#include <cstddef>

namespace waku {

/// Engine callback: (return code, message bytes, message length, user data)
extern "C" {
typedef void (*NativeCallback)(int ret, const char *msg, size_t len, void *user_data);
}

/// Return codes shared by the engine's function returns and callbacks
inline constexpr int kRetOk = 0;
inline constexpr int kRetErr = 1;
inline constexpr int kRetMissingCallback = 2;

/**
 * Native node engine
 *
 * Node handles are opaque `void *` values produced by create_node().
 * Implementations must be thread-safe: calls for different handles, and
 * concurrent calls for the same handle, may arrive from any thread.
 */
class NativeEngine {
  public:
    virtual ~NativeEngine() = default;

    /**
     * Instantiate a node from a JSON configuration document
     * @return Node handle, or nullptr on failure
     */
    virtual void *create_node(const char *config_json, NativeCallback cb, void *user_data) = 0;

    virtual int start(void *node, NativeCallback cb, void *user_data) = 0;
    virtual int stop(void *node, NativeCallback cb, void *user_data) = 0;
    virtual int destroy(void *node, NativeCallback cb, void *user_data) = 0;
    virtual int version(void *node, NativeCallback cb, void *user_data) = 0;
    virtual int listen_addresses(void *node, NativeCallback cb, void *user_data) = 0;

    /**
     * Dial a peer
     * @param timeout_ms Milliseconds, 0 = no timeout
     */
    virtual int connect(void *node, const char *address, int timeout_ms, NativeCallback cb,
                        void *user_data) = 0;

    /// Register the persistent event callback (replaces any previous one)
    virtual void set_event_callback(void *node, NativeCallback cb, void *user_data) = 0;

    virtual int relay_publish(void *node, const char *pubsub_topic, const char *message_json,
                              int timeout_ms, NativeCallback cb, void *user_data) = 0;
    virtual int relay_subscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                                void *user_data) = 0;
    virtual int relay_unsubscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                                  void *user_data) = 0;

    /// @param content_topics_json JSON array of content topic strings
    virtual int filter_subscribe(void *node, const char *pubsub_topic,
                                 const char *content_topics_json, NativeCallback cb,
                                 void *user_data) = 0;
    virtual int filter_unsubscribe(void *node, const char *pubsub_topic,
                                   const char *content_topics_json, NativeCallback cb,
                                   void *user_data) = 0;
    virtual int filter_unsubscribe_all(void *node, NativeCallback cb, void *user_data) = 0;

    virtual int lightpush_publish(void *node, const char *pubsub_topic, const char *message_json,
                                  NativeCallback cb, void *user_data) = 0;

    /**
     * Issue one store query page request
     * @param query_json StoreQueryRequest document
     * @param peer_address Multiaddress of the store peer
     * @param timeout_ms Milliseconds, 0 = no timeout
     */
    virtual int store_query(void *node, const char *query_json, const char *peer_address,
                            int timeout_ms, NativeCallback cb, void *user_data) = 0;
};

} // namespace waku

#endif // WAKU_NATIVE_HPP
