// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file libwaku_engine.cpp
 * @brief NativeEngine forwarding to the libwaku C API
 */

#include <waku/libwaku.hpp>
#include <waku/native.hpp>

extern "C" {
#include <libwaku.h>
}

#include <memory>

namespace waku {

namespace {

// Timeouts arrive already clamped to [0, INT32_MAX]
unsigned int to_unsigned_ms(int timeout_ms) {
    return timeout_ms > 0 ? static_cast<unsigned int>(timeout_ms) : 0u;
}

class LibwakuEngine final : public NativeEngine {
  public:
    void *create_node(const char *config_json, NativeCallback cb, void *user_data) override {
        return waku_new(config_json, cb, user_data);
    }

    int start(void *node, NativeCallback cb, void *user_data) override {
        return waku_start(node, cb, user_data);
    }

    int stop(void *node, NativeCallback cb, void *user_data) override {
        return waku_stop(node, cb, user_data);
    }

    int destroy(void *node, NativeCallback cb, void *user_data) override {
        return waku_destroy(node, cb, user_data);
    }

    int version(void *node, NativeCallback cb, void *user_data) override {
        return waku_version(node, cb, user_data);
    }

    int listen_addresses(void *node, NativeCallback cb, void *user_data) override {
        return waku_listen_addresses(node, cb, user_data);
    }

    int connect(void *node, const char *address, int timeout_ms, NativeCallback cb,
                void *user_data) override {
        return waku_connect(node, address, to_unsigned_ms(timeout_ms), cb, user_data);
    }

    void set_event_callback(void *node, NativeCallback cb, void *user_data) override {
        waku_set_event_callback(node, cb, user_data);
    }

    int relay_publish(void *node, const char *pubsub_topic, const char *message_json,
                      int timeout_ms, NativeCallback cb, void *user_data) override {
        return waku_relay_publish(node, pubsub_topic, message_json, to_unsigned_ms(timeout_ms), cb,
                                  user_data);
    }

    int relay_subscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                        void *user_data) override {
        return waku_relay_subscribe(node, pubsub_topic, cb, user_data);
    }

    int relay_unsubscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                          void *user_data) override {
        return waku_relay_unsubscribe(node, pubsub_topic, cb, user_data);
    }

    int filter_subscribe(void *node, const char *pubsub_topic, const char *content_topics_json,
                         NativeCallback cb, void *user_data) override {
        return waku_filter_subscribe(node, pubsub_topic, content_topics_json, cb, user_data);
    }

    int filter_unsubscribe(void *node, const char *pubsub_topic, const char *content_topics_json,
                           NativeCallback cb, void *user_data) override {
        return waku_filter_unsubscribe(node, pubsub_topic, content_topics_json, cb, user_data);
    }

    int filter_unsubscribe_all(void *node, NativeCallback cb, void *user_data) override {
        return waku_filter_unsubscribe_all(node, cb, user_data);
    }

    int lightpush_publish(void *node, const char *pubsub_topic, const char *message_json,
                          NativeCallback cb, void *user_data) override {
        return waku_lightpush_publish(node, pubsub_topic, message_json, cb, user_data);
    }

    int store_query(void *node, const char *query_json, const char *peer_address, int timeout_ms,
                    NativeCallback cb, void *user_data) override {
        return waku_store_query(node, query_json, peer_address, timeout_ms, cb, user_data);
    }
};

} // namespace

std::shared_ptr<NativeEngine> libwaku_engine() {
    static const std::shared_ptr<NativeEngine> engine = std::make_shared<LibwakuEngine>();
    return engine;
}

} // namespace waku
