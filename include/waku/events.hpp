// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file events.hpp
 * @brief Typed decoding of node event payloads
 */

#ifndef WAKU_EVENTS_HPP
#define WAKU_EVENTS_HPP

#include <waku/error.hpp>
#include <waku/response.hpp>
#include <waku/types.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <variant>

namespace waku {

/// A relay/filter message delivered to this node
struct MessageEvent {
    MessageHash message_hash;
    PubsubTopic pubsub_topic;
    Message message;
};

/// Any event this version does not decode; carries the raw payload
struct UnrecognizedEvent {
    std::string event_type;
    std::string payload;
};

using Event = std::variant<MessageEvent, UnrecognizedEvent>;

/**
 * Decode one event delivered through the event callback
 *
 * @throws Error(engine_failure) for Failure responses
 * @throws Error(missing_callback) for MissingCallback responses
 * @throws Error(decode_failure) for a message event with a malformed body
 */
[[nodiscard]] inline Event parse_event(const Response &response) {
    if (response.failed()) {
        throw Error(Errc::engine_failure, response.text());
    }
    if (response.missing()) {
        throw Error(Errc::missing_callback, "event");
    }

    auto doc = nlohmann::json::parse(response.text(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return UnrecognizedEvent{std::string(), response.text()};
    }

    std::string type = doc.value("eventType", std::string());
    if (type != "message") {
        return UnrecognizedEvent{std::move(type), response.text()};
    }

    try {
        MessageEvent event;
        event.message_hash = doc.at("messageHash").get<MessageHash>();
        event.pubsub_topic = doc.at("pubsubTopic").get<PubsubTopic>();
        event.message = doc.at("wakuMessage").get<Message>();
        return event;
    } catch (const nlohmann::json::exception &e) {
        throw Error(Errc::decode_failure, std::string("message event: ") + e.what());
    }
}

} // namespace waku

#endif // WAKU_EVENTS_HPP
