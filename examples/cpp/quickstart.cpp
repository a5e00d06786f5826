// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file quickstart.cpp
 * @brief Minimal relay node: start, subscribe, publish, shut down
 *
 * Build: cmake --build build --target quickstart
 * Run:   ./build/quickstart
 */

#include <waku.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

constexpr auto PUBSUB_TOPIC = "/waku/2/rs/16/32";

waku::Task<> run(std::atomic<int> &received) {
    auto config = waku::NodeConfig()
                      .host("0.0.0.0")
                      .port(60010)
                      .relay(true)
                      .cluster_id(16)
                      .shards({32})
                      .log_level("INFO");

    // Instantiate (the node exists but is not networking yet)
    auto node = co_await waku::NodeHandle<waku::Initialized>::create(config);
    std::cout << "libwaku version: " << co_await node.version() << "\n";

    // Events are registered before start
    node.set_event_callback([&received](waku::Response response) {
        try {
            auto event = waku::parse_event(response);
            if (auto *msg = std::get_if<waku::MessageEvent>(&event)) {
                std::cout << "message " << msg->message_hash.str() << " on "
                          << msg->pubsub_topic.str() << ": "
                          << std::string(msg->message.payload.begin(), msg->message.payload.end())
                          << "\n";
                received++;
            }
        } catch (const waku::Error &e) {
            std::cerr << "event error: " << e.what() << "\n";
        }
    });

    auto running = co_await std::move(node).start();
    for (const auto &addr : co_await running.listen_addresses()) {
        std::cout << "listening on " << addr << "\n";
    }

    co_await running.relay_subscribe(PUBSUB_TOPIC);

    waku::Message msg;
    std::string text = "Hello from waku-cpp!";
    msg.payload.assign(text.begin(), text.end());
    msg.content_topic = waku::ContentTopic::parse("/quickstart/1/greeting/proto");
    msg.timestamp = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());

    auto hash = co_await running.relay_publish(PUBSUB_TOPIC, msg, std::chrono::seconds(10));
    std::cout << "published " << hash.str() << "\n";

    // Give gossip a moment before tearing down
    std::this_thread::sleep_for(std::chrono::seconds(2));

    co_await running.relay_unsubscribe(PUBSUB_TOPIC);
    auto stopped = co_await std::move(running).stop();
    co_await std::move(stopped).destroy();
}

int main() {
    std::atomic<int> received{0};
    try {
        waku::sync_wait(run(received));
    } catch (const waku::Error &e) {
        std::cerr << "waku error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "received " << received.load() << " message(s)\n";
    return 0;
}
