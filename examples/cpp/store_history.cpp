// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file store_history.cpp
 * @brief Fetch the full message history of a content topic from a store peer
 *
 * Build: cmake --build build --target store_history
 * Run:   ./build/store_history <store-peer-multiaddr> [content-topic]
 */

#include <waku.hpp>

#include <chrono>
#include <iostream>

waku::Task<size_t> fetch_history(std::string peer, waku::ContentTopic topic) {
    auto config = waku::NodeConfig().relay(true).cluster_id(16).shards({32});
    auto node = co_await waku::NodeHandle<waku::Initialized>::create(config);
    auto running = co_await std::move(node).start();
    co_await running.connect(peer, std::chrono::seconds(10));

    waku::StoreQuery query;
    query.pubsub_topic = waku::PubsubTopic("/waku/2/rs/16/32");
    query.content_topics = {topic};
    query.page_size = 50;

    size_t count = 0;
    std::exception_ptr error;
    try {
        // Oldest first, every page already collected
        auto history = co_await running.store_query(query, peer, std::chrono::seconds(30));
        for (const auto &entry : history) {
            std::cout << entry.message_hash.str();
            if (entry.message) {
                std::cout << "  " << entry.message->timestamp << "  "
                          << std::string(entry.message->payload.begin(),
                                         entry.message->payload.end());
            }
            std::cout << "\n";
        }
        count = history.size();
    } catch (...) {
        error = std::current_exception();
    }

    co_await std::move(running).destroy();
    if (error) {
        std::rethrow_exception(error);
    }
    co_return count;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <store-peer-multiaddr> [content-topic]\n";
        return 1;
    }

    try {
        auto topic = waku::ContentTopic::parse(argc > 2 ? argv[2] : "/toychat/2/huilong/proto");
        size_t count = waku::sync_wait(fetch_history(argv[1], topic));
        std::cout << count << " message(s)\n";
    } catch (const waku::Error &e) {
        std::cerr << "waku error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
