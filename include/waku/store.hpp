// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file store.hpp
 * @brief Store query documents and the cursor pagination driver
 */

#ifndef WAKU_STORE_HPP
#define WAKU_STORE_HPP

#include <waku/fwd.hpp>
#include <waku/coro.hpp>
#include <waku/error.hpp>
#include <waku/log.hpp>
#include <waku/types.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waku {

/**
 * One page of a paged query
 *
 * An absent cursor means there are no more pages.
 */
template <typename Item, typename Cursor> struct Page {
    std::vector<Item> items;
    std::optional<Cursor> cursor;
};

/**
 * Drain a cursor-paginated query
 *
 * Calls fetch with an absent cursor, then with each returned cursor until
 * a page comes back without one. Items are accumulated in delivery order
 * and the whole sequence is reversed once at the end: the engine delivers
 * newest-first, callers get oldest-first.
 *
 * No page or size limit is applied. If any fetch throws, the exception
 * propagates and the items gathered so far are discarded.
 *
 * @param fetch Callable: Task<Page<Item, Cursor>>(const std::optional<Cursor> &)
 */
template <typename Item, typename Cursor, typename Fetch>
Task<std::vector<Item>> paginate(Fetch fetch) {
    std::vector<Item> accumulated;
    std::optional<Cursor> cursor;
    size_t pages = 0;

    for (;;) {
        Page<Item, Cursor> page = co_await fetch(cursor);
        ++pages;
        accumulated.insert(accumulated.end(), std::make_move_iterator(page.items.begin()),
                           std::make_move_iterator(page.items.end()));
        if (!page.cursor) {
            break;
        }
        cursor = std::move(page.cursor);
    }

    log_emit(LogLevel::Debug, "paginate", std::to_string(pages) + " page(s), " +
                                              std::to_string(accumulated.size()) + " item(s)");
    std::reverse(accumulated.begin(), accumulated.end());
    co_return accumulated;
}

/**
 * Caller-facing store query parameters
 */
struct StoreQuery {
    std::optional<PubsubTopic> pubsub_topic;
    std::vector<ContentTopic> content_topics;
    bool include_data = true;            ///< False: only message hashes are returned
    std::optional<uint64_t> time_start;  ///< Unix time, nanoseconds
    std::optional<uint64_t> time_end;    ///< Unix time, nanoseconds
    std::optional<uint64_t> page_size;   ///< Engine default when unset
};

/**
 * Store query request document (one page)
 *
 * Uses builder pattern; a fresh request id is generated on construction.
 */
class StoreQueryRequest {
  public:
    StoreQueryRequest() : request_id_(generate_request_id()) {}

    StoreQueryRequest &request_id(std::string id) {
        request_id_ = std::move(id);
        return *this;
    }
    StoreQueryRequest &include_data(bool include) {
        include_data_ = include;
        return *this;
    }
    StoreQueryRequest &pubsub_topic(std::optional<PubsubTopic> topic) {
        pubsub_topic_ = std::move(topic);
        return *this;
    }
    StoreQueryRequest &content_topics(std::vector<ContentTopic> topics) {
        content_topics_ = std::move(topics);
        return *this;
    }
    StoreQueryRequest &time_start(std::optional<uint64_t> ns) {
        time_start_ = ns;
        return *this;
    }
    StoreQueryRequest &time_end(std::optional<uint64_t> ns) {
        time_end_ = ns;
        return *this;
    }
    StoreQueryRequest &message_hashes(std::vector<MessageHash> hashes) {
        message_hashes_ = std::move(hashes);
        return *this;
    }
    StoreQueryRequest &pagination_cursor(std::optional<MessageHash> cursor) {
        pagination_cursor_ = std::move(cursor);
        return *this;
    }
    StoreQueryRequest &pagination_forward(bool forward) {
        pagination_forward_ = forward;
        return *this;
    }
    StoreQueryRequest &pagination_limit(std::optional<uint64_t> limit) {
        pagination_limit_ = limit;
        return *this;
    }

    [[nodiscard]] const std::string &request_id() const noexcept { return request_id_; }
    [[nodiscard]] const std::optional<MessageHash> &pagination_cursor() const noexcept {
        return pagination_cursor_;
    }
    [[nodiscard]] bool pagination_forward() const noexcept { return pagination_forward_; }

    [[nodiscard]] nlohmann::json to_json() const {
        nlohmann::json doc{{"requestId", request_id_},
                           {"includeData", include_data_},
                           {"contentTopics", content_topics_},
                           {"messageHashes", message_hashes_},
                           {"paginationForward", pagination_forward_}};
        if (pubsub_topic_) {
            doc["pubsubTopic"] = *pubsub_topic_;
        }
        if (time_start_) {
            doc["timeStart"] = *time_start_;
        }
        if (time_end_) {
            doc["timeEnd"] = *time_end_;
        }
        if (pagination_cursor_) {
            doc["paginationCursor"] = *pagination_cursor_;
        }
        if (pagination_limit_) {
            doc["paginationLimit"] = *pagination_limit_;
        }
        return doc;
    }

  private:
    static std::string generate_request_id() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        static constexpr char kHex[] = "0123456789abcdef";
        std::string id(32, '0');
        for (size_t i = 0; i < id.size(); i += 16) {
            uint64_t bits = gen();
            for (size_t j = 0; j < 16; ++j) {
                id[i + j] = kHex[(bits >> (j * 4)) & 0xF];
            }
        }
        return id;
    }

    std::string request_id_;
    bool include_data_ = true;
    std::optional<PubsubTopic> pubsub_topic_;
    std::vector<ContentTopic> content_topics_;
    std::optional<uint64_t> time_start_;
    std::optional<uint64_t> time_end_;
    std::vector<MessageHash> message_hashes_;
    std::optional<MessageHash> pagination_cursor_;
    bool pagination_forward_ = true;
    std::optional<uint64_t> pagination_limit_;
};

/**
 * One entry of a store response
 *
 * message is absent when the query did not include data.
 */
struct StoreMessage {
    MessageHash message_hash;
    std::optional<Message> message;
    std::optional<PubsubTopic> pubsub_topic;
};

inline void from_json(const nlohmann::json &j, StoreMessage &m) {
    m.message_hash = j.at("messageHash").get<MessageHash>();
    auto msg = j.find("message");
    if (msg != j.end() && !msg->is_null()) {
        m.message = msg->get<Message>();
    }
    auto topic = j.find("pubsubTopic");
    if (topic != j.end() && !topic->is_null()) {
        m.pubsub_topic = topic->get<PubsubTopic>();
    }
}

/**
 * Decoded store response (one page)
 */
struct StoreResponse {
    std::string request_id;
    uint32_t status_code = 200;
    std::string status_desc;
    std::vector<StoreMessage> messages;
    std::optional<MessageHash> pagination_cursor;

    /**
     * Decode the engine's store response payload
     * @throws Error(decode_failure) on malformed JSON
     */
    [[nodiscard]] static StoreResponse parse(std::string_view text) {
        return detail::decode_json(text, "store response", [](const nlohmann::json &doc) {
            StoreResponse r;
            r.request_id = doc.value("requestId", std::string());
            r.status_code = doc.value("statusCode", uint32_t{200});
            r.status_desc = doc.value("statusDesc", std::string());
            auto msgs = doc.find("messages");
            if (msgs != doc.end() && !msgs->is_null()) {
                r.messages = msgs->get<std::vector<StoreMessage>>();
            }
            auto cursor = doc.find("paginationCursor");
            if (cursor != doc.end() && cursor->is_string() &&
                !cursor->get_ref<const std::string &>().empty()) {
                r.pagination_cursor = cursor->get<MessageHash>();
            }
            return r;
        });
    }

    /**
     * Convert into a pagination page
     * @throws Error(engine_failure) if the peer answered with a non-200 status
     */
    [[nodiscard]] Page<StoreMessage, MessageHash> into_page() && {
        if (status_code != 200) {
            throw Error(Errc::engine_failure, "store query failed with status " +
                                                  std::to_string(status_code) +
                                                  (status_desc.empty() ? "" : ": " + status_desc));
        }
        return {std::move(messages), std::move(pagination_cursor)};
    }
};

} // namespace waku

#endif // WAKU_STORE_HPP
