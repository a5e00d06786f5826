// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file types.hpp
 * @brief Topic, hash and message value types
 *
 * These are carried through the bindings as opaque, serializable values;
 * no protocol-level validation is attempted beyond the shape of a
 * content topic.
 */

#ifndef WAKU_TYPES_HPP
#define WAKU_TYPES_HPP

#include <waku/fwd.hpp>
#include <waku/error.hpp>
#include <waku/detail/base64.hpp>

#include <nlohmann/json.hpp>

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waku {

/**
 * Pubsub topic (e.g. "/waku/2/rs/16/32")
 */
class PubsubTopic {
  public:
    PubsubTopic() = default;
    PubsubTopic(std::string topic) : topic_(std::move(topic)) {}
    PubsubTopic(const char *topic) : topic_(topic) {}

    [[nodiscard]] const std::string &str() const noexcept { return topic_; }
    [[nodiscard]] const char *c_str() const noexcept { return topic_.c_str(); }
    [[nodiscard]] bool empty() const noexcept { return topic_.empty(); }

    auto operator<=>(const PubsubTopic &) const = default;

  private:
    std::string topic_;
};

/**
 * Content topic: /{application}/{version}/{name}/{encoding}
 */
class ContentTopic {
  public:
    ContentTopic() = default;

    ContentTopic(std::string application, std::string version, std::string name,
                 std::string encoding)
        : application_(std::move(application)), version_(std::move(version)),
          name_(std::move(name)), encoding_(std::move(encoding)) {}

    /**
     * Parse the textual form
     * @throws Error(decode_failure) unless there are exactly four non-empty components
     */
    [[nodiscard]] static ContentTopic parse(std::string_view text) {
        std::string_view rest = text;
        if (rest.empty() || rest.front() != '/') {
            throw Error(Errc::decode_failure, "content topic must start with '/': " +
                                                  std::string(text));
        }
        rest.remove_prefix(1);

        std::vector<std::string> parts;
        while (!rest.empty()) {
            size_t slash = rest.find('/');
            parts.emplace_back(rest.substr(0, slash));
            if (slash == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(slash + 1);
            if (rest.empty()) {
                parts.emplace_back(); // trailing slash
            }
        }

        if (parts.size() != 4) {
            throw Error(Errc::decode_failure,
                        "content topic needs 4 components: " + std::string(text));
        }
        for (const auto &p : parts) {
            if (p.empty()) {
                throw Error(Errc::decode_failure,
                            "empty content topic component: " + std::string(text));
            }
        }
        return ContentTopic(std::move(parts[0]), std::move(parts[1]), std::move(parts[2]),
                            std::move(parts[3]));
    }

    [[nodiscard]] std::string to_string() const {
        return "/" + application_ + "/" + version_ + "/" + name_ + "/" + encoding_;
    }

    [[nodiscard]] const std::string &application() const noexcept { return application_; }
    [[nodiscard]] const std::string &version() const noexcept { return version_; }
    [[nodiscard]] const std::string &name() const noexcept { return name_; }
    [[nodiscard]] const std::string &encoding() const noexcept { return encoding_; }

    auto operator<=>(const ContentTopic &) const = default;

  private:
    std::string application_;
    std::string version_;
    std::string name_;
    std::string encoding_;
};

/**
 * Deterministic message hash as reported by the engine (hex text)
 */
class MessageHash {
  public:
    MessageHash() = default;
    explicit MessageHash(std::string hash) : hash_(std::move(hash)) {}

    [[nodiscard]] const std::string &str() const noexcept { return hash_; }
    [[nodiscard]] bool empty() const noexcept { return hash_.empty(); }

    auto operator<=>(const MessageHash &) const = default;

  private:
    std::string hash_;
};

/**
 * Waku message
 */
struct Message {
    std::vector<uint8_t> payload;
    ContentTopic content_topic;
    uint32_t version = 0;
    uint64_t timestamp = 0; ///< Unix time, nanoseconds
    std::vector<uint8_t> meta;
    bool ephemeral = false;

    bool operator==(const Message &) const = default;
};

// JSON mapping (found by ADL from nlohmann::json)

inline void to_json(nlohmann::json &j, const PubsubTopic &t) { j = t.str(); }
inline void from_json(const nlohmann::json &j, PubsubTopic &t) {
    t = PubsubTopic(j.get<std::string>());
}

inline void to_json(nlohmann::json &j, const ContentTopic &t) { j = t.to_string(); }
inline void from_json(const nlohmann::json &j, ContentTopic &t) {
    t = ContentTopic::parse(j.get<std::string>());
}

inline void to_json(nlohmann::json &j, const MessageHash &h) { j = h.str(); }
inline void from_json(const nlohmann::json &j, MessageHash &h) {
    h = MessageHash(j.get<std::string>());
}

inline void to_json(nlohmann::json &j, const Message &m) {
    j = nlohmann::json{{"payload", detail::base64_encode(m.payload)},
                       {"contentTopic", m.content_topic},
                       {"version", m.version},
                       {"timestamp", m.timestamp},
                       {"ephemeral", m.ephemeral}};
    if (!m.meta.empty()) {
        j["meta"] = detail::base64_encode(m.meta);
    }
}

inline void from_json(const nlohmann::json &j, Message &m) {
    m.payload = detail::base64_decode(j.value("payload", std::string()));
    m.content_topic = j.at("contentTopic").get<ContentTopic>();
    m.version = j.value("version", uint32_t{0});
    m.timestamp = j.value("timestamp", uint64_t{0});
    m.meta = detail::base64_decode(j.value("meta", std::string()));
    m.ephemeral = j.value("ephemeral", false);
}

namespace detail {

/**
 * Parse an engine JSON payload, mapping parser and type errors to waku::Error
 *
 * @param what Name of the document for the error message
 * @param decode Callable taking the parsed nlohmann::json
 */
template <typename F> auto decode_json(std::string_view text, std::string_view what, F &&decode) {
    try {
        return decode(nlohmann::json::parse(text.begin(), text.end()));
    } catch (const nlohmann::json::exception &e) {
        throw Error(Errc::decode_failure, std::string(what) + ": " + e.what());
    }
}

} // namespace detail

} // namespace waku

#endif // WAKU_TYPES_HPP
