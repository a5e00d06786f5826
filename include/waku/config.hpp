// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file config.hpp
 * @brief Node configuration builder for waku-cpp
 */

#ifndef WAKU_CONFIG_HPP
#define WAKU_CONFIG_HPP

#include <waku/fwd.hpp>
#include <waku/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waku {

/**
 * Rate-limiting nullifier (RLN) relay settings
 *
 * Serialized into the node document as flat `rlnRelay*` keys.
 */
class RlnConfig {
  public:
    RlnConfig &dynamic(bool enable) {
        dynamic_ = enable;
        return *this;
    }
    RlnConfig &chain_id(uint64_t id) {
        chain_id_ = id;
        return *this;
    }
    RlnConfig &eth_client_address(std::string url) {
        eth_client_address_ = std::move(url);
        return *this;
    }
    RlnConfig &eth_contract_address(std::string address) {
        eth_contract_address_ = std::move(address);
        return *this;
    }
    RlnConfig &credentials(std::string path, std::string password) {
        cred_path_ = std::move(path);
        cred_password_ = std::move(password);
        return *this;
    }
    RlnConfig &tree_path(std::string path) {
        tree_path_ = std::move(path);
        return *this;
    }
    RlnConfig &user_message_limit(uint64_t limit) {
        user_message_limit_ = limit;
        return *this;
    }
    RlnConfig &epoch_sec(uint64_t seconds) {
        epoch_sec_ = seconds;
        return *this;
    }

    [[nodiscard]] const std::optional<bool> &dynamic() const noexcept { return dynamic_; }
    [[nodiscard]] const std::optional<uint64_t> &chain_id() const noexcept { return chain_id_; }
    [[nodiscard]] const std::optional<std::string> &eth_contract_address() const noexcept {
        return eth_contract_address_;
    }

    /// Merge the rlnRelay* keys into a node document
    void merge_into(nlohmann::json &doc) const {
        doc["rlnRelay"] = true;
        put(doc, "rlnRelayDynamic", dynamic_);
        put(doc, "rlnRelayChainId", chain_id_);
        put(doc, "rlnRelayEthClientAddress", eth_client_address_);
        put(doc, "rlnRelayEthContractAddress", eth_contract_address_);
        put(doc, "rlnRelayCredPath", cred_path_);
        put(doc, "rlnRelayCredPassword", cred_password_);
        put(doc, "rlnRelayTreePath", tree_path_);
        put(doc, "rlnRelayUserMessageLimit", user_message_limit_);
        put(doc, "rlnEpochSizeSec", epoch_sec_);
    }

    [[nodiscard]] static RlnConfig from_json(const nlohmann::json &doc) {
        RlnConfig rln;
        get(doc, "rlnRelayDynamic", rln.dynamic_);
        get(doc, "rlnRelayChainId", rln.chain_id_);
        get(doc, "rlnRelayEthClientAddress", rln.eth_client_address_);
        get(doc, "rlnRelayEthContractAddress", rln.eth_contract_address_);
        get(doc, "rlnRelayCredPath", rln.cred_path_);
        get(doc, "rlnRelayCredPassword", rln.cred_password_);
        get(doc, "rlnRelayTreePath", rln.tree_path_);
        get(doc, "rlnRelayUserMessageLimit", rln.user_message_limit_);
        get(doc, "rlnEpochSizeSec", rln.epoch_sec_);
        return rln;
    }

  private:
    friend class NodeConfig;

    template <typename T>
    static void put(nlohmann::json &doc, const char *key, const std::optional<T> &value) {
        if (value) {
            doc[key] = *value;
        }
    }

    template <typename T>
    static void get(const nlohmann::json &doc, const char *key, std::optional<T> &value) {
        auto it = doc.find(key);
        if (it != doc.end() && !it->is_null()) {
            value = it->template get<T>();
        }
    }

    std::optional<bool> dynamic_;
    std::optional<uint64_t> chain_id_;
    std::optional<std::string> eth_client_address_;
    std::optional<std::string> eth_contract_address_;
    std::optional<std::string> cred_path_;
    std::optional<std::string> cred_password_;
    std::optional<std::string> tree_path_;
    std::optional<uint64_t> user_message_limit_;
    std::optional<uint64_t> epoch_sec_;
};

/**
 * Node configuration options
 *
 * Uses builder pattern for fluent configuration. Unset options are
 * omitted from the JSON document so the engine applies its own defaults.
 *
 * Example:
 * @code
 * waku::NodeConfig config;
 * config.host("0.0.0.0")
 *     .port(60010)
 *     .relay(true)
 *     .cluster_id(16)
 *     .shards({32});
 *
 * auto node = co_await waku::NodeHandle<waku::Initialized>::create(config);
 * @endcode
 */
class NodeConfig {
  public:
    NodeConfig() = default;

    NodeConfig &host(std::string value) {
        host_ = std::move(value);
        return *this;
    }

    /// TCP listening port
    NodeConfig &port(uint16_t value) {
        port_ = value;
        return *this;
    }

    /// Hex-encoded secp256k1 private key
    NodeConfig &node_key(std::string value) {
        node_key_ = std::move(value);
        return *this;
    }

    /// Maximum message size, e.g. "150KiB"
    NodeConfig &max_message_size(std::string value) {
        max_message_size_ = std::move(value);
        return *this;
    }

    /**
     * Enable or disable relay
     *
     * Relay publish/subscribe/unsubscribe are rejected unless this was set
     * to true.
     */
    NodeConfig &relay(bool enable) {
        relay_ = enable;
        return *this;
    }

    NodeConfig &relay_topics(std::vector<std::string> topics) {
        relay_topics_ = std::move(topics);
        return *this;
    }

    NodeConfig &cluster_id(uint32_t id) {
        cluster_id_ = id;
        return *this;
    }

    NodeConfig &shards(std::vector<uint16_t> shard_ids) {
        shards_ = std::move(shard_ids);
        return *this;
    }

    /// Mount the store protocol (serve history)
    NodeConfig &store(bool enable) {
        store_ = enable;
        return *this;
    }

    NodeConfig &store_message_db_url(std::string url) {
        store_message_db_url_ = std::move(url);
        return *this;
    }

    /// Retention policy, e.g. "time:172800"
    NodeConfig &store_message_retention_policy(std::string policy) {
        store_message_retention_policy_ = std::move(policy);
        return *this;
    }

    NodeConfig &store_max_num_db_connections(uint32_t count) {
        store_max_num_db_connections_ = count;
        return *this;
    }

    NodeConfig &filter(bool enable = true) {
        filter_ = enable;
        return *this;
    }

    NodeConfig &lightpush(bool enable = true) {
        lightpush_ = enable;
        return *this;
    }

    NodeConfig &discv5(bool enable = true) {
        discv5_ = enable;
        return *this;
    }

    NodeConfig &discv5_bootstrap_nodes(std::vector<std::string> enrs) {
        discv5_bootstrap_nodes_ = std::move(enrs);
        return *this;
    }

    NodeConfig &discv5_udp_port(uint16_t value) {
        discv5_udp_port_ = value;
        return *this;
    }

    NodeConfig &dns_discovery(bool enable = true) {
        dns_discovery_ = enable;
        return *this;
    }

    NodeConfig &dns_discovery_url(std::string url) {
        dns_discovery_url_ = std::move(url);
        return *this;
    }

    NodeConfig &keep_alive(bool enable = true) {
        keep_alive_ = enable;
        return *this;
    }

    /// Engine log level, e.g. "INFO", "DEBUG"
    NodeConfig &log_level(std::string level) {
        log_level_ = std::move(level);
        return *this;
    }

    NodeConfig &rln(RlnConfig config) {
        rln_ = std::move(config);
        return *this;
    }

    // Getters
    [[nodiscard]] const std::optional<std::string> &host() const noexcept { return host_; }
    [[nodiscard]] const std::optional<uint16_t> &port() const noexcept { return port_; }
    [[nodiscard]] const std::optional<bool> &relay() const noexcept { return relay_; }
    [[nodiscard]] const std::optional<uint32_t> &cluster_id() const noexcept { return cluster_id_; }
    [[nodiscard]] const std::optional<std::vector<uint16_t>> &shards() const noexcept {
        return shards_;
    }
    [[nodiscard]] const std::optional<bool> &store() const noexcept { return store_; }
    [[nodiscard]] const std::optional<std::string> &log_level() const noexcept {
        return log_level_;
    }
    [[nodiscard]] const std::optional<RlnConfig> &rln() const noexcept { return rln_; }

    /// True only when relay was explicitly enabled
    [[nodiscard]] bool relay_enabled() const noexcept { return relay_.value_or(false); }

    /**
     * Build the JSON configuration document handed to the engine
     */
    [[nodiscard]] nlohmann::json to_json() const {
        nlohmann::json doc = nlohmann::json::object();
        put(doc, "host", host_);
        put(doc, "tcpPort", port_);
        put(doc, "nodekey", node_key_);
        put(doc, "maxMessageSize", max_message_size_);
        put(doc, "relay", relay_);
        put(doc, "relayTopics", relay_topics_);
        put(doc, "clusterId", cluster_id_);
        put(doc, "shards", shards_);
        put(doc, "store", store_);
        put(doc, "storeMessageDbUrl", store_message_db_url_);
        put(doc, "storeMessageRetentionPolicy", store_message_retention_policy_);
        put(doc, "storeMaxNumDbConnections", store_max_num_db_connections_);
        put(doc, "filter", filter_);
        put(doc, "lightpush", lightpush_);
        put(doc, "discv5Discovery", discv5_);
        put(doc, "discv5BootstrapNodes", discv5_bootstrap_nodes_);
        put(doc, "discv5UdpPort", discv5_udp_port_);
        put(doc, "dnsDiscovery", dns_discovery_);
        put(doc, "dnsDiscoveryUrl", dns_discovery_url_);
        put(doc, "keepAlive", keep_alive_);
        put(doc, "logLevel", log_level_);
        if (rln_) {
            rln_->merge_into(doc);
        }
        return doc;
    }

    /// Serialized configuration document
    [[nodiscard]] std::string to_json_string() const { return to_json().dump(); }

    /**
     * Load a configuration document
     *
     * Unknown keys are ignored.
     *
     * @throws Error(invalid_argument) on malformed JSON or mistyped values
     */
    [[nodiscard]] static NodeConfig from_json(std::string_view text) {
        try {
            auto doc = nlohmann::json::parse(text.begin(), text.end());
            if (!doc.is_object()) {
                throw Error(Errc::invalid_argument, "node configuration must be a JSON object");
            }
            NodeConfig config;
            get(doc, "host", config.host_);
            get(doc, "tcpPort", config.port_);
            get(doc, "nodekey", config.node_key_);
            get(doc, "maxMessageSize", config.max_message_size_);
            get(doc, "relay", config.relay_);
            get(doc, "relayTopics", config.relay_topics_);
            get(doc, "clusterId", config.cluster_id_);
            get(doc, "shards", config.shards_);
            get(doc, "store", config.store_);
            get(doc, "storeMessageDbUrl", config.store_message_db_url_);
            get(doc, "storeMessageRetentionPolicy", config.store_message_retention_policy_);
            get(doc, "storeMaxNumDbConnections", config.store_max_num_db_connections_);
            get(doc, "filter", config.filter_);
            get(doc, "lightpush", config.lightpush_);
            get(doc, "discv5Discovery", config.discv5_);
            get(doc, "discv5BootstrapNodes", config.discv5_bootstrap_nodes_);
            get(doc, "discv5UdpPort", config.discv5_udp_port_);
            get(doc, "dnsDiscovery", config.dns_discovery_);
            get(doc, "dnsDiscoveryUrl", config.dns_discovery_url_);
            get(doc, "keepAlive", config.keep_alive_);
            get(doc, "logLevel", config.log_level_);
            if (doc.value("rlnRelay", false)) {
                config.rln_ = RlnConfig::from_json(doc);
            }
            return config;
        } catch (const nlohmann::json::exception &e) {
            throw Error(Errc::invalid_argument, std::string("node configuration: ") + e.what());
        }
    }

    /**
     * Load a configuration document from a file
     * @throws Error(invalid_argument) if the file cannot be read or parsed
     */
    [[nodiscard]] static NodeConfig from_file(const std::string &path) {
        std::ifstream in(path);
        if (!in) {
            throw Error(Errc::invalid_argument, "cannot open node configuration " + path);
        }
        std::ostringstream text;
        text << in.rdbuf();
        return from_json(text.str());
    }

  private:
    template <typename T>
    static void put(nlohmann::json &doc, const char *key, const std::optional<T> &value) {
        RlnConfig::put(doc, key, value);
    }

    template <typename T>
    static void get(const nlohmann::json &doc, const char *key, std::optional<T> &value) {
        RlnConfig::get(doc, key, value);
    }

    std::optional<std::string> host_;
    std::optional<uint16_t> port_;
    std::optional<std::string> node_key_;
    std::optional<std::string> max_message_size_;
    std::optional<bool> relay_;
    std::optional<std::vector<std::string>> relay_topics_;
    std::optional<uint32_t> cluster_id_;
    std::optional<std::vector<uint16_t>> shards_;
    std::optional<bool> store_;
    std::optional<std::string> store_message_db_url_;
    std::optional<std::string> store_message_retention_policy_;
    std::optional<uint32_t> store_max_num_db_connections_;
    std::optional<bool> filter_;
    std::optional<bool> lightpush_;
    std::optional<bool> discv5_;
    std::optional<std::vector<std::string>> discv5_bootstrap_nodes_;
    std::optional<uint16_t> discv5_udp_port_;
    std::optional<bool> dns_discovery_;
    std::optional<std::string> dns_discovery_url_;
    std::optional<bool> keep_alive_;
    std::optional<std::string> log_level_;
    std::optional<RlnConfig> rln_;
};

} // namespace waku

#endif // WAKU_CONFIG_HPP
