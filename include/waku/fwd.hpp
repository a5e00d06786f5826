// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file fwd.hpp
 * @brief Forward declarations for waku-cpp
 */

#ifndef WAKU_FWD_HPP
#define WAKU_FWD_HPP

namespace waku {

class NativeEngine;
class NodeContext;
class NodeConfig;
class RlnConfig;
class Response;
class EventStream;
class Error;
class PubsubTopic;
class ContentTopic;
class MessageHash;
class StoreQueryRequest;
struct Message;
struct StoreMessage;
struct StoreQuery;

struct Initialized;
struct Running;

template <typename State> class NodeHandle;

template <typename T = void> class Task;

} // namespace waku

#endif // WAKU_FWD_HPP
