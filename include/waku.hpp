// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file waku.hpp
 * @brief Main header for waku-cpp
 *
 * This is the single header you need to include to drive a Waku node from
 * C++. It provides a C++20 interface with RAII, exceptions, coroutines and
 * a compile-time enforced node lifecycle.
 *
 * Example:
 * @code
 * #include <waku.hpp>
 *
 * waku::Task<> run(std::shared_ptr<waku::NativeEngine> engine) {
 *     auto config = waku::NodeConfig().relay(true).cluster_id(16).shards({32});
 *     auto node = co_await waku::NodeHandle<waku::Initialized>::create(engine, config);
 *     auto running = co_await std::move(node).start();
 *     co_await running.relay_subscribe("/waku/2/rs/16/32");
 *     auto stopped = co_await std::move(running).stop();
 *     co_await std::move(stopped).destroy();
 * }
 *
 * int main() {
 *     waku::sync_wait(run(waku::libwaku_engine()));
 * }
 * @endcode
 */

#ifndef WAKU_HPP
#define WAKU_HPP

// C++ bindings (order matters for dependencies)
#include <waku/fwd.hpp>
#include <waku/error.hpp>
#include <waku/log.hpp>
#include <waku/native.hpp>
#include <waku/response.hpp>
#include <waku/detail/callback_storage.hpp>
#include <waku/coro.hpp>
#include <waku/event_stream.hpp>
#include <waku/context.hpp>
#include <waku/types.hpp>
#include <waku/config.hpp>
#include <waku/events.hpp>
#include <waku/store.hpp>
#include <waku/libwaku.hpp>
#include <waku/node.hpp>

#endif // WAKU_HPP
