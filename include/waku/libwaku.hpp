// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file libwaku.hpp
 * @brief NativeEngine backed by the installed libwaku
 *
 * Defined in src/libwaku_engine.cpp; link waku_cpp_libwaku to use it.
 */

#ifndef WAKU_LIBWAKU_HPP
#define WAKU_LIBWAKU_HPP

#include <waku/fwd.hpp>

#include <memory>

namespace waku {

/**
 * Get the process-wide libwaku engine
 * @return Shared engine forwarding every call to the libwaku C API
 */
std::shared_ptr<NativeEngine> libwaku_engine();

} // namespace waku

#endif // WAKU_LIBWAKU_HPP
