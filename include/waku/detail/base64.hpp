// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file base64.hpp
 * @brief Standard base64 (RFC 4648, padded) for message payloads
 *
 * This is an internal header - not part of the public API.
 */

#ifndef WAKU_DETAIL_BASE64_HPP
#define WAKU_DETAIL_BASE64_HPP

#include <waku/error.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace waku::detail {

inline constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

[[nodiscard]] inline std::string base64_encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t n = (uint32_t{data[i]} << 16) | (uint32_t{data[i + 1]} << 8) | data[i + 2];
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 6) & 0x3F]);
        out.push_back(kBase64Alphabet[n & 0x3F]);
    }

    size_t rest = data.size() - i;
    if (rest > 0) {
        uint32_t n = uint32_t{data[i]} << 16;
        if (rest == 2) {
            n |= uint32_t{data[i + 1]} << 8;
        }
        out.push_back(kBase64Alphabet[(n >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(n >> 12) & 0x3F]);
        out.push_back(rest == 2 ? kBase64Alphabet[(n >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

/**
 * Decode padded or unpadded base64
 * @throws Error(decode_failure) on characters outside the alphabet
 */
[[nodiscard]] inline std::vector<uint8_t> base64_decode(std::string_view text) {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        for (int i = 0; i < 64; ++i) {
            t[static_cast<unsigned char>(kBase64Alphabet[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();

    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    for (char c : text) {
        int8_t v = table[static_cast<unsigned char>(c)];
        if (v < 0) {
            throw Error(Errc::decode_failure, "invalid base64 character");
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (bits >= 6) {
        throw Error(Errc::decode_failure, "truncated base64 input");
    }
    return out;
}

} // namespace waku::detail

#endif // WAKU_DETAIL_BASE64_HPP
