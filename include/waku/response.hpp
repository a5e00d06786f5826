// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file response.hpp
 * @brief Decoded result of one engine callback invocation
 */

#ifndef WAKU_RESPONSE_HPP
#define WAKU_RESPONSE_HPP

#include <waku/native.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace waku {

/**
 * Response envelope
 *
 * One of Success(payload), Failure(message) or MissingCallback.
 * The payload/message is copied out of the engine's buffer, which is
 * only valid for the duration of the callback.
 */
class Response {
  public:
    enum class Kind { Success, Failure, MissingCallback };

    /// Default-constructed responses represent "no callback was invoked"
    Response() noexcept = default;

    [[nodiscard]] static Response success(std::string payload) {
        return Response(Kind::Success, std::move(payload));
    }

    [[nodiscard]] static Response failure(std::string message) {
        return Response(Kind::Failure, std::move(message));
    }

    [[nodiscard]] static Response missing_callback() noexcept { return Response(); }

    /**
     * Decode an engine callback triple
     *
     * Unknown return codes are reported as failures naming the code.
     */
    [[nodiscard]] static Response from_native(int ret, const char *msg, size_t len) {
        std::string text = (msg && len > 0) ? std::string(msg, len) : std::string();
        switch (ret) {
        case kRetOk:
            return success(std::move(text));
        case kRetErr:
            return failure(std::move(text));
        case kRetMissingCallback:
            return missing_callback();
        default:
            return failure("unknown engine return code " + std::to_string(ret) +
                           (text.empty() ? std::string() : ": " + text));
        }
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool ok() const noexcept { return kind_ == Kind::Success; }
    [[nodiscard]] bool failed() const noexcept { return kind_ == Kind::Failure; }
    [[nodiscard]] bool missing() const noexcept { return kind_ == Kind::MissingCallback; }

    /// Payload on success, message on failure, empty otherwise
    [[nodiscard]] const std::string &text() const noexcept { return text_; }
    [[nodiscard]] std::string take_text() noexcept { return std::move(text_); }

    friend bool operator==(const Response &a, const Response &b) {
        return a.kind_ == b.kind_ && a.text_ == b.text_;
    }

  private:
    Response(Kind kind, std::string text) : kind_(kind), text_(std::move(text)) {}

    Kind kind_ = Kind::MissingCallback;
    std::string text_;
};

} // namespace waku

#endif // WAKU_RESPONSE_HPP
