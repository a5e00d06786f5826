// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file error.hpp
 * @brief Error exception class for waku-cpp
 */

#ifndef WAKU_ERROR_HPP
#define WAKU_ERROR_HPP

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace waku {

/**
 * Error conditions raised by the bindings
 */
enum class Errc {
    engine_failure = 1, ///< Engine reported a failure for a well-formed call
    missing_callback,   ///< Engine returned without ever invoking the callback
    relay_disabled,     ///< Relay operation on a node configured without relay
    invalid_state,      ///< Operation on a moved-from or destroyed node handle
    decode_failure,     ///< Engine payload could not be decoded
    invalid_argument    ///< Caller-supplied value rejected before the engine call
};

namespace detail {

class ErrorCategory : public std::error_category {
  public:
    [[nodiscard]] const char *name() const noexcept override { return "waku"; }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::engine_failure:
            return "engine failure";
        case Errc::missing_callback:
            return "engine did not invoke the callback";
        case Errc::relay_disabled:
            return "relay is disabled; restart the node with relay enabled";
        case Errc::invalid_state:
            return "node handle is not valid in this state";
        case Errc::decode_failure:
            return "malformed engine payload";
        case Errc::invalid_argument:
            return "invalid argument";
        }
        return "unknown waku error";
    }
};

} // namespace detail

/// Category used for all waku::Errc values
[[nodiscard]] inline const std::error_category &error_category() noexcept {
    static const detail::ErrorCategory category;
    return category;
}

[[nodiscard]] inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace waku

template <> struct std::is_error_code_enum<waku::Errc> : std::true_type {};

namespace waku {

/**
 * Exception class for waku-cpp errors
 *
 * Inherits from std::system_error so callers can catch either
 * waku::Error or std::system_error. The context string is kept
 * verbatim and is available through detail(); for engine failures
 * it is the message the engine delivered.
 */
class Error : public std::system_error {
  public:
    /**
     * Construct error from a waku error condition
     *
     * @param err Error condition
     * @param context Optional context message
     */
    explicit Error(Errc err, std::string_view context = {})
        : std::system_error(make_error_code(err), std::string(context)), detail_(context) {}

    /**
     * Get the error condition
     * @return Errc value
     */
    [[nodiscard]] Errc errc() const noexcept {
        return static_cast<Errc>(std::system_error::code().value());
    }

    /**
     * Get the context message without the category suffix
     * @return Verbatim context (engine message for engine failures)
     */
    [[nodiscard]] const std::string &detail() const noexcept { return detail_; }

    // Convenience predicates
    [[nodiscard]] bool is_engine_failure() const noexcept { return errc() == Errc::engine_failure; }
    [[nodiscard]] bool is_missing_callback() const noexcept {
        return errc() == Errc::missing_callback;
    }
    [[nodiscard]] bool is_relay_disabled() const noexcept { return errc() == Errc::relay_disabled; }
    [[nodiscard]] bool is_invalid_state() const noexcept { return errc() == Errc::invalid_state; }
    [[nodiscard]] bool is_decode_failure() const noexcept { return errc() == Errc::decode_failure; }
    [[nodiscard]] bool is_invalid_argument() const noexcept {
        return errc() == Errc::invalid_argument;
    }

  private:
    std::string detail_;
};

/**
 * Throw Error if condition is false
 *
 * @param condition Condition to check
 * @param err Error condition to raise
 * @param context Error context message
 * @throws Error if condition is false
 */
inline void check(bool condition, Errc err, std::string_view context = {}) {
    if (!condition) {
        throw Error(err, context);
    }
}

} // namespace waku

#endif // WAKU_ERROR_HPP
