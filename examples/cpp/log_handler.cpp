// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file log_handler.cpp
 * @brief Demonstrate the waku-cpp custom log handler
 *
 * Shows how to install a callback that formats library messages with
 * timestamps and severity levels, and how to emit application-level
 * messages through the same pipeline using waku::log_emit().
 *
 * Build: cmake --build build --target log_handler
 * Run:   ./build/log_handler [config.json]
 */

#include <waku.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

int main(int argc, char **argv) {
    std::cout << "waku-cpp Log Handler Example\n";
    std::cout << "============================\n\n";

    // --- Step 1: Install log handler -------------------------------------
    waku::set_log_handler([](waku::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << waku::log_level_name(level)
                  << ": " << msg << '\n';
    });

    waku::log_emit(waku::LogLevel::Info, "log handler installed, creating node");

    try {
        // --- Step 2: Load configuration ------------------------------------
        waku::NodeConfig config = argc > 1 ? waku::NodeConfig::from_file(argv[1])
                                           : waku::NodeConfig().relay(true).log_level("DEBUG");
        waku::log_emit(waku::LogLevel::Notice, "config", config.to_json_string());

        // --- Step 3: Lifecycle; the library logs each transition ---------
        auto node = waku::sync_wait(waku::NodeHandle<waku::Initialized>::create(config));
        auto running = waku::sync_wait(std::move(node).start());
        waku::log_emit(waku::LogLevel::Info, "version", waku::sync_wait(running.version()));
        waku::sync_wait(std::move(running).destroy());

        // --- Step 4: Relay gate is rejected before the engine is touched -
        auto plain = waku::sync_wait(
            waku::NodeHandle<waku::Initialized>::create(waku::NodeConfig().relay(false)));
        auto plain_running = waku::sync_wait(std::move(plain).start());
        try {
            waku::sync_wait(plain_running.relay_subscribe("/waku/2/rs/16/32"));
        } catch (const waku::Error &e) {
            if (!e.is_relay_disabled()) {
                throw;
            }
            waku::log_emit(waku::LogLevel::Warning, e.what());
        }
        waku::sync_wait(std::move(plain_running).destroy());

        waku::log_emit(waku::LogLevel::Notice, "shutting down");

    } catch (const waku::Error &e) {
        waku::log_emit(waku::LogLevel::Error, std::string("waku error: ") + e.what());
        waku::clear_log_handler();
        return 1;
    } catch (const std::exception &e) {
        waku::log_emit(waku::LogLevel::Error, std::string("unexpected error: ") + e.what());
        waku::clear_log_handler();
        return 1;
    }

    waku::clear_log_handler();

    std::cout << "\n--- Summary ---\n";
    std::cout << "The log handler captured library and application messages\n";
    std::cout << "on stderr with timestamps, severity levels and an app prefix.\n";

    return 0;
}
