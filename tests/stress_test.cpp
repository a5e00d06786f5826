// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file stress_test.cpp
 * @brief Stress test for the waku-cpp callback and event bridges
 *
 * Tests:
 * 1. Batched calls - many bridged calls in flight, completing out of order
 * 2. Multi-threaded callers - concurrent blocking callers on one node
 * 3. Duplicate callbacks under load
 * 4. Abandoned calls - tasks dropped before their callbacks arrive
 * 5. Cancellation races - tasks dropped while their callbacks are in flight
 * 6. Concurrent event producers - per-producer order through one stream
 *
 * Run: ./stress_test [options]
 *
 * Options:
 *   --duration <seconds>   Test duration (default: 10)
 *   --threads <count>      Number of threads (default: 4)
 *   --max-inflight <n>     Calls per batch (default: 256)
 *   --max-delay-us <n>     Maximum callback latency (default: 2000)
 */

#include <waku.hpp>

#include "mock_engine.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using Clock = std::chrono::steady_clock;
using waku::testing::MockEngine;
using waku::testing::Reply;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int duration_sec = 10;
    int num_threads = 4;
    int max_inflight = 256;
    int max_delay_us = 2000;
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> calls_submitted{0};
    std::atomic<long long> calls_completed{0};
    std::atomic<long long> calls_failed{0};
    std::atomic<long long> mismatches{0};
    std::atomic<long long> calls_abandoned{0};
    std::atomic<long long> chains_dropped{0};
    std::atomic<long long> stale_callbacks{0};
    std::atomic<long long> events_emitted{0};
    std::atomic<long long> events_received{0};
    std::atomic<long long> order_violations{0};

    void print(double elapsed_sec) const {
        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2) << elapsed_sec
                  << " seconds\n";
        std::cout << "Calls submitted:   " << calls_submitted << "\n";
        std::cout << "Calls completed:   " << calls_completed << "\n";
        std::cout << "Calls failed:      " << calls_failed << "\n";
        std::cout << "Mismatched:        " << mismatches << "\n";
        std::cout << "Calls abandoned:   " << calls_abandoned << "\n";
        std::cout << "Chains dropped:    " << chains_dropped << "\n";
        std::cout << "Stale callbacks:   " << stale_callbacks << "\n";
        std::cout << "Events emitted:    " << events_emitted << "\n";
        std::cout << "Events received:   " << events_received << "\n";
        std::cout << "Order violations:  " << order_violations << "\n";
        std::cout << "Calls/sec:         " << std::setprecision(0)
                  << calls_completed / elapsed_sec << "\n";
    }

    [[nodiscard]] bool failed() const {
        return calls_failed > 0 || mismatches > 0 || order_violations > 0 ||
               calls_completed != calls_submitted - calls_abandoned ||
               events_received != events_emitted;
    }
};

// =============================================================================
// Helpers
// =============================================================================

using RunNode = waku::NodeHandle<waku::Running>;

static std::string unique_topic(int thread_id, long long seq) {
    return "/stress/" + std::to_string(thread_id) + "/" + std::to_string(seq);
}

static waku::Message stress_message() {
    waku::Message msg;
    msg.payload = {'s', 't', 'r', 'e', 's', 's'};
    msg.content_topic = waku::ContentTopic("stress", "1", "load", "proto");
    return msg;
}

// relay_publish echoes the topic back as the message hash
static void configure_echo(MockEngine &engine, const Config &config) {
    engine.set_default("relay_publish",
                       Reply::echo_first_arg().jittered(
                           std::chrono::microseconds(config.max_delay_us)));
}

// =============================================================================
// Stress Test: Batched Calls
// =============================================================================

void test_batched_calls(MockEngine &engine, RunNode &node, Stats &stats, const Config &config) {
    std::cout << "\n--- Test: Batched Calls ---\n";

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    long long seq = 0;
    int batches = 0;

    while (Clock::now() < end_time) {
        std::vector<std::string> topics;
        std::vector<waku::Task<waku::MessageHash>> tasks;
        topics.reserve(config.max_inflight);
        tasks.reserve(config.max_inflight);

        for (int i = 0; i < config.max_inflight; i++) {
            topics.push_back(unique_topic(0, seq++));
            tasks.push_back(node.relay_publish(topics.back(), stress_message()));
            stats.calls_submitted++;
            tasks.back().resume();
        }

        // Every callback has been delivered and its task resumed to completion
        engine.drain();
        waku::detail::resume_executor().drain();

        for (size_t i = 0; i < tasks.size(); i++) {
            try {
                if (tasks[i].get().str() != topics[i]) {
                    stats.mismatches++;
                }
                stats.calls_completed++;
            } catch (const std::exception &e) {
                std::cerr << "batched call failed: " << e.what() << "\n";
                stats.calls_failed++;
            }
        }
        batches++;
    }

    std::cout << "Completed " << batches << " batches of " << config.max_inflight << "\n";
}

// =============================================================================
// Stress Test: Multi-threaded Callers
// =============================================================================

void test_multithread_callers(RunNode &node, Stats &stats, const Config &config) {
    std::cout << "\n--- Test: Multi-threaded Callers ---\n";

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    std::vector<std::thread> threads;

    for (int t = 0; t < config.num_threads; t++) {
        threads.emplace_back([&, t]() {
            long long seq = 0;
            while (Clock::now() < end_time) {
                std::string topic = unique_topic(t + 1, seq++);
                stats.calls_submitted++;
                try {
                    auto hash = waku::sync_wait(node.relay_publish(topic, stress_message()));
                    if (hash.str() != topic) {
                        stats.mismatches++;
                    }
                    stats.calls_completed++;
                } catch (const std::exception &e) {
                    std::cerr << "thread " << t << " call failed: " << e.what() << "\n";
                    stats.calls_failed++;
                }
            }
        });
    }

    for (auto &t : threads) {
        t.join();
    }

    std::cout << "Completed with " << config.num_threads << " threads\n";
}

// =============================================================================
// Stress Test: Duplicate Callbacks
// =============================================================================

void test_duplicate_callbacks(MockEngine &engine, RunNode &node, Stats &stats,
                              const Config &config) {
    std::cout << "\n--- Test: Duplicate Callbacks ---\n";

    engine.set_default("relay_publish",
                       Reply::echo_first_arg()
                           .jittered(std::chrono::microseconds(config.max_delay_us))
                           .duplicated(2));

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    long long seq = 0;

    while (Clock::now() < end_time) {
        std::vector<std::string> topics;
        std::vector<waku::Task<waku::MessageHash>> tasks;
        for (int i = 0; i < config.max_inflight; i++) {
            topics.push_back(unique_topic(100, seq++));
            tasks.push_back(node.relay_publish(topics.back(), stress_message()));
            stats.calls_submitted++;
            tasks.back().resume();
        }
        engine.drain();
        waku::detail::resume_executor().drain();

        for (size_t i = 0; i < tasks.size(); i++) {
            try {
                if (tasks[i].get().str() != topics[i]) {
                    stats.mismatches++;
                }
                stats.calls_completed++;
            } catch (const std::exception &e) {
                std::cerr << "duplicate-callback call failed: " << e.what() << "\n";
                stats.calls_failed++;
            }
        }
    }

    configure_echo(engine, config);
}

// =============================================================================
// Stress Test: Abandoned Calls
// =============================================================================

void test_abandoned_calls(MockEngine &engine, RunNode &node, Stats &stats, const Config &config) {
    std::cout << "\n--- Test: Abandoned Calls ---\n";

    size_t baseline = waku::detail::pending_calls().pending();
    engine.set_default("relay_publish", Reply::held(Reply::echo_first_arg()));

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    long long seq = 0;

    while (Clock::now() < end_time) {
        {
            std::vector<waku::Task<waku::MessageHash>> tasks;
            for (int i = 0; i < config.max_inflight; i++) {
                tasks.push_back(node.relay_publish(unique_topic(200, seq++), stress_message()));
                stats.calls_submitted++;
                tasks.back().resume();
            }
            // Dropped while suspended
        }

        // Late callbacks land on several threads at once
        std::vector<std::thread> releasers;
        for (int t = 0; t < config.num_threads; t++) {
            releasers.emplace_back([&engine, &stats] {
                stats.calls_abandoned += engine.release_held();
            });
        }
        for (auto &t : releasers) {
            t.join();
        }
        stats.calls_abandoned += engine.release_held();
    }

    size_t pending = waku::detail::pending_calls().pending();
    if (pending != baseline) {
        std::cerr << "pending calls leaked: " << pending - baseline << "\n";
        stats.calls_failed++;
    }

    configure_echo(engine, config);
}

// =============================================================================
// Stress Test: Cancellation Races
// =============================================================================

// Two publishes in a row, so a drop can land during either call or between them
static waku::Task<> publish_twice(RunNode &node, std::string topic, Stats &stats) {
    auto first = co_await node.relay_publish(topic + "/a", stress_message());
    auto second = co_await node.relay_publish(topic + "/b", stress_message());
    if (first.str() != topic + "/a" || second.str() != topic + "/b") {
        stats.mismatches++;
    }
}

void test_cancellation_races(MockEngine &engine, RunNode &node, Stats &stats,
                             const Config &config) {
    std::cout << "\n--- Test: Cancellation Races ---\n";

    size_t baseline = waku::detail::pending_calls().pending();
    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    long long seq = 0;

    while (Clock::now() < end_time) {
        std::vector<std::vector<waku::Task<>>> slices(config.num_threads);
        for (int i = 0; i < config.max_inflight; i++) {
            auto task = publish_twice(node, unique_topic(300, seq++), stats);
            task.resume();
            slices[i % config.num_threads].push_back(std::move(task));
        }

        // Each dropper waits a random share of the callback latency, then
        // drops its tasks while callbacks are still being delivered
        std::vector<std::thread> droppers;
        for (int t = 0; t < config.num_threads; t++) {
            droppers.emplace_back([&stats, &config, slice = std::move(slices[t]), t]() mutable {
                std::mt19937 gen(static_cast<unsigned>(t) * 7919u + 1u);
                std::uniform_int_distribution<int> wait_us(0, config.max_delay_us);
                std::this_thread::sleep_for(std::chrono::microseconds(wait_us(gen)));
                for (auto &task : slice) {
                    task = waku::Task<>();
                    stats.chains_dropped++;
                }
            });
        }
        for (auto &t : droppers) {
            t.join();
        }
    }

    engine.drain();
    waku::detail::resume_executor().drain();

    size_t pending = waku::detail::pending_calls().pending();
    if (pending != baseline) {
        std::cerr << "pending calls leaked: " << pending - baseline << "\n";
        stats.calls_failed++;
    }
}

// =============================================================================
// Stress Test: Concurrent Event Producers
// =============================================================================

void test_event_producers(const std::shared_ptr<MockEngine> &engine, Stats &stats,
                          const Config &config) {
    std::cout << "\n--- Test: Concurrent Event Producers ---\n";

    auto node = waku::sync_wait(waku::NodeHandle<waku::Initialized>::create(engine, {}));
    auto stream = node.event_stream();

    auto end_time = Clock::now() + std::chrono::seconds(config.duration_sec);
    std::atomic<int> producers_running{config.num_threads};
    std::vector<std::thread> producers;

    for (int p = 0; p < config.num_threads; p++) {
        producers.emplace_back([&, p]() {
            long long seq = 0;
            while (Clock::now() < end_time) {
                if (engine->emit_event(std::to_string(p) + ":" + std::to_string(seq))) {
                    stats.events_emitted++;
                    seq++;
                }
            }
            producers_running--;
        });
    }

    std::vector<long long> next(config.num_threads, 0);
    auto consume = [&](const waku::Response &event) {
        stats.events_received++;
        const std::string &text = event.text();
        auto colon = text.find(':');
        int p = std::stoi(text.substr(0, colon));
        long long i = std::stoll(text.substr(colon + 1));
        if (i != next[p]) {
            stats.order_violations++;
        }
        next[p] = i + 1;
    };

    while (producers_running > 0 || stream.buffered() > 0) {
        if (auto event = stream.try_next()) {
            consume(*event);
        } else {
            std::this_thread::yield();
        }
    }

    for (auto &t : producers) {
        t.join();
    }
    while (auto event = stream.try_next()) {
        consume(*event);
    }

    waku::sync_wait(std::move(node).destroy());
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char *prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --duration <seconds>   Test duration per test (default: 10)\n"
              << "  --threads <count>      Number of threads (default: 4)\n"
              << "  --max-inflight <n>     Calls per batch (default: 256)\n"
              << "  --max-delay-us <n>     Maximum callback latency (default: 2000)\n"
              << "  --quick                Short run for CI\n"
              << "  --help                 Show this help\n";
}

int main(int argc, char **argv) {
    Config config;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            config.duration_sec = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::stoi(argv[++i]);
        } else if (arg == "--max-inflight" && i + 1 < argc) {
            config.max_inflight = std::stoi(argv[++i]);
        } else if (arg == "--max-delay-us" && i + 1 < argc) {
            config.max_delay_us = std::stoi(argv[++i]);
        } else if (arg == "--quick") {
            config.duration_sec = 1;
            config.max_inflight = 64;
            config.max_delay_us = 500;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::cout << "=== waku-cpp Stress Test ===\n";
    std::cout << "Duration:     " << config.duration_sec << " seconds per test\n";
    std::cout << "Threads:      " << config.num_threads << "\n";
    std::cout << "Max inflight: " << config.max_inflight << "\n";
    std::cout << "Max delay:    " << config.max_delay_us << " us\n";

    std::atomic<long long> stale{0};
    waku::set_log_handler([&stale](waku::LogLevel level, std::string_view msg) {
        if (level == waku::LogLevel::Warning &&
            msg.find("duplicate or stale") != std::string_view::npos) {
            stale++;
        }
    });

    int rc = 0;
    try {
        auto engine = std::make_shared<MockEngine>(config.num_threads);
        configure_echo(*engine, config);

        auto node = waku::sync_wait(waku::NodeHandle<waku::Initialized>::create(
            engine, waku::NodeConfig().relay(true)));
        auto running = waku::sync_wait(std::move(node).start());
        Stats stats;

        auto total_start = Clock::now();

        test_batched_calls(*engine, running, stats, config);
        test_multithread_callers(running, stats, config);
        test_duplicate_callbacks(*engine, running, stats, config);
        test_abandoned_calls(*engine, running, stats, config);
        test_cancellation_races(*engine, running, stats, config);
        test_event_producers(engine, stats, config);

        waku::sync_wait(std::move(running).destroy());
        engine->drain();

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();
        stats.stale_callbacks = stale.load();
        stats.print(total_elapsed);

        if (stats.failed()) {
            std::cout << "\n*** STRESS TEST FAILED ***\n";
            rc = 1;
        } else {
            std::cout << "\n=== STRESS TEST PASSED ===\n";
        }
    } catch (const waku::Error &e) {
        std::cerr << "waku error: " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        rc = 1;
    }

    waku::clear_log_handler();
    return rc;
}
