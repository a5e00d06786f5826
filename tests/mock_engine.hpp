// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file mock_engine.hpp
 * @brief Scripted NativeEngine for the test executables
 *
 * Every engine entry point consumes the next scripted Reply for its
 * operation name (or the default: synchronous success with an empty
 * payload). Delayed replies are delivered from a small pool of worker
 * threads in due-time order, so completion order can differ from call
 * order. SerialEngine models an engine with a single request thread.
 */

#ifndef WAKU_TESTS_MOCK_ENGINE_HPP
#define WAKU_TESTS_MOCK_ENGINE_HPP

#include <waku.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace waku::testing {

/**
 * Scripted outcome of one engine call
 */
struct Reply {
    enum class Mode {
        Callback,        ///< Invoke the callback (inline, or later if delay > 0)
        MissingCallback, ///< Return kRetMissingCallback, never invoke the callback
        Silent,          ///< Return kRetOk, never invoke the callback
        Held             ///< Return kRetOk, invoke the callback on release_held()
    };

    Mode mode = Mode::Callback;
    int ret = kRetOk;
    std::string payload;
    std::chrono::microseconds delay{0};
    int duplicates = 0;       ///< Extra deliveries after the first
    bool null_handle = false; ///< create_node only: return nullptr anyway
    bool echo = false;        ///< Reply with the call's first argument
    std::chrono::microseconds jitter{0}; ///< Random extra delay, up to this much

    static Reply ok(std::string payload = {}) {
        Reply r;
        r.payload = std::move(payload);
        return r;
    }

    static Reply fail(std::string message) {
        Reply r;
        r.ret = kRetErr;
        r.payload = std::move(message);
        return r;
    }

    static Reply code(int ret, std::string payload = {}) {
        Reply r;
        r.ret = ret;
        r.payload = std::move(payload);
        return r;
    }

    static Reply missing() {
        Reply r;
        r.mode = Mode::MissingCallback;
        return r;
    }

    static Reply silent() {
        Reply r;
        r.mode = Mode::Silent;
        return r;
    }

    /// Success carrying the call's first argument back
    static Reply echo_first_arg() {
        Reply r;
        r.echo = true;
        return r;
    }

    static Reply held(Reply reply) {
        reply.mode = Mode::Held;
        return reply;
    }

    Reply &after(std::chrono::microseconds d) {
        delay = d;
        return *this;
    }

    Reply &jittered(std::chrono::microseconds max_extra) {
        jitter = max_extra;
        return *this;
    }

    Reply &duplicated(int n) {
        duplicates = n;
        return *this;
    }

    Reply &without_handle() {
        null_handle = true;
        return *this;
    }
};

/**
 * Runs jobs on worker threads once their due time has passed
 *
 * Jobs still queued at destruction run immediately.
 */
class DelayedExecutor {
  public:
    using Clock = std::chrono::steady_clock;

    explicit DelayedExecutor(int workers = 4) {
        for (int i = 0; i < workers; i++) {
            threads_.emplace_back([this] { run(); });
        }
    }

    DelayedExecutor(const DelayedExecutor &) = delete;
    DelayedExecutor &operator=(const DelayedExecutor &) = delete;

    ~DelayedExecutor() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto &t : threads_) {
            if (t.get_id() == std::this_thread::get_id()) {
                t.detach();
            } else {
                t.join();
            }
        }
    }

    void post(std::chrono::microseconds delay, std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_.push(Job{Clock::now() + delay, seq_++, std::move(job)});
            outstanding_++;
        }
        cv_.notify_all();
    }

    /// Block until every posted job has run
    void drain() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    }

  private:
    struct Job {
        Clock::time_point due;
        uint64_t seq;
        std::function<void()> fn;

        bool operator>(const Job &other) const {
            return due != other.due ? due > other.due : seq > other.seq;
        }
    };

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            if (jobs_.empty()) {
                if (stopping_) {
                    return;
                }
                cv_.wait(lock);
                continue;
            }
            if (!stopping_ && Clock::now() < jobs_.top().due) {
                cv_.wait_until(lock, jobs_.top().due);
                continue;
            }
            Job job = jobs_.top();
            jobs_.pop();
            lock.unlock();
            job.fn();
            lock.lock();
            if (--outstanding_ == 0) {
                idle_cv_.notify_all();
            }
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::priority_queue<Job, std::vector<Job>, std::greater<Job>> jobs_;
    uint64_t seq_ = 0;
    size_t outstanding_ = 0;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

/**
 * Scripted engine with call counters and recorded arguments
 */
class MockEngine : public NativeEngine {
  public:
    using Args = std::vector<std::string>;

    explicit MockEngine(int workers = 4) : executor_(workers) {}

    // =========================================================================
    // Scripting
    // =========================================================================

    /// Queue a reply for the next call of operation op
    MockEngine &script(const std::string &op, Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_[op].push_back(std::move(reply));
        return *this;
    }

    /// Reply used once the queue for op is empty
    MockEngine &set_default(const std::string &op, Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaults_[op] = std::move(reply);
        return *this;
    }

    // =========================================================================
    // Inspection
    // =========================================================================

    [[nodiscard]] int calls(const std::string &op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto &[op, n] : calls_) {
            total += n;
        }
        return total;
    }

    /// Arguments of every call of op, oldest first
    [[nodiscard]] std::vector<Args> args(const std::string &op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = args_.find(op);
        return it == args_.end() ? std::vector<Args>{} : it->second;
    }

    [[nodiscard]] Args last_args(const std::string &op) const {
        auto all = args(op);
        return all.empty() ? Args{} : all.back();
    }

    /// Calls made with a handle that had already been destroyed
    [[nodiscard]] int calls_after_destroy() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_after_destroy_;
    }

    [[nodiscard]] int event_registrations() const { return calls("set_event_callback"); }

    /// Wait until every delayed callback has been delivered
    void drain() { executor_.drain(); }

    /// Deliver every held reply on the calling thread
    int release_held() {
        std::vector<HeldCall> held;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held.swap(held_);
        }
        for (const auto &call : held) {
            deliver(call.reply, call.cb, call.user_data);
        }
        return static_cast<int>(held.size());
    }

    // =========================================================================
    // Event delivery
    // =========================================================================

    /// Drive the most recently registered event callback on the calling thread
    bool emit_event(std::string payload, int ret = kRetOk) {
        NativeCallback cb = nullptr;
        void *user_data = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cb = event_cb_;
            user_data = event_user_data_;
        }
        if (!cb) {
            return false;
        }
        cb(ret, payload.data(), payload.size(), user_data);
        return true;
    }

    // =========================================================================
    // NativeEngine
    // =========================================================================

    void *create_node(const char *config_json, NativeCallback cb, void *user_data) override {
        Reply reply = begin("create", nullptr, {config_json});
        void *node = nullptr;
        if (!reply.null_handle && reply.ret == kRetOk && reply.mode != Reply::Mode::MissingCallback) {
            std::lock_guard<std::mutex> lock(mutex_);
            nodes_.push_back(static_cast<int>(nodes_.size()));
            node = &nodes_.back();
        }
        (void)respond(reply, cb, user_data);
        return node;
    }

    int start(void *node, NativeCallback cb, void *user_data) override {
        return respond(begin("start", node, {}), cb, user_data);
    }

    int stop(void *node, NativeCallback cb, void *user_data) override {
        return respond(begin("stop", node, {}), cb, user_data);
    }

    int destroy(void *node, NativeCallback cb, void *user_data) override {
        Reply reply = begin("destroy", node, {});
        {
            std::lock_guard<std::mutex> lock(mutex_);
            destroyed_.insert(node);
        }
        return respond(reply, cb, user_data);
    }

    int version(void *node, NativeCallback cb, void *user_data) override {
        Reply reply = begin("version", node, {});
        if (reply.payload.empty() && reply.ret == kRetOk) {
            reply.payload = "v0.0.0-mock";
        }
        return respond(reply, cb, user_data);
    }

    int listen_addresses(void *node, NativeCallback cb, void *user_data) override {
        return respond(begin("listen_addresses", node, {}), cb, user_data);
    }

    int connect(void *node, const char *address, int timeout_ms, NativeCallback cb,
                void *user_data) override {
        return respond(begin("connect", node, {address, std::to_string(timeout_ms)}), cb,
                       user_data);
    }

    void set_event_callback(void *node, NativeCallback cb, void *user_data) override {
        (void)begin("set_event_callback", node, {});
        std::lock_guard<std::mutex> lock(mutex_);
        event_cb_ = cb;
        event_user_data_ = user_data;
    }

    int relay_publish(void *node, const char *pubsub_topic, const char *message_json,
                      int timeout_ms, NativeCallback cb, void *user_data) override {
        return respond(
            begin("relay_publish", node, {pubsub_topic, message_json, std::to_string(timeout_ms)}),
            cb, user_data);
    }

    int relay_subscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                        void *user_data) override {
        return respond(begin("relay_subscribe", node, {pubsub_topic}), cb, user_data);
    }

    int relay_unsubscribe(void *node, const char *pubsub_topic, NativeCallback cb,
                          void *user_data) override {
        return respond(begin("relay_unsubscribe", node, {pubsub_topic}), cb, user_data);
    }

    int filter_subscribe(void *node, const char *pubsub_topic, const char *content_topics_json,
                         NativeCallback cb, void *user_data) override {
        return respond(begin("filter_subscribe", node, {pubsub_topic, content_topics_json}), cb,
                       user_data);
    }

    int filter_unsubscribe(void *node, const char *pubsub_topic, const char *content_topics_json,
                           NativeCallback cb, void *user_data) override {
        return respond(begin("filter_unsubscribe", node, {pubsub_topic, content_topics_json}), cb,
                       user_data);
    }

    int filter_unsubscribe_all(void *node, NativeCallback cb, void *user_data) override {
        return respond(begin("filter_unsubscribe_all", node, {}), cb, user_data);
    }

    int lightpush_publish(void *node, const char *pubsub_topic, const char *message_json,
                          NativeCallback cb, void *user_data) override {
        return respond(begin("lightpush_publish", node, {pubsub_topic, message_json}), cb,
                       user_data);
    }

    int store_query(void *node, const char *query_json, const char *peer_address, int timeout_ms,
                    NativeCallback cb, void *user_data) override {
        return respond(
            begin("store_query", node, {query_json, peer_address, std::to_string(timeout_ms)}),
            cb, user_data);
    }

  private:
    /// Count and record the call, then pop its reply
    Reply begin(const std::string &op, void *node, Args args) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_[op]++;
        args_[op].push_back(std::move(args));
        if (node && destroyed_.count(node)) {
            calls_after_destroy_++;
        }
        Reply reply;
        auto &queue = scripted_[op];
        if (!queue.empty()) {
            reply = std::move(queue.front());
            queue.pop_front();
        } else if (auto it = defaults_.find(op); it != defaults_.end()) {
            reply = it->second;
        }

        const Args &recorded = args_[op].back();
        if (reply.echo && !recorded.empty()) {
            reply.payload = recorded.front();
        }
        if (reply.jitter.count() > 0) {
            std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, reply.jitter.count());
            reply.delay += std::chrono::microseconds(dist(rng_));
        }
        return reply;
    }

    int respond(const Reply &reply, NativeCallback cb, void *user_data) {
        switch (reply.mode) {
        case Reply::Mode::MissingCallback:
            return kRetMissingCallback;
        case Reply::Mode::Silent:
            return kRetOk;
        case Reply::Mode::Held: {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.push_back(HeldCall{reply, cb, user_data});
            return kRetOk;
        }
        case Reply::Mode::Callback:
            break;
        }

        if (reply.delay.count() > 0) {
            executor_.post(reply.delay, [reply, cb, user_data] { deliver(reply, cb, user_data); });
        } else {
            deliver(reply, cb, user_data);
        }
        return reply.ret == kRetOk ? kRetOk : kRetErr;
    }

    static void deliver(const Reply &reply, NativeCallback cb, void *user_data) {
        for (int i = 0; i <= reply.duplicates; i++) {
            cb(reply.ret, reply.payload.data(), reply.payload.size(), user_data);
        }
    }

    struct HeldCall {
        Reply reply;
        NativeCallback cb;
        void *user_data;
    };

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Reply>> scripted_;
    std::map<std::string, Reply> defaults_;
    std::map<std::string, int> calls_;
    std::map<std::string, std::vector<Args>> args_;
    std::deque<int> nodes_;
    std::set<void *> destroyed_;
    int calls_after_destroy_ = 0;
    NativeCallback event_cb_ = nullptr;
    void *event_user_data_ = nullptr;
    std::vector<HeldCall> held_;
    std::mt19937_64 rng_{0x5eed};
    DelayedExecutor executor_;
};

/**
 * Engine with one worker thread, shaped like libwaku's request loop
 *
 * Each call blocks until the worker has taken the request off its queue.
 * The worker then waits the configured latency and invokes the callback
 * itself. The worker never accepts a request it issued, so a call made
 * from the worker thread is counted and refused with kRetMissingCallback.
 */
class SerialEngine : public NativeEngine {
  public:
    explicit SerialEngine(std::chrono::microseconds latency)
        : latency_(latency), worker_([this] { run(); }) {}

    SerialEngine(const SerialEngine &) = delete;
    SerialEngine &operator=(const SerialEngine &) = delete;

    ~SerialEngine() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        request_cv_.notify_all();
        worker_.join();
    }

    /// Calls refused because they were issued on the worker thread
    [[nodiscard]] int calls_from_worker() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_from_worker_;
    }

    /// Requests the worker has taken
    [[nodiscard]] uint64_t accepted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return accepted_;
    }

    void *create_node(const char *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "") == kRetOk ? &node_ : nullptr;
    }

    int start(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int stop(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int destroy(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int version(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "v-serial");
    }

    int listen_addresses(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, R"(["/ip4/127.0.0.1/tcp/60000"])");
    }

    int connect(void *, const char *, int, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    void set_event_callback(void *, NativeCallback, void *) override {}

    int relay_publish(void *, const char *, const char *, int, NativeCallback cb,
                      void *user_data) override {
        return submit(cb, user_data, "0x01");
    }

    int relay_subscribe(void *, const char *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int relay_unsubscribe(void *, const char *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int filter_subscribe(void *, const char *, const char *, NativeCallback cb,
                         void *user_data) override {
        return submit(cb, user_data, "");
    }

    int filter_unsubscribe(void *, const char *, const char *, NativeCallback cb,
                           void *user_data) override {
        return submit(cb, user_data, "");
    }

    int filter_unsubscribe_all(void *, NativeCallback cb, void *user_data) override {
        return submit(cb, user_data, "");
    }

    int lightpush_publish(void *, const char *, const char *, NativeCallback cb,
                          void *user_data) override {
        return submit(cb, user_data, "0x01");
    }

    int store_query(void *, const char *, const char *, int, NativeCallback cb,
                    void *user_data) override {
        return submit(cb, user_data, R"({"statusCode":200,"messages":[]})");
    }

  private:
    struct Request {
        NativeCallback cb;
        void *user_data;
        std::string payload;
    };

    int submit(NativeCallback cb, void *user_data, std::string payload) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (std::this_thread::get_id() == worker_.get_id()) {
            calls_from_worker_++;
            return kRetMissingCallback;
        }
        uint64_t ticket = ++submitted_;
        requests_.push_back(Request{cb, user_data, std::move(payload)});
        request_cv_.notify_all();
        accepted_cv_.wait(lock, [this, ticket] { return accepted_ >= ticket; });
        return kRetOk;
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            request_cv_.wait(lock, [this] { return stopping_ || !requests_.empty(); });
            if (requests_.empty()) {
                return;
            }
            Request request = std::move(requests_.front());
            requests_.pop_front();
            accepted_++;
            accepted_cv_.notify_all();
            lock.unlock();
            std::this_thread::sleep_for(latency_);
            request.cb(kRetOk, request.payload.data(), request.payload.size(),
                       request.user_data);
            lock.lock();
        }
    }

    mutable std::mutex mutex_;
    std::condition_variable request_cv_;
    std::condition_variable accepted_cv_;
    std::deque<Request> requests_;
    uint64_t submitted_ = 0;
    uint64_t accepted_ = 0;
    int calls_from_worker_ = 0;
    bool stopping_ = false;
    int node_ = 0;
    std::chrono::microseconds latency_;
    std::thread worker_;
};

} // namespace waku::testing

#endif // WAKU_TESTS_MOCK_ENGINE_HPP
