// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file callback_storage.hpp
 * @brief Internal storage for in-flight single-shot engine calls
 *
 * This is an internal header - not part of the public API.
 */

#ifndef WAKU_DETAIL_CALLBACK_STORAGE_HPP
#define WAKU_DETAIL_CALLBACK_STORAGE_HPP

#include <waku/log.hpp>
#include <waku/response.hpp>
#include <waku/detail/resume_executor.hpp>

#include <array>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace waku::detail {

/**
 * One-shot completion cell
 *
 * Holds at most one Response plus the coroutine waiting for it. Shared
 * between the awaiting coroutine and the pending-call pool, so a callback
 * that arrives after the awaiter was abandoned still writes into live
 * memory.
 *
 * The waiter moves through Idle -> Waiting -> Resuming -> Resumed, or to
 * Detached from Idle or Waiting. Only resume_waiter() leaves Waiting for
 * Resuming, and only while no one has detached, so a detached waiter is
 * never resumed.
 */
class CompletionCell {
  public:
    enum class State { Idle, Waiting, Resuming, Resumed, Detached };

    /**
     * Store the response
     * @return True if a waiter is armed; schedule resume_waiter() once
     */
    [[nodiscard]] bool complete(Response response) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_) {
            return false;
        }
        response_ = std::move(response);
        completed_ = true;
        return state_ == State::Waiting;
    }

    /**
     * Register the waiting coroutine
     * @return False if the response is already available (do not suspend)
     */
    [[nodiscard]] bool arm(std::coroutine_handle<> waiter) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Detached) {
            return true; // Cancelled: stay suspended until destroyed
        }
        if (completed_) {
            return false;
        }
        waiter_ = waiter;
        state_ = State::Waiting;
        return true;
    }

    /// Resume the armed waiter on this thread, unless it was detached first
    void resume_waiter() {
        std::coroutine_handle<> waiter;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Waiting) {
                return;
            }
            waiter = std::exchange(waiter_, {});
            state_ = State::Resuming;
            resumer_ = std::this_thread::get_id();
        }
        // Outside the lock; the coroutine may finish and free its frame
        waiter.resume();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = State::Resumed;
        }
        resumed_cv_.notify_all();
    }

    /// Forget the waiter without blocking; a later completion resumes nothing
    void detach() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Idle || state_ == State::Waiting) {
            waiter_ = {};
            state_ = State::Detached;
        }
    }

    /**
     * Detach the waiter, or wait out a resume running on another thread
     *
     * @return True if no resume can start from this cell any more. False
     *         if a resume ran (or finished while waiting); the coroutine
     *         may since have suspended somewhere else.
     */
    [[nodiscard]] bool cancel() {
        std::unique_lock<std::mutex> lock(mutex_);
        switch (state_) {
        case State::Idle:
        case State::Waiting:
            waiter_ = {};
            state_ = State::Detached;
            return true;
        case State::Detached:
            return true;
        case State::Resuming:
            if (resumer_ == std::this_thread::get_id()) {
                return true; // Destroyed from inside its own resume
            }
            resumed_cv_.wait(lock, [this] { return state_ != State::Resuming; });
            return false;
        case State::Resumed:
            break;
        }
        return false;
    }

    [[nodiscard]] State state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    [[nodiscard]] Response take() {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::move(response_);
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable resumed_cv_;
    Response response_;
    std::coroutine_handle<> waiter_;
    State state_ = State::Idle;
    std::thread::id resumer_;
    bool completed_ = false;
};

/**
 * Engine call a chain of coroutines is currently suspended on
 *
 * Shared by every Task awaiting one another in a chain. Each bridged call
 * records its cell here before arming it; the owner of the outermost Task
 * cancels through it before destroying the frames.
 */
class SuspendPoint {
  public:
    void set(std::shared_ptr<CompletionCell> cell) {
        std::lock_guard<std::mutex> lock(mutex_);
        cell_ = std::move(cell);
    }

    [[nodiscard]] std::shared_ptr<CompletionCell> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cell_;
    }

    /**
     * Make sure no engine callback resumes the chain after this returns
     *
     * If a callback is resuming the chain on another thread, waits until it
     * suspends again and detaches that call instead.
     */
    void cancel() {
        std::shared_ptr<CompletionCell> previous;
        for (;;) {
            auto cell = current();
            if (!cell || cell == previous || cell->cancel()) {
                return;
            }
            previous = std::move(cell);
        }
    }

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<CompletionCell> cell_;
};

/** Sentinel value marking a slot as in-use (allocated, not on free list).
 *  Distinct from -1 (end of free list). */
inline constexpr int kSlotInUse = -2;

struct PendingSlot {
    std::shared_ptr<CompletionCell> cell;
    uint32_t generation = 0;     // Bumped on every allocation; stale tokens never match
    int next_free = kSlotInUse;  // Free list link (-1 = end of list, kSlotInUse = allocated)
};

/**
 * Pool of pending single-shot calls with sharding for reduced contention
 *
 * The engine never receives a pointer into this pool. allocate() returns an
 * opaque token encoding (generation, shard, slot) which is passed as the
 * callback user_data; claim() resolves it at most once. Duplicate callbacks,
 * or callbacks carrying a token whose slot was recycled, resolve to null.
 *
 * Uses std::deque so slot references stay valid when a shard grows.
 *
 * Thread-safe.
 */
class PendingCallPool {
  public:
    /// Number of shards (power of 2 for efficient modulo)
    static constexpr size_t kShardCount = 8;
    static constexpr size_t kShardMask = kShardCount - 1;
    static constexpr unsigned kShardBits = 3;
    static constexpr uint64_t kIndexLimit = uint64_t{1} << (32 - kShardBits);

    static_assert(sizeof(void *) >= sizeof(uint64_t), "token encoding needs 64-bit pointers");

    explicit PendingCallPool(size_t initial_size_per_shard = 16) {
        for (size_t s = 0; s < kShardCount; ++s) {
            init_shard(s, initial_size_per_shard);
        }
    }

    PendingCallPool(const PendingCallPool &) = delete;
    PendingCallPool &operator=(const PendingCallPool &) = delete;

    /**
     * Register a cell - O(1) amortized
     * @return Token to hand to the engine as user_data (never null)
     */
    [[nodiscard]] void *allocate(std::shared_ptr<CompletionCell> cell) {
        size_t shard_idx = get_shard_index();
        Shard &shard = shards_[shard_idx];
        std::lock_guard<std::mutex> lock(shard.mutex);

        int idx = shard.free_head;
        if (idx >= 0) {
            shard.free_head = shard.slots[idx].next_free;
        } else {
            idx = grow_shard(shard);
        }

        PendingSlot &slot = shard.slots[idx];
        slot.next_free = kSlotInUse;
        slot.cell = std::move(cell);
        if (++slot.generation == 0) {
            slot.generation = 1; // Token 0 would be a null user_data
        }
        return encode(slot.generation, shard_idx, static_cast<size_t>(idx));
    }

    /**
     * Resolve a token and release its slot - O(1)
     * @return The registered cell, or null if the token was already claimed
     */
    [[nodiscard]] std::shared_ptr<CompletionCell> claim(void *token) {
        auto raw = reinterpret_cast<uintptr_t>(token);
        auto generation = static_cast<uint32_t>(static_cast<uint64_t>(raw) >> 32);
        auto low = static_cast<uint32_t>(raw);
        size_t shard_idx = low & kShardMask;
        size_t idx = low >> kShardBits;

        Shard &shard = shards_[shard_idx];
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (idx >= shard.slots.size()) {
            return nullptr;
        }
        PendingSlot &slot = shard.slots[idx];
        if (slot.next_free != kSlotInUse || slot.generation != generation) {
            return nullptr; // Already claimed or recycled
        }
        auto cell = std::move(slot.cell);
        slot.cell.reset();
        slot.next_free = shard.free_head;
        shard.free_head = static_cast<int>(idx);
        return cell;
    }

    /// Number of registered, not yet claimed calls
    [[nodiscard]] size_t pending() const {
        size_t n = 0;
        for (const Shard &shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const PendingSlot &slot : shard.slots) {
                if (slot.next_free == kSlotInUse) {
                    ++n;
                }
            }
        }
        return n;
    }

  private:
    struct Shard {
        std::deque<PendingSlot> slots; // deque: references stable on growth
        mutable std::mutex mutex;
        int free_head = -1; // Index of first free slot (-1 = empty)
    };

    static void *encode(uint32_t generation, size_t shard_idx, size_t idx) noexcept {
        uint64_t low = (static_cast<uint64_t>(idx) << kShardBits) | shard_idx;
        uint64_t raw = (static_cast<uint64_t>(generation) << 32) | low;
        return reinterpret_cast<void *>(static_cast<uintptr_t>(raw));
    }

    void init_shard(size_t shard_idx, size_t initial_size) {
        Shard &shard = shards_[shard_idx];
        if (initial_size == 0) {
            shard.free_head = -1;
            return;
        }
        shard.slots.resize(initial_size);
        shard.free_head = 0;

        // Initialize free list: each slot points to the next
        for (size_t i = 0; i < initial_size; ++i) {
            shard.slots[i].next_free = static_cast<int>(i + 1);
        }
        shard.slots[initial_size - 1].next_free = -1;
    }

    // Must be called with shard.mutex held; returns the first new slot index
    static int grow_shard(Shard &shard) {
        size_t old_size = shard.slots.size();
        size_t new_size = (old_size == 0) ? 16 : old_size * 2;
        if (new_size > kIndexLimit) {
            throw std::length_error("too many pending engine calls");
        }
        shard.slots.resize(new_size);

        for (size_t i = old_size; i < new_size; ++i) {
            shard.slots[i].next_free = static_cast<int>(i + 1);
        }
        shard.slots[new_size - 1].next_free = -1;

        // Rest of the new slots become the free list
        shard.free_head = static_cast<int>(old_size + 1);
        return static_cast<int>(old_size);
    }

    /**
     * Get shard index for current thread
     *
     * Uses cached thread-local value to avoid repeated hashing.
     */
    static size_t get_shard_index() {
        thread_local size_t cached_shard = compute_shard_index();
        return cached_shard;
    }

    static size_t compute_shard_index() {
        // Hash thread ID with bit mixing to avoid clustering
        // when thread IDs are sequential (common on glibc).
        auto tid = std::this_thread::get_id();
        size_t hash = std::hash<std::thread::id>{}(tid);
        hash ^= hash >> 16;
        hash *= 0x45d9f3bU;
        hash ^= hash >> 16;
        return hash & kShardMask;
    }

    std::array<Shard, kShardCount> shards_;
};

/// Process-wide pool shared by every node.
/// Never destroyed: engine threads may deliver callbacks during static destruction.
[[nodiscard]] inline PendingCallPool &pending_calls() {
    static PendingCallPool *pool = new PendingCallPool();
    return *pool;
}

} // namespace waku::detail

/**
 * C callback trampoline for single-shot calls
 *
 * extern "C" linkage is required because this function pointer is passed
 * to the C API. Using C++ linkage as a C function pointer is technically UB.
 */
extern "C" inline void waku_detail_call_trampoline(int ret, const char *msg, size_t len,
                                                   void *user_data) {
    try {
        auto cell = waku::detail::pending_calls().claim(user_data);
        if (!cell) {
            waku::log_emit(waku::LogLevel::Warning,
                           "ignoring duplicate or stale engine callback (ret=" +
                               std::to_string(ret) + ")");
            return;
        }
        if (cell->complete(waku::Response::from_native(ret, msg, len))) {
            // Resume on a worker, never on the engine's callback thread
            waku::detail::resume_executor().post(
                [cell = std::move(cell)] { cell->resume_waiter(); });
        }
    } catch (...) {
        // Exceptions cannot propagate through extern "C" (UB)
        std::terminate();
    }
}

#endif // WAKU_DETAIL_CALLBACK_STORAGE_HPP
