#pragma once

#include <atomic>
#include <array>
#include <optional>
#include <cstddef>

namespace core {

/**
 * Single-Producer-Single-Consumer (SPSC) Lock-free Ringbuffer.
 * Hands tracker results to the frame loop and frame-loop snapshots to the
 * OSC sender without locking either side.
 *
 * One slot is kept free to tell full from empty, so at most Capacity - 1
 * items are queued.
 *
 * @tparam T Element type (moved in and out)
 * @tparam Capacity Number of slots
 */
template<typename T, size_t Capacity>
class SpscQueue {
    static_assert(Capacity >= 2, "SpscQueue needs at least two slots");

public:
    SpscQueue() : head_(0), tail_(0) {}

    // Non-copyable
    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;

    /**
     * Pushes an item into the queue.
     * Returns false if the queue is full.
     * Thread-safety: Producer thread only.
     */
    bool try_push(T item) {
        const size_t current_tail = tail_.load(std::memory_order_relaxed);
        const size_t next_tail = (current_tail + 1) % Capacity;

        if (next_tail == head_.load(std::memory_order_acquire)) {
            return false; // Queue is full
        }

        buffer_[current_tail] = std::move(item);
        tail_.store(next_tail, std::memory_order_release);
        return true;
    }

    /**
     * Pops the oldest item, std::nullopt if empty.
     * Thread-safety: Consumer thread only.
     */
    std::optional<T> try_pop() {
        const size_t current_head = head_.load(std::memory_order_relaxed);

        if (current_head == tail_.load(std::memory_order_acquire)) {
            return std::nullopt; // Queue is empty
        }

        T item = std::move(buffer_[current_head]);
        head_.store((current_head + 1) % Capacity, std::memory_order_release);
        return item;
    }

    /**
     * Pops everything currently queued and keeps only the newest item.
     * Returns the number of items consumed (0 leaves `latest` untouched).
     * Thread-safety: Consumer thread only.
     */
    size_t drain_latest(T& latest) {
        size_t consumed = 0;
        while (auto item = try_pop()) {
            latest = std::move(*item);
            ++consumed;
        }
        return consumed;
    }

    bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        if (tail >= head) return tail - head;
        return Capacity + tail - head;
    }

    static constexpr size_t capacity() { return Capacity - 1; }

private:
    // Separate cache lines for head and tail to prevent false sharing
    static constexpr size_t CACHE_LINE_SIZE = 64;

    alignas(CACHE_LINE_SIZE) std::atomic<size_t> head_;
    alignas(CACHE_LINE_SIZE) std::atomic<size_t> tail_;

    std::array<T, Capacity> buffer_;
};

} // namespace core
