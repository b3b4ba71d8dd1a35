// -----------------------------------------------------------------------------
// SPSC ring buffer with compile-time capacity
// Lock-free, wait-free, cacheline-separated producer/consumer indices.
//
// Example:
//     spsc_ring<websocket::Event, 1024> queue;
//     queue.push(std::move(ev));
//     websocket::Event out;
//     queue.pop(out);
//
// Notes:
//   - Capacity must be a power of two (one slot is kept free)
//   - Single Producer, Single Consumer only
//   - T must be default constructible and nothrow move assignable
//   - clear() is consumer-side and only safe once the producer is stopped
// -----------------------------------------------------------------------------
#pragma once


#include <array>
#include <atomic>
#include <cstddef>
#include <utility>
#include <type_traits>


namespace lcr::lockfree {

template <typename T, std::size_t Capacity>
class alignas(64) spsc_ring {
    static_assert((Capacity >= 2) && ((Capacity & (Capacity - 1)) == 0),
                  "Capacity must be power of two and >= 2");
    static_assert(std::is_nothrow_move_assignable_v<T>,
                  "spsc_ring elements must be nothrow move assignable");

public:
    spsc_ring() noexcept = default;
    ~spsc_ring() noexcept = default;

    spsc_ring(const spsc_ring&) = delete;
    spsc_ring& operator=(const spsc_ring&) = delete;

    // Push (copy)
    [[nodiscard]] inline bool push(const T& item) {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = item;
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Push (move)
    [[nodiscard]] inline bool push(T&& item) noexcept {
        const std::size_t head = head_.index.load(std::memory_order_relaxed);
        const std::size_t next = (head + 1) & MASK;
        if (next == tail_.index.load(std::memory_order_acquire))
            return false; // full
        buffer_[head] = std::move(item);
        head_.index.store(next, std::memory_order_release);
        return true;
    }

    // Pop (move)
    [[nodiscard]] inline bool pop(T& out) noexcept {
        const std::size_t tail = tail_.index.load(std::memory_order_relaxed);
        if (tail == head_.index.load(std::memory_order_acquire))
            return false; // empty
        out = std::move(buffer_[tail]);
        buffer_[tail] = T{};
        tail_.index.store((tail + 1) & MASK, std::memory_order_release);
        return true;
    }

    // Drop everything currently queued
    inline void clear() noexcept {
        T sink;
        while (pop(sink)) {
        }
    }

    [[nodiscard]] inline bool empty() const noexcept {
        return tail_.index.load(std::memory_order_acquire) ==
               head_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool full() const noexcept {
        const std::size_t next = (head_.index.load(std::memory_order_relaxed) + 1) & MASK;
        return next == tail_.index.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline constexpr std::size_t capacity() const noexcept { return Capacity - 1; }

    [[nodiscard]] inline std::size_t used() const noexcept {
        const std::size_t h = head_.index.load(std::memory_order_acquire);
        const std::size_t t = tail_.index.load(std::memory_order_acquire);
        return (h - t) & MASK;
    }

private:
    struct alignas(64) PaddedAtomic {
        std::atomic<std::size_t> index{0};
    };

    static constexpr std::size_t MASK = Capacity - 1;
    std::array<T, Capacity> buffer_{};
    PaddedAtomic head_;
    PaddedAtomic tail_;
};

} // namespace lcr::lockfree
