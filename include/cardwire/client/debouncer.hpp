#pragma once

#include <chrono>


namespace cardwire::client {

// Trailing-edge one-shot timer polled by the owner.
// Every touch() pushes the deadline to now + delay; due() fires once when the
// deadline passes without further touches.
template <class TimePoint>
class Debouncer {
public:
    explicit Debouncer(std::chrono::milliseconds delay) noexcept
        : delay_(delay)
    {
    }

    inline void touch(TimePoint now) noexcept {
        deadline_ = now + delay_;
        armed_ = true;
    }

    inline void cancel() noexcept {
        armed_ = false;
    }

    [[nodiscard]]
    inline bool due(TimePoint now) noexcept {
        if (!armed_ || now < deadline_) {
            return false;
        }
        armed_ = false;
        return true;
    }

    [[nodiscard]] inline bool armed() const noexcept { return armed_; }
    [[nodiscard]] inline TimePoint deadline() const noexcept { return deadline_; }
    [[nodiscard]] inline std::chrono::milliseconds delay() const noexcept { return delay_; }

private:
    std::chrono::milliseconds delay_;
    TimePoint deadline_{};
    bool armed_{false};
};

} // namespace cardwire::client
