#pragma once

#include <chrono>


namespace cardwire::core::transport::connection {

// One-purpose periodic timer driven by the Connection poll loop.
// Deadlines advance by whole intervals from the arm time, so a late poll
// never drifts the schedule and never fires twice for one interval.
template <class TimePoint>
class Keepalive {
public:
    explicit Keepalive(std::chrono::milliseconds interval) noexcept
        : interval_(interval)
    {
    }

    inline void arm(TimePoint now) noexcept {
        if (interval_.count() <= 0) {
            return;
        }
        armed_ = true;
        next_ = now + interval_;
    }

    inline void disarm() noexcept {
        armed_ = false;
    }

    [[nodiscard]]
    inline bool armed() const noexcept {
        return armed_;
    }

    // Returns true once per elapsed interval
    [[nodiscard]]
    inline bool due(TimePoint now) noexcept {
        if (!armed_ || now < next_) {
            return false;
        }
        while (next_ <= now) {
            next_ += interval_;
        }
        return true;
    }

    [[nodiscard]]
    inline TimePoint next_deadline() const noexcept {
        return next_;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds interval() const noexcept {
        return interval_;
    }

private:
    std::chrono::milliseconds interval_;
    TimePoint next_{};
    bool armed_{false};
};

} // namespace cardwire::core::transport::connection
