#pragma once

#include <chrono>
#include <algorithm>

#include "cardwire/core/transport/error.hpp"


namespace cardwire::core::transport::connection {

// -----------------------------------------------------------------------------
// ReconnectPolicy
// -----------------------------------------------------------------------------
//
// Bounded linear backoff:
//
//   delay(attempt) = base_delay * (attempt + 1)     for attempt < max_attempts
//
// `attempt` counts retries already scheduled since the last successful open.
// The counter is owned here and only moves through schedule() / reset().
//
// -----------------------------------------------------------------------------
class ReconnectPolicy {
public:
    ReconnectPolicy(int max_attempts, std::chrono::milliseconds base_delay) noexcept
        : max_attempts_(std::max(max_attempts, 0))
        , base_delay_(base_delay)
    {
    }

    // True if another retry may be scheduled after `error`.
    [[nodiscard]]
    inline bool allows(Error error) const noexcept {
        return is_retryable(error) && attempts_ < max_attempts_;
    }

    [[nodiscard]]
    inline bool exhausted() const noexcept {
        return attempts_ >= max_attempts_;
    }

    // Delay for the next retry, then count it
    [[nodiscard]]
    inline std::chrono::milliseconds schedule() noexcept {
        const auto delay = base_delay_ * (attempts_ + 1);
        ++attempts_;
        return delay;
    }

    // Called on every successful open
    inline void reset() noexcept {
        attempts_ = 0;
    }

    [[nodiscard]]
    inline int attempts() const noexcept {
        return attempts_;
    }

    [[nodiscard]]
    inline int max_attempts() const noexcept {
        return max_attempts_;
    }

    [[nodiscard]]
    inline std::chrono::milliseconds base_delay() const noexcept {
        return base_delay_;
    }

private:
    int max_attempts_;
    std::chrono::milliseconds base_delay_;
    int attempts_{0};
};

} // namespace cardwire::core::transport::connection
