#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

#include "lcr/log/logger.hpp"


namespace cardwire::client {

enum class StreamPhase : std::uint8_t {
    Idle,
    Streaming,
    Committed,
    RolledBack
};

[[nodiscard]]
inline constexpr std::string_view to_string(StreamPhase p) noexcept {
    switch (p) {
        case StreamPhase::Idle:       return "Idle";
        case StreamPhase::Streaming:  return "Streaming";
        case StreamPhase::Committed:  return "Committed";
        case StreamPhase::RolledBack: return "RolledBack";
        default:                      return "Unknown";
    }
}

/*
===============================================================================
 client::StreamAccumulator
===============================================================================

Per-session buffer for streamed content with exact rollback.

  Idle --begin(current)--> Streaming --commit(text)--> Committed
                               |
                               +--rollback()--> RolledBack

- begin() copies the caller's current content into the snapshot before
  anything is sent, so even an immediate failure restores it.
- restart() clears the buffer (server "start" frame).
- append() concatenates chunks in arrival order.
- rollback() yields a string byte-identical to the snapshot.

Committed and RolledBack are terminal for a session; the next begin() starts
a new one. Appends outside Streaming are ignored.
===============================================================================
*/
class StreamAccumulator {
public:
    // Returns the new session number
    inline std::uint64_t begin(std::string current) {
        snapshot_ = std::move(current);
        buffer_.clear();
        phase_ = StreamPhase::Streaming;
        ++session_;
        CW_TRACE("[STREAM] Session " << session_ << " started (snapshot " << snapshot_.size() << " bytes)");
        return session_;
    }

    inline void restart() noexcept {
        if (phase_ == StreamPhase::Streaming) {
            buffer_.clear();
        }
    }

    inline bool append(std::string_view chunk) {
        if (phase_ != StreamPhase::Streaming) {
            return false;
        }
        buffer_.append(chunk);
        return true;
    }

    // Final content of the session
    [[nodiscard]]
    inline const std::string& commit(std::string text) {
        buffer_ = std::move(text);
        phase_ = StreamPhase::Committed;
        CW_TRACE("[STREAM] Session " << session_ << " committed (" << buffer_.size() << " bytes)");
        return buffer_;
    }

    // The content captured by begin()
    [[nodiscard]]
    inline const std::string& rollback() {
        buffer_.clear();
        phase_ = StreamPhase::RolledBack;
        CW_TRACE("[STREAM] Session " << session_ << " rolled back");
        return snapshot_;
    }

    inline void reset() noexcept {
        phase_ = StreamPhase::Idle;
        buffer_.clear();
        snapshot_.clear();
    }

    [[nodiscard]] inline StreamPhase phase() const noexcept { return phase_; }
    [[nodiscard]] inline bool streaming() const noexcept { return phase_ == StreamPhase::Streaming; }
    [[nodiscard]] inline const std::string& buffer() const noexcept { return buffer_; }
    [[nodiscard]] inline const std::string& snapshot() const noexcept { return snapshot_; }
    [[nodiscard]] inline std::uint64_t session() const noexcept { return session_; }

private:
    StreamPhase phase_{StreamPhase::Idle};
    std::string buffer_;
    std::string snapshot_;
    std::uint64_t session_{0};
};

} // namespace cardwire::client
