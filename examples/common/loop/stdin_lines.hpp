#pragma once

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "lcr/lockfree/spsc_ring.hpp"


namespace cardwire::examples::loop {

// Reads stdin lines on a background thread and hands them to the poll loop
// through an SPSC ring. The reader is detached: std::getline cannot be
// interrupted portably.
class StdinLines {
    struct Shared {
        lcr::lockfree::spsc_ring<std::string, 64> ring;
        std::atomic<bool> eof{false};
    };

public:
    StdinLines()
        : shared_(std::make_shared<Shared>())
    {
        std::thread([shared = shared_] { run_(*shared); }).detach();
    }

    [[nodiscard]]
    inline bool pop(std::string& out) noexcept {
        return shared_->ring.pop(out);
    }

    // stdin reached EOF and every line was consumed
    [[nodiscard]]
    inline bool exhausted() const noexcept {
        return shared_->eof.load(std::memory_order_acquire) && shared_->ring.empty();
    }

private:
    std::shared_ptr<Shared> shared_;

    static inline void run_(Shared& shared) {
        std::string line;
        while (std::getline(std::cin, line)) {
            while (!shared.ring.push(std::move(line))) {
                std::this_thread::yield();
            }
            line.clear();
        }
        shared.eof.store(true, std::memory_order_release);
    }
};

// Yields after a run of idle iterations
inline void manage_idle_spins(bool& did_work, int& idle_spins, int max_idle_spins = 100) {
    if (did_work) {
        idle_spins = 0;
        did_work = false;
    } else {
        if (++idle_spins > max_idle_spins) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            idle_spins = 0;
        }
    }
}

} // namespace cardwire::examples::loop
