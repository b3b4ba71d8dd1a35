#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <utility>
#include <exception>
#include <functional>
#include <string_view>

#include "cardwire/core/transport/error.hpp"
#include "lcr/log/logger.hpp"


namespace cardwire::core::transport::connection {

enum class DeferredState : std::uint8_t {
    Pending,
    Resolved,
    Rejected
};

[[nodiscard]]
inline constexpr std::string_view to_string(DeferredState s) noexcept {
    switch (s) {
        case DeferredState::Pending:  return "Pending";
        case DeferredState::Resolved: return "Resolved";
        case DeferredState::Rejected: return "Rejected";
        default:                      return "Unknown";
    }
}

/*
===============================================================================
 connection::Deferred
===============================================================================

Single-threaded, poll-settled result of one open() request.

- Resolves when the transport reaches Open.
- Rejects with the failure of the attempt (or Cancelled on close()).
- Settles exactly once; later settle calls are ignored.
- Continuations registered with then() run inside the poll() call that
  settles the deferred, or immediately if it is already settled.

Copies share state. A default-constructed Deferred is already rejected with
InvalidState and is used for requests refused synchronously.
===============================================================================
*/
class Deferred {
public:
    using Continuation = std::function<void(Error)>;

    Deferred()
        : shared_(std::make_shared<Shared>())
    {
        shared_->state = DeferredState::Rejected;
        shared_->error = Error::InvalidState;
    }

    [[nodiscard]]
    static Deferred pending() {
        Deferred d;
        d.shared_->state = DeferredState::Pending;
        d.shared_->error = Error::None;
        return d;
    }

    [[nodiscard]]
    static Deferred resolved() {
        Deferred d = pending();
        d.resolve();
        return d;
    }

    [[nodiscard]]
    static Deferred rejected(Error error) {
        Deferred d = pending();
        d.reject(error);
        return d;
    }

    [[nodiscard]] inline DeferredState state() const noexcept { return shared_->state; }
    [[nodiscard]] inline bool is_pending()  const noexcept { return shared_->state == DeferredState::Pending; }
    [[nodiscard]] inline bool is_resolved() const noexcept { return shared_->state == DeferredState::Resolved; }
    [[nodiscard]] inline bool is_rejected() const noexcept { return shared_->state == DeferredState::Rejected; }

    // Error::None when resolved or pending
    [[nodiscard]] inline Error error() const noexcept { return shared_->error; }

    // Registers a continuation receiving Error::None on success
    inline void then(Continuation fn) {
        if (!fn) {
            return;
        }
        if (is_pending()) {
            shared_->continuations.push_back(std::move(fn));
            return;
        }
        invoke_(fn, shared_->error);
    }

    inline void resolve() {
        settle_(DeferredState::Resolved, Error::None);
    }

    inline void reject(Error error) {
        settle_(DeferredState::Rejected, error);
    }

    [[nodiscard]]
    inline bool same_as(const Deferred& other) const noexcept {
        return shared_ == other.shared_;
    }

private:
    struct Shared {
        DeferredState state{DeferredState::Pending};
        Error error{Error::None};
        std::vector<Continuation> continuations;
    };

    std::shared_ptr<Shared> shared_;

    inline void settle_(DeferredState state, Error error) {
        if (!is_pending()) {
            return;
        }
        shared_->state = state;
        shared_->error = error;
        auto continuations = std::move(shared_->continuations);
        shared_->continuations.clear();
        for (auto& fn : continuations) {
            invoke_(fn, error);
        }
    }

    // Continuations are user code: a throwing one is reported, not propagated
    static inline void invoke_(const Continuation& fn, Error error) {
        try {
            fn(error);
        }
        catch (const std::exception& e) {
            CW_ERROR("[CONN] Deferred continuation threw: " << e.what());
        }
        catch (...) {
            CW_ERROR("[CONN] Deferred continuation threw a non-standard exception");
        }
    }
};

} // namespace cardwire::core::transport::connection
