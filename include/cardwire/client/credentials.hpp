#pragma once

#include <string>
#include <memory>
#include <utility>
#include <functional>

#include "lcr/optional.hpp"


namespace cardwire::client::credentials {

// -----------------------------------------------------------------------------
// Provider
// -----------------------------------------------------------------------------
//
// Access to the stored auth token. Token persistence belongs to the host
// application: the channel clients only call get(), once per connection
// attempt, so a token refreshed between attempts is picked up on reconnect.
//
// -----------------------------------------------------------------------------
struct Provider {
    std::function<lcr::optional<std::string>()> get;
    std::function<void(std::string)> set;
    std::function<void()> remove;

    [[nodiscard]]
    inline bool valid() const noexcept {
        return static_cast<bool>(get);
    }
};

// Provider for a fixed token (CLI, tests)
[[nodiscard]]
inline Provider fixed(std::string token) {
    Provider p;
    p.get = [token = std::move(token)]() -> lcr::optional<std::string> {
        if (token.empty()) {
            return {};
        }
        return token;
    };
    p.set = [](std::string) {};
    p.remove = [] {};
    return p;
}

// In-process token store. Copies of the provider share the stored value.
class MemoryStorage {
public:
    MemoryStorage()
        : token_(std::make_shared<lcr::optional<std::string>>())
    {
    }

    explicit MemoryStorage(std::string token)
        : MemoryStorage()
    {
        *token_ = std::move(token);
    }

    [[nodiscard]]
    inline Provider provider() const {
        Provider p;
        auto slot = token_;
        p.get = [slot]() { return *slot; };
        p.set = [slot](std::string token) { *slot = std::move(token); };
        p.remove = [slot]() { slot->reset(); };
        return p;
    }

    inline void set(std::string token) { *token_ = std::move(token); }
    inline void remove() { token_->reset(); }

    [[nodiscard]]
    inline lcr::optional<std::string> get() const { return *token_; }

private:
    std::shared_ptr<lcr::optional<std::string>> token_;
};

} // namespace cardwire::client::credentials
