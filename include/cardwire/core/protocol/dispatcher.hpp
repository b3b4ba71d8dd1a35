#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <utility>
#include <cstdint>
#include <chrono>
#include <exception>
#include <functional>
#include <unordered_map>

#include "cardwire/core/transport/concepts.hpp"
#include "cardwire/core/protocol/parser/result.hpp"
#include "cardwire/core/protocol/parser/common.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace cardwire::core::protocol {

// -----------------------------------------------------------------------------
// Frame
// -----------------------------------------------------------------------------
//
// One parsed inbound message as seen by raw handlers. `root` and `raw` are only
// valid for the duration of the handler call.
//
// -----------------------------------------------------------------------------
struct Frame {
    std::string_view type;
    simdjson::dom::element root;
    std::string_view raw;
};

/*
===============================================================================
 protocol::Dispatcher
===============================================================================

Routes inbound text frames to handlers registered per "type" tag.

Routing rules:
  - Invalid JSON, a non-object root or a missing / non-string "type" is
    logged and dropped
  - "pong" is intercepted: counted and timestamped, never delivered
  - Unknown types are dropped silently (debug log only)
  - Handlers of a type run in registration order

Handler isolation:
  - Each handler runs in its own try/catch; a throwing handler is logged and
    counted, and the remaining handlers of the frame still run
  - Nothing escapes dispatch()

Subscriptions:
  - on() returns an Unsubscribe callable
  - Calling it twice, from inside a handler, or after the Dispatcher has been
    destroyed is safe (the closure only holds a weak reference)
  - Handlers removed while a frame is being dispatched still see that frame

Single-threaded: dispatch(), on() and unsubscribe calls must come from the
thread driving poll().
===============================================================================
*/

template <transport::ClockConcept Clock = std::chrono::steady_clock>
class Dispatcher {
public:
    using Handler     = std::function<void(const Frame&)>;
    using Unsubscribe = std::function<void()>;
    using time_point  = typename Clock::time_point;

    static constexpr std::string_view PONG_TYPE = "pong";

public:
    Dispatcher()
        : table_(std::make_shared<Table>())
    {
    }

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Registers `handler` for frames whose "type" equals `type`
    [[nodiscard]]
    inline Unsubscribe on(std::string type, Handler handler) {
        if (!handler) {
            return [] {};
        }
        const std::uint64_t id = ++table_->next_id;
        table_->handlers[type].push_back(Entry{id, std::move(handler)});
        CW_TRACE("[DISPATCH] Handler #" << id << " registered for '" << type << "'");

        std::weak_ptr<Table> weak = table_;
        return [weak, type = std::move(type), id]() {
            auto table = weak.lock();
            if (!table) {
                return;
            }
            auto it = table->handlers.find(type);
            if (it == table->handlers.end()) {
                return;
            }
            auto& list = it->second;
            for (auto e = list.begin(); e != list.end(); ++e) {
                if (e->id == id) {
                    list.erase(e);
                    break;
                }
            }
            if (list.empty()) {
                table->handlers.erase(it);
            }
        };
    }

    // Typed subscription: `parse(root, Schema&) -> parser::Result` validates
    // the frame before `handler(const Schema&)` sees it.
    template <class Schema, class ParseFn, class Fn>
    [[nodiscard]]
    inline Unsubscribe on_parsed(std::string type, ParseFn parse, Fn handler) {
        return on(std::move(type),
            [this_table = std::weak_ptr<Table>(table_), parse = std::move(parse), handler = std::move(handler)](const Frame& frame) {
                Schema msg;
                if (parse(frame.root, msg) != parser::Result::Parsed) {
                    if (auto table = this_table.lock()) {
                        ++table->schema_failures;
                    }
                    return;
                }
                handler(msg);
            });
    }

    // Entry point for every inbound text frame
    inline parser::Result dispatch(std::string_view raw) {
        ++frames_received_;

        simdjson::dom::element root;
        auto error = json_.parse(raw.data(), raw.size()).get(root);
        if (error) {
            ++dropped_frames_;
            CW_WARN("[DISPATCH] Invalid JSON (" << simdjson::error_message(error) << "): " << preview_(raw));
            return parser::Result::InvalidJson;
        }

        std::string_view type;
        auto r = parser::parse_type_required(root, type);
        if (r != parser::Result::Parsed) {
            ++dropped_frames_;
            CW_WARN("[DISPATCH] Frame without a valid 'type' tag dropped: " << preview_(raw));
            return r;
        }

        if (type == PONG_TYPE) {
            ++pongs_received_;
            last_pong_ = Clock::now();
            CW_TRACE("[DISPATCH] Pong received");
            return parser::Result::Ignored;
        }

        auto it = table_->handlers.find(std::string(type));
        if (it == table_->handlers.end()) {
            ++unhandled_frames_;
            CW_DEBUG("[DISPATCH] No handler for type '" << type << "'");
            return parser::Result::Unhandled;
        }

        // Snapshot: handlers may (un)subscribe while the frame is delivered
        const std::vector<Entry> snapshot = it->second;
        const Frame frame{type, root, raw};
        for (const auto& entry : snapshot) {
            invoke_(entry, frame);
        }
        return parser::Result::Delivered;
    }

    // Removes every handler; outstanding Unsubscribe callables become no-ops
    inline void clear() noexcept {
        table_->handlers.clear();
    }

    [[nodiscard]]
    inline std::size_t handler_count(const std::string& type) const {
        auto it = table_->handlers.find(type);
        return it == table_->handlers.end() ? 0 : it->second.size();
    }

    // Accessors
    [[nodiscard]] inline std::uint64_t frames_received() const noexcept { return frames_received_; }
    [[nodiscard]] inline std::uint64_t dropped_frames() const noexcept { return dropped_frames_; }
    [[nodiscard]] inline std::uint64_t unhandled_frames() const noexcept { return unhandled_frames_; }
    [[nodiscard]] inline std::uint64_t pongs_received() const noexcept { return pongs_received_; }
    [[nodiscard]] inline time_point last_pong() const noexcept { return last_pong_; }
    [[nodiscard]] inline std::uint64_t handler_failures() const noexcept { return handler_failures_; }
    [[nodiscard]] inline std::uint64_t schema_failures() const noexcept { return table_->schema_failures; }

private:
    struct Entry {
        std::uint64_t id;
        Handler fn;
    };

    struct Table {
        std::unordered_map<std::string, std::vector<Entry>> handlers;
        std::uint64_t next_id{0};
        std::uint64_t schema_failures{0};
    };

    std::shared_ptr<Table> table_;
    simdjson::dom::parser json_;

    std::uint64_t frames_received_{0};
    std::uint64_t dropped_frames_{0};
    std::uint64_t unhandled_frames_{0};
    std::uint64_t pongs_received_{0};
    std::uint64_t handler_failures_{0};
    time_point last_pong_{};

    inline void invoke_(const Entry& entry, const Frame& frame) {
        try {
            entry.fn(frame);
        }
        catch (const std::exception& e) {
            ++handler_failures_;
            CW_ERROR("[DISPATCH] Handler #" << entry.id << " for '" << frame.type << "' threw: " << e.what());
        }
        catch (...) {
            ++handler_failures_;
            CW_ERROR("[DISPATCH] Handler #" << entry.id << " for '" << frame.type << "' threw a non-standard exception");
        }
    }

    static inline std::string_view preview_(std::string_view raw) noexcept {
        constexpr std::size_t MAX_PREVIEW = 200;
        return raw.substr(0, MAX_PREVIEW);
    }
};

} // namespace cardwire::core::protocol
