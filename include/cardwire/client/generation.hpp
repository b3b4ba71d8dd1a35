#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <functional>

#include "cardwire/client/channel.hpp"
#include "cardwire/client/debouncer.hpp"
#include "cardwire/client/endpoint.hpp"
#include "cardwire/client/stream_accumulator.hpp"
#include "cardwire/core/protocol/parser/common.hpp"
#include "cardwire/core/protocol/parser/stream.hpp"
#include "cardwire/core/protocol/schema/common.hpp"
#include "cardwire/core/protocol/schema/stream/inbound.hpp"
#include "cardwire/core/protocol/schema/stream/request.hpp"
#include "lcr/log/logger.hpp"


namespace cardwire::client {

// -----------------------------------------------------------------------------
// GenerationConfig
// -----------------------------------------------------------------------------
struct GenerationConfig {
    std::string base_url;
    transport::connection::Config connection{
        .max_attempts = 3,
        .base_delay   = std::chrono::milliseconds{2000},
    };

    // Content limits, in UTF-8 code points of the trimmed text
    std::size_t min_content_length = 20;
    std::size_t max_content_length = 2000;

    // Inactivity before edits trigger suggest_tags
    std::chrono::milliseconds tags_debounce{1500};
    // Delay between a commit and the tags request for the new content
    std::chrono::milliseconds post_commit_tags_delay{500};
};

enum class GenerateResult : std::uint8_t {
    Started,
    AlreadyGenerating,
    NotConnected,
    ContentTooShort,
    SendFailed
};

[[nodiscard]]
inline constexpr std::string_view to_string(GenerateResult r) noexcept {
    switch (r) {
        case GenerateResult::Started:           return "Started";
        case GenerateResult::AlreadyGenerating: return "AlreadyGenerating";
        case GenerateResult::NotConnected:      return "NotConnected";
        case GenerateResult::ContentTooShort:   return "ContentTooShort";
        case GenerateResult::SendFailed:        return "SendFailed";
        default:                                return "Unknown";
    }
}

namespace detail {

// Counts UTF-8 code points (continuation bytes are skipped)
[[nodiscard]]
inline std::size_t utf8_length(std::string_view s) noexcept {
    std::size_t n = 0;
    for (const char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

[[nodiscard]]
inline std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view WS = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(WS);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(WS);
    return s.substr(first, last - first + 1);
}

} // namespace detail

/*
===============================================================================
 client::GenerationClient
===============================================================================

AI content stream for one card: /api/ws/cards/{card}?token={t}&owner_id={owner}

The client owns the caller's editable content and keeps it consistent with
the generation session:

  generate()   snapshot content, enter Streaming, send generate_bio
  start        clear the stream buffer
  chunk        append to the stream buffer (on_stream shows progress)
  complete     content := full_bio                       (Committed)
  error        content := snapshot                       (RolledBack)
  cancel()     content := snapshot, local only           (RolledBack)
  link lost    content := snapshot                       (RolledBack)

Cancellation does not stop the server. Frames of a cancelled session keep
arriving until its complete or error frame; they are counted and discarded
so they can never leak into the next session.

Tag suggestions are independent of the stream state machine: edit() arms a
debounced suggest_tags, and every commit requests tags for the new content
after a short delay. The tags-loading flag is cleared by tags_update, by an
error frame, by a failed send and by any disconnect.
===============================================================================
*/
template <
    transport::WebSocketConcept WS,
    transport::ClockConcept Clock = std::chrono::steady_clock
>
class GenerationClient : public Channel<WS, Clock> {
    using Base = Channel<WS, Clock>;
    using Tag  = protocol::schema::stream::Tag;

public:
    using Deferred    = typename Base::Deferred;
    using Unsubscribe = typename Base::Unsubscribe;
    using time_point  = typename Clock::time_point;

    using ContentCallback  = std::function<void(const std::string&)>;
    using FinishedCallback = std::function<void(StreamPhase)>;
    using TagsCallback     = std::function<void(const std::vector<Tag>&)>;
    using LoadingCallback  = std::function<void(bool)>;

public:
    GenerationClient(GenerationConfig cfg, credentials::Provider creds)
        : Base("[GEN]", ChannelConfig{cfg.base_url, cfg.connection}, std::move(creds))
        , gen_cfg_(std::move(cfg))
        , tags_debounce_(gen_cfg_.tags_debounce)
        , post_commit_tags_(gen_cfg_.post_commit_tags_delay)
    {
        namespace sp = protocol::parser::stream;
        namespace ss = protocol::schema::stream;
        auto& d = this->dispatcher();
        subscriptions_.push_back(d.template on_parsed<ss::Start>("start", &sp::start::parse,
            [this](const ss::Start& m) { on_start_(m); }));
        subscriptions_.push_back(d.template on_parsed<ss::Chunk>("chunk", &sp::chunk::parse,
            [this](const ss::Chunk& m) { on_chunk_(m); }));
        subscriptions_.push_back(d.template on_parsed<ss::Complete>("complete", &sp::complete::parse,
            [this](const ss::Complete& m) { on_complete_(m); }));
        subscriptions_.push_back(d.template on_parsed<ss::TagsUpdate>("tags_update", &sp::tags_update::parse,
            [this](const ss::TagsUpdate& m) { on_tags_update_(m); }));
        subscriptions_.push_back(d.template on_parsed<protocol::schema::ErrorNotice>("error", &protocol::parser::error_notice::parse,
            [this](const protocol::schema::ErrorNotice& m) { on_error_frame_(m); }));

        this->on_link_lost_ = [this]() { on_link_lost_handler_(); };
        this->on_local_close_ = [this]() { on_local_close_handler_(); };
    }

    ~GenerationClient() {
        for (auto& unsubscribe : subscriptions_) {
            unsubscribe();
        }
    }

    // No-op (resolved) when already open for the same card and owner.
    // A different target closes the current socket first.
    [[nodiscard]]
    inline Deferred connect(std::string card_id, std::string owner_id) {
        const bool same_target = (card_id == card_id_ && owner_id == owner_id_);
        if (same_target && this->is_connected()) {
            CW_DEBUG("[GEN] Already connected to card " << card_id_);
            return Deferred::resolved();
        }
        if (!same_target && this->state() != transport::State::Disconnected) {
            this->disconnect();
        }
        card_id_ = std::move(card_id);
        owner_id_ = std::move(owner_id);
        return this->open_([this](const std::string& token) {
            return endpoint::card_url(gen_cfg_.base_url, card_id_, token, owner_id_);
        });
    }

    inline void poll() {
        Base::poll();
        const auto now = Clock::now();
        if (tags_debounce_.due(now)) {
            (void)suggest_tags(content_);
        }
        if (post_commit_tags_.due(now)) {
            (void)suggest_tags(content_);
        }
    }

    // ---------------------------------------------------------------------
    // Content
    // ---------------------------------------------------------------------

    // Caller edit: rejected while streaming or above max_content_length.
    // Schedules a debounced tag suggestion.
    [[nodiscard]]
    inline bool edit(std::string text) {
        if (accumulator_.streaming()) {
            CW_DEBUG("[GEN] Edit rejected while generating");
            return false;
        }
        if (detail::utf8_length(text) > gen_cfg_.max_content_length) {
            CW_DEBUG("[GEN] Edit rejected: above " << gen_cfg_.max_content_length << " characters");
            return false;
        }
        content_ = std::move(text);
        tags_debounce_.touch(Clock::now());
        return true;
    }

    // Replaces the content from an external source (no tag request)
    inline void set_content(std::string text) {
        if (accumulator_.streaming()) {
            CW_WARN("[GEN] set_content() ignored while generating");
            return;
        }
        content_ = std::move(text);
    }

    [[nodiscard]] inline const std::string& content() const noexcept { return content_; }

    // Text to display: the stream buffer while generating, the content otherwise
    [[nodiscard]]
    inline const std::string& display_text() const noexcept {
        return accumulator_.streaming() ? accumulator_.buffer() : content_;
    }

    // ---------------------------------------------------------------------
    // Generation
    // ---------------------------------------------------------------------

    [[nodiscard]]
    inline GenerateResult generate() {
        if (accumulator_.streaming()) {
            return GenerateResult::AlreadyGenerating;
        }
        if (!this->is_connected()) {
            return GenerateResult::NotConnected;
        }
        if (detail::utf8_length(detail::trim(content_)) < gen_cfg_.min_content_length) {
            return GenerateResult::ContentTooShort;
        }
        // Snapshot before the request leaves
        accumulator_.begin(content_);
        if (!this->send_(protocol::schema::stream::GenerateBio{}.to_json())) {
            (void)accumulator_.rollback();
            CW_WARN("[GEN] generate_bio could not be sent");
            return GenerateResult::SendFailed;
        }
        CW_INFO("[GEN] Generation session " << accumulator_.session() << " started");
        return GenerateResult::Started;
    }

    // Local cancel: restores the snapshot. Returns false if nothing was running.
    inline bool cancel() {
        if (!accumulator_.streaming()) {
            return false;
        }
        ++pending_discards_;
        rollback_("cancelled");
        return true;
    }

    // Immediate tag request for `text`
    [[nodiscard]]
    inline bool suggest_tags(std::string text) {
        if (!this->is_connected()) {
            return false;
        }
        if (detail::utf8_length(detail::trim(text)) < gen_cfg_.min_content_length) {
            CW_DEBUG("[GEN] Tags not requested: content too short");
            return false;
        }
        tags_debounce_.cancel();
        set_tags_loading_(true);
        if (!this->send_(protocol::schema::stream::SuggestTags{std::move(text)}.to_json())) {
            set_tags_loading_(false);
            return false;
        }
        return true;
    }

    // ---------------------------------------------------------------------
    // Callbacks
    // ---------------------------------------------------------------------

    // Content replaced by a commit or restored by a rollback
    inline void on_content(ContentCallback cb) { on_content_ = std::move(cb); }
    // Stream buffer after each start / chunk
    inline void on_stream(ContentCallback cb) { on_stream_ = std::move(cb); }
    // Session ended (Committed or RolledBack)
    inline void on_finished(FinishedCallback cb) { on_finished_ = std::move(cb); }
    inline void on_tags(TagsCallback cb) { on_tags_ = std::move(cb); }
    inline void on_tags_loading(LoadingCallback cb) { on_tags_loading_ = std::move(cb); }

    // Accessors
    [[nodiscard]] inline bool is_generating() const noexcept { return accumulator_.streaming(); }
    [[nodiscard]] inline bool tags_loading() const noexcept { return tags_loading_; }
    [[nodiscard]] inline StreamPhase phase() const noexcept { return accumulator_.phase(); }
    [[nodiscard]] inline const StreamAccumulator& accumulator() const noexcept { return accumulator_; }
    [[nodiscard]] inline std::uint32_t pending_discards() const noexcept { return pending_discards_; }
    [[nodiscard]] inline std::uint64_t discarded_frames() const noexcept { return discarded_frames_; }
    [[nodiscard]] inline const std::string& card_id() const noexcept { return card_id_; }
    [[nodiscard]] inline const std::string& owner_id() const noexcept { return owner_id_; }
    [[nodiscard]] inline const GenerationConfig& generation_config() const noexcept { return gen_cfg_; }
    [[nodiscard]] inline bool tags_request_armed() const noexcept { return tags_debounce_.armed() || post_commit_tags_.armed(); }

private:
    GenerationConfig gen_cfg_;
    std::string card_id_;
    std::string owner_id_;

    std::string content_;
    StreamAccumulator accumulator_;
    // Cancelled sessions whose terminal frame has not arrived yet
    std::uint32_t pending_discards_{0};
    std::uint64_t discarded_frames_{0};

    bool tags_loading_{false};
    Debouncer<time_point> tags_debounce_;
    Debouncer<time_point> post_commit_tags_;

    std::vector<Unsubscribe> subscriptions_;

    ContentCallback on_content_;
    ContentCallback on_stream_;
    FinishedCallback on_finished_;
    TagsCallback on_tags_;
    LoadingCallback on_tags_loading_;

    // A frame belonging to a cancelled session
    inline bool superseded_() noexcept {
        if (pending_discards_ == 0) {
            return false;
        }
        ++discarded_frames_;
        return true;
    }

    inline void on_start_(const protocol::schema::stream::Start& m) {
        if (superseded_()) {
            return;
        }
        if (!accumulator_.streaming()) {
            CW_DEBUG("[GEN] 'start' without an active session ignored");
            return;
        }
        CW_DEBUG("[GEN] Stream started" << (m.message.has() ? ": " + m.message.value() : std::string{}));
        accumulator_.restart();
        this->notify_("on_stream", on_stream_, accumulator_.buffer());
    }

    inline void on_chunk_(const protocol::schema::stream::Chunk& m) {
        if (superseded_()) {
            return;
        }
        if (!accumulator_.append(m.content)) {
            CW_DEBUG("[GEN] 'chunk' without an active session ignored");
            return;
        }
        this->notify_("on_stream", on_stream_, accumulator_.buffer());
    }

    inline void on_complete_(const protocol::schema::stream::Complete& m) {
        if (superseded_()) {
            --pending_discards_;
            return;
        }
        if (!accumulator_.streaming()) {
            CW_DEBUG("[GEN] 'complete' without an active session ignored");
            return;
        }
        if (m.full_bio.empty() && accumulator_.buffer().empty()) {
            rollback_("empty result");
            return;
        }
        std::string result = m.full_bio.empty() ? accumulator_.buffer() : m.full_bio;
        content_ = accumulator_.commit(std::move(result));
        CW_INFO("[GEN] Generation session " << accumulator_.session() << " committed");
        this->notify_("on_content", on_content_, content_);
        this->notify_("on_finished", on_finished_, StreamPhase::Committed);
        post_commit_tags_.touch(Clock::now());
    }

    inline void on_error_frame_(const protocol::schema::ErrorNotice& m) {
        set_tags_loading_(false);
        if (superseded_()) {
            --pending_discards_;
            return;
        }
        if (accumulator_.streaming()) {
            CW_WARN("[GEN] Generation failed: " << m.message);
            rollback_("server error");
        }
    }

    inline void on_tags_update_(const protocol::schema::stream::TagsUpdate& m) {
        set_tags_loading_(false);
        CW_DEBUG("[GEN] Received " << m.tags.size() << " tag suggestions");
        this->notify_("on_tags", on_tags_, m.tags);
    }

    // The socket is gone: neither the session nor pending tag replies survive
    inline void on_link_lost_handler_() {
        abort_session_("connection lost");
        set_tags_loading_(false);
    }

    // disconnect() through any interface: roll back and cancel the timers
    inline void on_local_close_handler_() {
        abort_session_("disconnect");
        tags_debounce_.cancel();
        post_commit_tags_.cancel();
        set_tags_loading_(false);
    }

    inline void abort_session_(const char* why) {
        pending_discards_ = 0;
        if (accumulator_.streaming()) {
            rollback_(why);
        }
    }

    inline void rollback_(const char* why) {
        content_ = accumulator_.rollback();
        CW_INFO("[GEN] Generation session " << accumulator_.session() << " rolled back (" << why << ")");
        this->notify_("on_content", on_content_, content_);
        this->notify_("on_finished", on_finished_, StreamPhase::RolledBack);
    }

    inline void set_tags_loading_(bool on) {
        if (tags_loading_ == on) {
            return;
        }
        tags_loading_ = on;
        this->notify_("on_tags_loading", on_tags_loading_, on);
    }
};

} // namespace cardwire::client
