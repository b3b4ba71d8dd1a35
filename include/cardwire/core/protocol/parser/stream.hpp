#pragma once

#include <utility>

#include "cardwire/core/protocol/parser/common.hpp"
#include "cardwire/core/protocol/parser/helpers.hpp"
#include "cardwire/core/protocol/schema/stream/inbound.hpp"

#include "simdjson.h"


namespace cardwire::core::protocol::parser::stream {

namespace schema = cardwire::core::protocol::schema::stream;

struct start {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Start& out) {
        out = schema::Start{};
        auto r = helper::parse_string_optional(root, "message", out.message);
        if (r != Result::Parsed) {
            return reject("start", "message", r);
        }
        return Result::Parsed;
    }
};

// An empty chunk is valid (the model may emit whitespace-only tokens)
struct chunk {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Chunk& out) {
        out = schema::Chunk{};
        auto r = helper::parse_string_required(root, "content", out.content);
        if (r != Result::Parsed) {
            return reject("chunk", "content", r);
        }
        return Result::Parsed;
    }
};

struct complete {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::Complete& out) {
        out = schema::Complete{};
        auto r = helper::parse_string_required(root, "full_bio", out.full_bio);
        if (r != Result::Parsed) {
            return reject("complete", "full_bio", r);
        }
        return Result::Parsed;
    }
};

// Tags missing a name are skipped; other fields fall back to defaults
struct tags_update {
    [[nodiscard]]
    static inline Result parse(const simdjson::dom::element& root, schema::TagsUpdate& out) {
        out = schema::TagsUpdate{};
        simdjson::dom::array arr;
        auto r = helper::parse_array_required(root, "tags", arr);
        if (r != Result::Parsed) {
            return reject("tags_update", "tags", r);
        }
        for (auto item : arr) {
            schema::Tag tag;
            if (helper::parse_string_required(item, "name", tag.name) != Result::Parsed || tag.name.empty()) {
                CW_DEBUG("[PARSER] tags_update: skipping tag without a name");
                continue;
            }
            lcr::optional<std::string> text;
            if (helper::parse_string_optional(item, "category", text) == Result::Parsed) {
                tag.category = text.value_or("");
            }
            if (helper::parse_string_optional(item, "reason", text) == Result::Parsed) {
                tag.reason = text.value_or("");
            }
            double confidence = 0.0;
            if (helper::parse_double_required(item, "confidence", confidence) == Result::Parsed) {
                tag.confidence = confidence;
            }
            out.tags.push_back(std::move(tag));
        }
        return Result::Parsed;
    }
};

} // namespace cardwire::core::protocol::parser::stream
