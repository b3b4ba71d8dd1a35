#pragma once

#include <string>

#include "lcr/json.hpp"


namespace cardwire::core::protocol::schema::stream {

// {"action":"generate_bio"}: the server streams start, chunk*, complete|error
struct GenerateBio {
    [[nodiscard]]
    inline std::string to_json() const {
        return R"({"action":"generate_bio"})";
    }
};

// {"action":"suggest_tags","bio_text":"..."}: answered by tags_update or error
struct SuggestTags {
    std::string bio_text;

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(40 + bio_text.size());
        out += R"({"action":"suggest_tags",)";
        lcr::json::append_field(out, "bio_text", bio_text);
        out += '}';
        return out;
    }
};

} // namespace cardwire::core::protocol::schema::stream
