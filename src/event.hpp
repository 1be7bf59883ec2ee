#pragma once
#include "types.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace guardrail {

// Canonical form of one assistant tool-use notification. Every other
// component sees only this type; input-shape sniffing happens in
// normalize_event() and nowhere else.
struct ToolUseEvent {
    std::string session_id;
    Phase phase = Phase::pre;
    std::string tool_name;
    std::string file_path;
    std::string content;
    std::string cwd;
    int64_t timestamp_ms = 0;

    // File name without directories ("Profile_improved.tsx").
    std::string file_name() const;
    // Lower-case extension including the dot (".tsx"), empty if none.
    std::string extension() const;
    bool has_file() const { return !file_path.empty(); }

    // The JSON handed to external command hooks.
    nlohmann::json to_json() const;
};

// Accepts the flat legacy shape {filePath, content} or the nested
// assistant shape {session_id, hook_event_name, tool_name, tool_input}.
// Missing fields default to empty; never throws for a JSON value.
ToolUseEvent normalize_event(const nlohmann::json& raw, int64_t now_ms);

// Parses raw stdin text. Returns nullopt when the text is not JSON at all.
std::optional<ToolUseEvent> parse_event(const std::string& raw_text, int64_t now_ms);

} // namespace guardrail
