#include "event.hpp"
#include "utils.hpp"
#include <iostream>

namespace guardrail {

std::string ToolUseEvent::file_name() const {
    return fs::path(normalize_slashes(file_path)).filename().string();
}

std::string ToolUseEvent::extension() const {
    return to_lower(fs::path(normalize_slashes(file_path)).extension().string());
}

nlohmann::json ToolUseEvent::to_json() const {
    return {
        {"session_id", session_id},
        {"hook_event_name", to_string(phase)},
        {"tool_name", tool_name},
        {"tool_input", {{"file_path", file_path}, {"content", content}}},
        {"cwd", cwd},
        {"timestamp", timestamp_ms},
    };
}

// Reads a string field under either of two spellings; non-strings count as absent.
static std::string string_field(const nlohmann::json& obj, const char* a, const char* b = nullptr) {
    if (!obj.is_object()) return "";
    auto it = obj.find(a);
    if (it != obj.end() && it->is_string()) return it->get<std::string>();
    if (b) {
        it = obj.find(b);
        if (it != obj.end() && it->is_string()) return it->get<std::string>();
    }
    return "";
}

// Edit carries the replacement in new_string, MultiEdit in edits[].new_string.
static std::string content_from_tool_input(const nlohmann::json& input) {
    std::string content = string_field(input, "content");
    if (!content.empty()) return content;

    content = string_field(input, "new_string", "newString");
    if (!content.empty()) return content;

    auto edits = input.find("edits");
    if (edits != input.end() && edits->is_array()) {
        std::string joined;
        for (auto& e : *edits) {
            std::string piece = string_field(e, "new_string", "newString");
            if (piece.empty()) continue;
            if (!joined.empty()) joined += '\n';
            joined += piece;
        }
        return joined;
    }
    return "";
}

ToolUseEvent normalize_event(const nlohmann::json& raw, int64_t now_ms) {
    ToolUseEvent ev;
    ev.timestamp_ms = now_ms;
    if (!raw.is_object()) return ev;

    ev.session_id = string_field(raw, "session_id", "sessionId");
    ev.tool_name = string_field(raw, "tool_name", "toolName");
    ev.cwd = string_field(raw, "cwd");

    std::string event_name = string_field(raw, "hook_event_name", "hookEventName");
    if (event_name.empty()) event_name = string_field(raw, "phase");
    if (auto phase = parse_phase(event_name)) ev.phase = *phase;

    // Absent or non-object tool_input is treated as {}
    static const nlohmann::json empty_object = nlohmann::json::object();
    const nlohmann::json* input = &empty_object;
    auto it = raw.find("tool_input");
    if (it == raw.end()) it = raw.find("toolInput");
    if (it != raw.end() && it->is_object()) input = &*it;

    ev.file_path = string_field(*input, "file_path", "filePath");
    ev.content = content_from_tool_input(*input);

    // Flat legacy shape: fields at the top level
    if (ev.file_path.empty()) ev.file_path = string_field(raw, "filePath", "file_path");
    if (ev.content.empty()) ev.content = content_from_tool_input(raw);

    return ev;
}

std::optional<ToolUseEvent> parse_event(const std::string& raw_text, int64_t now_ms) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(raw_text);
    } catch (const std::exception& e) {
        std::cerr << "[dispatch] Input is not valid JSON: " << e.what() << "\n";
        return std::nullopt;
    }
    return normalize_event(j, now_ms);
}

} // namespace guardrail
