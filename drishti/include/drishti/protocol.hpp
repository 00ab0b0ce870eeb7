#pragma once
// Protocol: JSON-RPC 2.0 frame recognition
//
// A line is a frame only if it parses as a JSON object with
// "jsonrpc":"2.0" and at least one of method/result/error.
// Anything else is console noise and is dropped without complaint.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace drishti::protocol {

// Well-known MCP method names
namespace method {
    constexpr const char* TOOLS_LIST = "tools/list";
    constexpr const char* TOOLS_CALL = "tools/call";
    constexpr const char* RESOURCES_LIST = "resources/list";
    constexpr const char* RESOURCES_READ = "resources/read";
    constexpr const char* PROMPTS_LIST = "prompts/list";
    constexpr const char* PROMPTS_GET = "prompts/get";
}

inline std::string trim(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Compact serialization that never throws on invalid UTF-8
inline std::string serialize(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Shape check on an already-parsed value
inline bool is_frame(const json& value) {
    if (!value.is_object()) return false;
    auto rpc = value.find("jsonrpc");
    if (rpc == value.end() || !rpc->is_string() || rpc->get<std::string>() != "2.0") {
        return false;
    }
    return value.contains("method") || value.contains("result") || value.contains("error");
}

// Parse one trimmed line; nullopt for noise
inline std::optional<json> parse_frame(const std::string& line) {
    if (line.empty() || line.front() != '{') return std::nullopt;
    json value = json::parse(line, nullptr, false);
    if (value.is_discarded() || !is_frame(value)) return std::nullopt;
    return value;
}

inline bool has_member(const json& frame, const char* key) {
    auto it = frame.find(key);
    return it != frame.end() && !it->is_null();
}

// method without result/error → request
inline MessageType message_type(const json& frame) {
    bool has_method = has_member(frame, "method");
    bool has_outcome = has_member(frame, "result") || has_member(frame, "error");
    return (has_method && !has_outcome) ? MessageType::Request : MessageType::Response;
}

inline Direction infer_direction(const json& frame) {
    return message_type(frame) == MessageType::Request ? Direction::Outbound : Direction::Inbound;
}

// Request id as a comparable string ("" when absent or null)
inline std::string id_key(const json& frame) {
    auto it = frame.find("id");
    if (it == frame.end() || it->is_null()) return {};
    if (it->is_string()) return "s:" + it->get<std::string>();
    return "n:" + it->dump();
}

// Build a JSON-RPC 2.0 request
inline json make_request(const json& id, const std::string& name, const json& params) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", name},
        {"params", params}
    };
}

// Error code of a frame's error member, 0 if absent or non-numeric
inline int64_t error_code(const json& error) {
    if (!error.is_object()) return 0;
    auto it = error.find("code");
    if (it == error.end() || !it->is_number()) return 0;
    return it->get<int64_t>();
}

inline std::string error_message(const json& error) {
    if (!error.is_object()) return {};
    auto it = error.find("message");
    if (it == error.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace drishti::protocol
