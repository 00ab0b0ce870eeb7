#pragma once
// Activity Scanner: protocol signals in unstructured text
//
// Fallback for output that mixes JSON-RPC with console chatter.
// Two passes over a blob:
//   1. pull out balanced {...} objects that look like JSON-RPC
//   2. if nothing parsed, recognize a known tool name or a well-known
//      method literal and synthesize one request for it
//
// Best-effort by nature. Never throws, never emits more than one
// synthesized request per blob.

#include "types.hpp"
#include "protocol.hpp"
#include "tool_registry.hpp"
#include "log.hpp"
#include <array>
#include <string>
#include <vector>

namespace drishti {

class ActivityScanner {
public:
    explicit ActivityScanner(const ToolRegistry* registry = nullptr)
        : registry_(registry) {}

    std::vector<json> scan(const std::string& text, const std::string& host,
                           const std::string& server, Timestamp ts) const {
        std::vector<json> frames;
        if (text.empty()) return frames;

        if (text.find("\"jsonrpc\"") != std::string::npos ||
            text.find("\"method\"") != std::string::npos) {
            for (const auto& candidate : extract_objects(text)) {
                json value = json::parse(candidate, nullptr, false);
                if (value.is_discarded() || !looks_like_rpc(value)) continue;
                if (!value.contains("jsonrpc")) value["jsonrpc"] = "2.0";
                if (protocol::is_frame(value)) frames.push_back(std::move(value));
            }
        }

        if (!frames.empty()) return frames;

        if (registry_) {
            for (const auto& tool : registry_->lookup(host, server)) {
                if (tool.empty() || text.find(tool) == std::string::npos) continue;
                log_debug("scanner", "%s/%s: tool mention '%s'",
                          host.c_str(), server.c_str(), tool.c_str());
                frames.push_back(protocol::make_request(
                    ts, protocol::method::TOOLS_CALL,
                    {{"name", tool}, {"arguments", json::object()}}));
                return frames;
            }
        }

        for (const char* literal : WELL_KNOWN_METHODS) {
            if (text.find(literal) == std::string::npos) continue;
            log_debug("scanner", "%s/%s: method mention '%s'",
                      host.c_str(), server.c_str(), literal);
            frames.push_back(protocol::make_request(ts, literal, json::object()));
            break;
        }

        return frames;
    }

    // Every top-level balanced {...} span, string-literal aware
    static std::vector<std::string> extract_objects(const std::string& text) {
        std::vector<std::string> out;
        size_t depth = 0;
        size_t start = 0;
        bool in_string = false;
        bool escaped = false;

        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (depth > 0 && in_string) {
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    in_string = false;
                }
                continue;
            }

            if (c == '"' && depth > 0) {
                in_string = true;
            } else if (c == '{') {
                if (depth == 0) start = i;
                ++depth;
            } else if (c == '}' && depth > 0) {
                if (--depth == 0) {
                    out.push_back(text.substr(start, i - start + 1));
                }
            }
        }
        return out;
    }

private:
    static constexpr std::array<const char*, 4> WELL_KNOWN_METHODS = {
        "tools/list", "tools/call", "resources/list", "prompts/list"
    };

    static bool looks_like_rpc(const json& value) {
        if (!value.is_object()) return false;
        return protocol::has_member(value, "jsonrpc") ||
               protocol::has_member(value, "method") ||
               protocol::has_member(value, "result");
    }

    const ToolRegistry* registry_;
};

} // namespace drishti
