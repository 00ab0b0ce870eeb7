#pragma once
// Sources: which hosts to watch and which servers each one launches
//
// File format (JSON), either a bare array or {"hosts": [...]}:
//   [{"name": "cursor", "type": "ide", "configPath": "~/.cursor/mcp.json",
//     "exists": true, "enabled": true,
//     "servers": {"weather": {"command": "node", "args": ["w.js"],
//                             "env": {"API_KEY": "..."}}}}]
//
// `exists` and `enabled` default to true.

#include "types.hpp"
#include "log.hpp"
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace drishti {

struct ServerCommand {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;     // Added to the parent environment
};

struct SourceDescriptor {
    std::string name;
    std::string type;
    std::string config_path;
    bool exists = true;
    bool enabled = true;
    std::vector<ServerCommand> servers;          // Ordered by server name

    bool active() const { return exists && enabled; }
};

namespace detail {

inline std::string string_member(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

inline bool bool_member(const json& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_boolean()) ? it->get<bool>() : fallback;
}

} // namespace detail

// Structural errors (wrong top-level shape, unnamed host) fail the whole
// document; malformed server entries are skipped with a warning.
inline std::optional<std::vector<SourceDescriptor>> parse_sources(const json& doc, std::string& error) {
    const json* hosts = &doc;
    if (doc.is_object()) {
        auto it = doc.find("hosts");
        if (it == doc.end()) {
            error = "expected an array or an object with \"hosts\"";
            return std::nullopt;
        }
        hosts = &*it;
    }
    if (!hosts->is_array()) {
        error = "hosts must be an array";
        return std::nullopt;
    }

    std::vector<SourceDescriptor> out;
    for (const auto& entry : *hosts) {
        if (!entry.is_object()) {
            error = "host entry is not an object";
            return std::nullopt;
        }

        SourceDescriptor d;
        d.name = detail::string_member(entry, "name");
        if (d.name.empty()) {
            error = "host entry without a name";
            return std::nullopt;
        }
        d.type = detail::string_member(entry, "type");
        d.config_path = detail::string_member(entry, "configPath");
        d.exists = detail::bool_member(entry, "exists", true);
        d.enabled = detail::bool_member(entry, "enabled", true);

        auto servers = entry.find("servers");
        if (servers != entry.end() && servers->is_object()) {
            for (const auto& [name, body] : servers->items()) {
                if (!body.is_object()) {
                    log_warn("sources", "%s/%s: server entry is not an object, skipped",
                             d.name.c_str(), name.c_str());
                    continue;
                }
                ServerCommand s;
                s.name = name;
                s.command = detail::string_member(body, "command");

                if (auto args = body.find("args"); args != body.end() && args->is_array()) {
                    for (const auto& a : *args) {
                        if (a.is_string()) s.args.push_back(a.get<std::string>());
                    }
                }
                if (auto env = body.find("env"); env != body.end() && env->is_object()) {
                    for (const auto& [k, v] : env->items()) {
                        if (v.is_string()) s.env[k] = v.get<std::string>();
                    }
                }
                d.servers.push_back(std::move(s));
            }
        }
        out.push_back(std::move(d));
    }
    return out;
}

inline std::optional<std::vector<SourceDescriptor>> load_sources(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open " + path;
        return std::nullopt;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    json doc;
    try {
        doc = json::parse(ss.str());
    } catch (const json::parse_error& e) {
        error = path + ": " + e.what();
        return std::nullopt;
    }

    auto sources = parse_sources(doc, error);
    if (!sources) {
        error = path + ": " + error;
        return std::nullopt;
    }
    log_info("sources", "%s: %zu hosts", path.c_str(), sources->size());
    return sources;
}

} // namespace drishti
