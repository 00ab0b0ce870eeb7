#pragma once
// Tool Registry: last advertised tool names per server
//
// Fed by tools/list responses. A hint for the activity scanner only;
// nothing routes or validates traffic against it.

#include "types.hpp"
#include "log.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace drishti {

class ToolRegistry {
public:
    // Replace the catalog for (host, server) with the names found in `tools`
    void update(const std::string& host, const std::string& server, const json& tools) {
        std::vector<std::string> names;
        if (tools.is_array()) {
            for (const auto& tool : tools) {
                if (!tool.is_object()) continue;
                auto it = tool.find("name");
                if (it != tool.end() && it->is_string()) {
                    names.push_back(it->get<std::string>());
                }
            }
        }
        set(host, server, std::move(names));
    }

    void set(const std::string& host, const std::string& server, std::vector<std::string> names) {
        std::string key = source_key(host, server);
        size_t count = names.size();
        {
            std::unique_lock lock(mutex_);
            catalogs_[key] = std::move(names);
        }
        log_debug("tools", "%s: %zu tools advertised", key.c_str(), count);
    }

    std::vector<std::string> lookup(const std::string& host, const std::string& server) const {
        std::shared_lock lock(mutex_);
        auto it = catalogs_.find(source_key(host, server));
        if (it == catalogs_.end()) return {};
        return it->second;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return catalogs_.size();
    }

    // tools/list result shape: {"tools": [{"name": ...}, ...]}
    static bool is_catalog_result(const json& frame) {
        auto result = frame.find("result");
        if (result == frame.end() || !result->is_object()) return false;
        auto tools = result->find("tools");
        return tools != result->end() && tools->is_array();
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<std::string>> catalogs_;
};

} // namespace drishti
