#pragma once
// Sinks: where insights and alerts leave the process
//
// The agent feeds each sink from its own dispatcher queue, so a slow
// sink never holds up scoring.

#include "types.hpp"
#include "log.hpp"
#include <cstdio>
#include <mutex>
#include <string>

namespace drishti {

class IntegrationSink {
public:
    virtual ~IntegrationSink() = default;

    virtual std::string name() const = 0;
    virtual void send_insight(const Insight& insight) = 0;
    virtual void send_alert(const AlertData& alert) = 0;
};

// Insights at info, alerts at warn
class LogSink : public IntegrationSink {
public:
    std::string name() const override { return "log"; }

    void send_insight(const Insight& insight) override {
        log_info("insight", "[%s] %s: %s", insight.severity.c_str(),
                 insight.type.c_str(), insight.message.c_str());
    }

    void send_alert(const AlertData& alert) override {
        log_warn("alert", "[%s] %s: %s", alert.severity.c_str(),
                 alert.type.c_str(), alert.message.c_str());
        for (const auto& r : alert.recommendations) {
            log_warn("alert", "  - %s", r.c_str());
        }
    }
};

// One JSON object per line: {"kind": "insight"|"alert", "at": ..., ...}
class JsonlSink : public IntegrationSink {
public:
    explicit JsonlSink(std::string path) : path_(std::move(path)) {}

    std::string name() const override { return "jsonl:" + path_; }

    void send_insight(const Insight& insight) override {
        json line = to_json(insight);
        line["kind"] = "insight";
        append(line);
    }

    void send_alert(const AlertData& alert) override {
        json line = to_json(alert);
        line["kind"] = "alert";
        append(line);
    }

    const std::string& path() const { return path_; }

private:
    void append(json line) {
        line["at"] = format_iso8601(now());
        std::string text = line.dump(-1, ' ', false, json::error_handler_t::replace);
        text.push_back('\n');

        std::lock_guard<std::mutex> lock(mutex_);
        FILE* f = std::fopen(path_.c_str(), "a");
        if (!f) {
            log_error("sink", "cannot open %s", path_.c_str());
            return;
        }
        bool ok = std::fwrite(text.data(), 1, text.size(), f) == text.size();
        if (std::fclose(f) != 0) ok = false;
        if (!ok) log_error("sink", "write to %s failed", path_.c_str());
    }

    std::string path_;
    std::mutex mutex_;
};

} // namespace drishti
