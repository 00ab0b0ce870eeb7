#pragma once
// Core types: what the observer sees and what it concludes
//
// A Frame is one validated JSON-RPC line. A Message is a Frame with
// provenance. A Trace is the analyzer's view of a Message. Scores are
// always recomputed, never patched.

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace drishti {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

constexpr Timestamp MS_PER_HOUR = 3600000;
constexpr Timestamp MS_PER_DAY = 24 * MS_PER_HOUR;

// 2026-10-19T08:15:42.123Z
inline std::string format_iso8601(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }
    std::tm tm_buf{};
    gmtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, millis);
    return out;
}

// 20261019T081542, used in report file names
inline std::string format_compact(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm_buf{};
    gmtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%S", &tm_buf);
    return buf;
}

// ═══════════════════════════════════════════════════════════════════════════
// Traffic
// ═══════════════════════════════════════════════════════════════════════════

// Inferred, not authoritative: requests travel host → server
enum class Direction : uint8_t {
    Outbound = 0,
    Inbound = 1
};

inline const char* direction_name(Direction d) {
    return d == Direction::Outbound ? "outbound" : "inbound";
}

enum class MessageType : uint8_t {
    Request = 0,
    Response = 1
};

inline const char* message_type_name(MessageType t) {
    return t == MessageType::Request ? "request" : "response";
}

// Which pipe of a traffic source a chunk came from
enum class StreamKind : uint8_t {
    Stdin = 0,
    Stdout = 1,
    Stderr = 2
};

inline const char* stream_kind_name(StreamKind k) {
    switch (k) {
        case StreamKind::Stdin:  return "stdin";
        case StreamKind::Stdout: return "stdout";
        case StreamKind::Stderr: return "stderr";
    }
    return "unknown";
}

// "host/server" registry key
inline std::string source_key(const std::string& host, const std::string& server) {
    return host + "/" + server;
}

// A frame captured from a source, with provenance
struct InterceptedMessage {
    std::string id;
    Timestamp timestamp = 0;
    std::string host;
    std::string server;
    Direction direction = Direction::Inbound;
    json payload;
    std::optional<int64_t> latency_ms;

    std::string method() const {
        auto it = payload.find("method");
        if (it != payload.end() && it->is_string()) return it->get<std::string>();
        return {};
    }

    bool has_error() const {
        auto it = payload.find("error");
        return it != payload.end() && !it->is_null();
    }
};

// Analyzer-side view of a message
struct Trace {
    Timestamp timestamp = 0;
    Direction direction = Direction::Inbound;
    MessageType type = MessageType::Response;
    std::string method;     // Empty when the frame has none
    json params;            // null when absent
    json result;            // null when absent
    json error;             // null when absent
    std::optional<int64_t> latency_ms;
    std::string host;
    std::string server;

    bool has_method() const { return !method.empty(); }
    bool has_error() const { return !error.is_null(); }
    bool has_result() const { return !result.is_null(); }
};

// Best-effort request/response pairing, scored on its own
struct Interaction {
    std::string id;
    Timestamp start_time = 0;
    Timestamp end_time = 0;
    int64_t duration_ms = 0;
    size_t message_count = 1;
    double success_rate = 100.0;
    int cognitive_load = 0;
    std::string method;
    std::string host;
    std::string server;
    std::vector<Trace> messages;
};

// ═══════════════════════════════════════════════════════════════════════════
// Scores and findings
// ═══════════════════════════════════════════════════════════════════════════

struct ScoreComponents {
    double prompt_complexity = 50.0;
    double context_switching = 20.0;
    double retry_frustration = 5.0;
    double configuration_friction = 25.0;
    double integration_cognition = 20.0;
    int overall = 95;

    int usability() const { return std::max(0, 100 - overall); }

    // Letter grade of the usability score
    const char* grade() const {
        int u = usability();
        if (u >= 90) return "A";
        if (u >= 80) return "B";
        if (u >= 70) return "C";
        if (u >= 60) return "D";
        return "F";
    }

    const char* description() const {
        if (overall > 80) return "HIGH FRICTION - User likely struggling";
        if (overall > 60) return "MEDIUM FRICTION - Some confusion detected";
        return "LOW FRICTION - Smooth interaction";
    }
};

struct Insight {
    std::string type;           // retry_pattern | error_pattern
    std::string severity;       // low | medium | high
    std::string message;
    json details;
    std::string recommendation;
};

struct AlertData {
    std::string type;
    std::string severity;       // low | medium | high | critical
    std::string message;
    std::vector<std::string> recommendations;
};

inline json to_json(const Insight& insight) {
    return {
        {"type", insight.type},
        {"severity", insight.severity},
        {"message", insight.message},
        {"details", insight.details},
        {"recommendation", insight.recommendation}
    };
}

inline json to_json(const AlertData& alert) {
    return {
        {"type", alert.type},
        {"severity", alert.severity},
        {"message", alert.message},
        {"recommendations", alert.recommendations}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Temp name unique per call, so concurrent saves never share one
inline std::string temp_path_for(const std::string& path) {
    static std::atomic<uint64_t> seq{0};
    return path + ".tmp." + std::to_string(::getpid()) + "." + std::to_string(++seq);
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = temp_path_for(path);
    FILE* f = ::fopen(tmp.c_str(), "wbx");
    if (!f) return false;

    bool ok = write_fn(f) && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;

    ::fclose(f);
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace drishti
