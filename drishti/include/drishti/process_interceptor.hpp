#pragma once
// Process Interceptor: launch MCP servers and listen to their pipes
//
// Every active (host, server) pair from the source descriptors becomes a
// child process with stdin, stdout and stderr piped. One reader thread
// polls all pipes, reassembles lines, and hands complete frames to the bus.
//
// Failures stay local: a server that cannot be spawned is logged and
// reported, its siblings still run. Nothing here throws.

#include "types.hpp"
#include "sources.hpp"
#include "reassembler.hpp"
#include "tool_registry.hpp"
#include "scanner.hpp"
#include "message_bus.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace drishti {

struct InterceptorConfig {
    int stop_grace_ms = 2000;               // SIGTERM → SIGKILL
    int poll_interval_ms = 100;
    size_t max_buffer_bytes = FrameReassembler::DEFAULT_MAX_BUFFER;
    size_t pending_capacity = 1000;         // Outstanding request ids for latency
};

struct StartReport {
    std::vector<std::string> started;                               // host/server
    std::vector<std::pair<std::string, std::string>> failed;        // host/server, reason
    std::vector<std::string> skipped;                               // host/server (no command)

    bool ok() const { return failed.empty(); }
};

// Raw bytes as read from a child, before framing (relay mode)
using OutputTap = std::function<void(const std::string& host, const std::string& server,
                                     StreamKind kind, const std::string& chunk)>;

class ProcessInterceptor {
public:
    ProcessInterceptor(MessageBus& bus, ToolRegistry& registry, const ActivityScanner& scanner,
                       InterceptorConfig config = {});
    ~ProcessInterceptor();

    // Non-copyable (owns processes and a reader thread)
    ProcessInterceptor(const ProcessInterceptor&) = delete;
    ProcessInterceptor& operator=(const ProcessInterceptor&) = delete;

    // Spawn every server of every active source. No-op while running.
    StartReport start(const std::vector<SourceDescriptor>& sources);

    // Terminate children, join the reader, close everything. Idempotent.
    void stop();

    bool running() const { return running_.load(); }

    // Sorted host/server keys of children still alive
    std::vector<std::string> active_sources() const;

    // Write to a child's stdin; the bytes are also captured as outbound
    bool send(const std::string& host, const std::string& server, const std::string& text);

    // Frame pipeline for one chunk of one stream. Used by the reader
    // thread and by send(); callable directly to replay captured bytes.
    void ingest(const std::string& host, const std::string& server, StreamKind kind,
                const std::string& chunk, Timestamp ts);

    void set_output_tap(OutputTap tap);

    size_t overflow_count() const;

private:
    struct Child {
        std::string host;
        std::string server;
        pid_t pid = -1;
        int stdin_fd = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
        bool exited = false;
        int exit_status = 0;
    };

    bool spawn(const std::string& host, const ServerCommand& server, Child& child, std::string& error);
    void reader_loop();
    void reap(Child& child, bool blocking);
    void close_child_fds(Child& child);
    void terminate_all();

    std::optional<int64_t> track_latency(const std::string& key, StreamKind kind,
                                         const json& frame, Timestamp ts);

    MessageBus& bus_;
    ToolRegistry& registry_;
    const ActivityScanner& scanner_;
    InterceptorConfig config_;

    std::atomic<bool> running_{false};
    std::thread reader_;

    // Child table
    mutable std::mutex children_mutex_;
    std::map<std::string, Child> children_;

    // Reassembly, latency tracking and bus hand-off; held across publish
    // so frames reach the bus in completion order
    mutable std::mutex ingest_mutex_;
    FrameReassembler reassembler_;
    std::map<std::string, Timestamp> pending_;
    std::deque<std::string> pending_order_;

    std::mutex tap_mutex_;
    OutputTap tap_;
};

} // namespace drishti
