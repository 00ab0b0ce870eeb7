// drishtid: watch MCP servers and score the friction their traffic shows
//
// Usage:
//   drishtid watch --sources FILE [--rules FILE] [--reports DIR] [--jsonl FILE]
//   drishtid relay --host H --server S -- CMD ARGS...
//   drishtid replay FILE --host H --server S [--rules FILE]

#include <drishti/agent.hpp>
#include <drishti/version.hpp>
#include <drishti/log.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>

using namespace drishti;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "drishtid " << DRISHTI_VERSION << " - MCP cognitive friction observer\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  watch              Launch servers from a sources file and observe them\n"
              << "  relay -- CMD ...   Sit between this process's stdio and one server\n"
              << "  replay <file>      Score a file of captured frames, one per line\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --sources FILE     Source descriptors (watch)\n"
              << "  --host NAME        Host name (relay, replay)\n"
              << "  --server NAME      Server name (relay, replay)\n"
              << "  --rules FILE       Rule overrides (JSON)\n"
              << "  --reports DIR      Report directory (default: reports)\n"
              << "  --jsonl FILE       Append insights and alerts to FILE\n"
              << "  --interval SECS    Proactive review interval (default: 300, 0 = off)\n"
              << "  --verbose          Enable debug logging\n"
              << "  -v, --version      Show version\n\n"
              << "Environment:\n"
              << "  DRISHTI_REPORTS_DIR, DRISHTI_RULES, DRISHTI_LOG_LEVEL, DRISHTI_ALERT_THRESHOLD\n";
}

// Global flag for shutdown
static std::atomic<bool> keep_running{true};

void shutdown_signal_handler(int sig) {
    (void)sig;
    keep_running = false;
}

static bool load_rule_file(const std::string& path, RuleConfig& rules) {
    if (path.empty()) return true;
    std::string error;
    if (!load_rules(path, rules, error)) {
        std::cerr << "[drishtid] " << error << "\n";
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// watch
// ═══════════════════════════════════════════════════════════════════════════

int cmd_watch(const AgentConfig& config, const RuleConfig& rules,
              const std::string& sources_path, const std::string& jsonl_path) {
    if (sources_path.empty()) {
        std::cerr << "[drishtid] watch requires --sources FILE\n";
        return 1;
    }

    std::string error;
    auto sources = load_sources(sources_path, error);
    if (!sources) {
        std::cerr << "[drishtid] " << error << "\n";
        return 1;
    }

    Agent agent(config, rules);
    agent.add_sink(std::make_unique<LogSink>());
    if (!jsonl_path.empty()) {
        agent.add_sink(std::make_unique<JsonlSink>(jsonl_path));
    }

    std::signal(SIGTERM, shutdown_signal_handler);
    std::signal(SIGINT, shutdown_signal_handler);

    StartReport report = agent.start(*sources);
    for (const auto& [key, reason] : report.failed) {
        std::cerr << "[drishtid] " << key << ": " << reason << "\n";
    }
    if (report.started.empty()) {
        std::cerr << "[drishtid] No server could be started\n";
        agent.stop();
        return 1;
    }

    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[drishtid] Shutting down...\n";
    TraceReport final_report = agent.generate_trace_report();
    agent.stop();

    std::cout << to_json(agent.status()).dump(2) << "\n";
    std::cerr << "[drishtid] " << final_report.total_messages << " messages, usability "
              << final_report.usability_score << "/100\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// relay
// ═══════════════════════════════════════════════════════════════════════════

static bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

int cmd_relay(AgentConfig config, const RuleConfig& rules, const std::string& host,
              const std::string& server, const std::vector<std::string>& command) {
    if (host.empty() || server.empty() || command.empty()) {
        std::cerr << "[drishtid] relay requires --host, --server and -- CMD\n";
        return 1;
    }

    SourceDescriptor source;
    source.name = host;
    source.type = "relay";
    ServerCommand sc;
    sc.name = server;
    sc.command = command.front();
    sc.args.assign(command.begin() + 1, command.end());
    source.servers.push_back(std::move(sc));

    // The host on the other side of our stdio owns the timing; no alerts here
    config.proactive = false;
    Agent agent(config, rules);
    agent.add_sink(std::make_unique<LogSink>());

    // stdout carries only the server's bytes
    agent.interceptor().set_output_tap(
        [](const std::string&, const std::string&, StreamKind kind, const std::string& chunk) {
            int fd = (kind == StreamKind::Stdout) ? STDOUT_FILENO : STDERR_FILENO;
            if (!write_all(fd, chunk)) {
                log_warn("relay", "forwarding %s failed: %s", stream_kind_name(kind), strerror(errno));
            }
        });

    std::signal(SIGTERM, shutdown_signal_handler);
    std::signal(SIGINT, shutdown_signal_handler);

    StartReport report = agent.start({source});
    if (report.started.empty()) {
        for (const auto& [key, reason] : report.failed) {
            std::cerr << "[drishtid] " << key << ": " << reason << "\n";
        }
        agent.stop();
        return 1;
    }

    char buf[64 * 1024];
    while (keep_running) {
        if (agent.interceptor().active_sources().empty()) break;

        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[drishtid] poll() error: " << strerror(errno) << "\n";
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            break;
        }
        if (n == 0) break;  // Host closed our stdin
        if (!agent.interceptor().send(host, server, std::string(buf, static_cast<size_t>(n)))) {
            break;
        }
    }

    agent.generate_usability_report(host);
    agent.stop();
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// replay
// ═══════════════════════════════════════════════════════════════════════════

int cmd_replay(const RuleConfig& rules, const std::string& path,
               const std::string& host, const std::string& server) {
    if (path.empty() || host.empty() || server.empty()) {
        std::cerr << "[drishtid] replay requires FILE, --host and --server\n";
        return 1;
    }

    std::ifstream in(path);
    if (!in) {
        std::cerr << "[drishtid] Cannot open " << path << "\n";
        return 1;
    }

    CognitiveAnalyzer analyzer(rules);
    MessageBus bus(rules.message_capacity);
    bus.connect_analyzer(&analyzer);
    analyzer.start();
    bus.start();

    std::string line;
    Timestamp line_no = 0;
    size_t replayed = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto frame = protocol::parse_frame(protocol::trim(line));
        if (!frame) continue;

        // Captured timestamp when present, else one second per line
        Timestamp ts = line_no * 1000;
        if (auto it = frame->find("_ts"); it != frame->end()) {
            if (it->is_number_integer()) ts = it->get<Timestamp>();
            frame->erase("_ts");
        }

        bus.publish(*frame, host, server, std::nullopt, ts);
        ++replayed;

        ScoreComponents score = analyzer.score();
        std::string method = protocol::has_member(*frame, "method")
            ? frame->value("method", std::string("-")) : std::string("-");
        std::cout << replayed << "\t" << score.overall << "\t" << method << "\n";
    }

    bus.stop();
    analyzer.stop();

    json summary = to_json(analyzer.score());
    summary["messages"] = replayed;
    summary["interactions"] = analyzer.status().interaction_count;
    summary["insights"] = analyzer.status().insights_generated;
    std::cout << summary.dump(2) << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    AgentConfig config = AgentConfig::from_env();
    std::string command;
    std::string sources_path;
    std::string jsonl_path;
    std::string replay_file;
    std::string host;
    std::string server;
    std::vector<std::string> child_command;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--") == 0) {
            for (++i; i < argc; ++i) child_command.push_back(argv[i]);
            break;
        } else if (strcmp(argv[i], "--sources") == 0 && i + 1 < argc) {
            sources_path = argv[++i];
        } else if (strcmp(argv[i], "--rules") == 0 && i + 1 < argc) {
            config.rules_path = argv[++i];
        } else if (strcmp(argv[i], "--reports") == 0 && i + 1 < argc) {
            config.reports_dir = argv[++i];
        } else if (strcmp(argv[i], "--jsonl") == 0 && i + 1 < argc) {
            jsonl_path = argv[++i];
        } else if (strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            long secs = std::strtol(argv[++i], nullptr, 10);
            config.proactive = secs > 0;
            config.proactive_interval_ms = secs * 1000;
        } else if (strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server = argv[++i];
        } else if (strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "drishtid " << DRISHTI_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (command == "replay" && replay_file.empty()) {
                replay_file = argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    LogLevel level = LogLevel::Info;
    if (!config.log_level.empty() && !parse_log_level(config.log_level, level)) {
        std::cerr << "[drishtid] Unknown log level: " << config.log_level << "\n";
    }
    set_log_level(verbose ? LogLevel::Debug : level);

    RuleConfig rules;
    if (!load_rule_file(config.rules_path, rules)) return 1;

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return command.empty() ? 1 : 0;
    }
    if (command == "watch") return cmd_watch(config, rules, sources_path, jsonl_path);
    if (command == "relay") return cmd_relay(config, rules, host, server, child_command);
    if (command == "replay") return cmd_replay(rules, replay_file, host, server);

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
