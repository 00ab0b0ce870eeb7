#include <drishti/process_interceptor.hpp>
#include <drishti/protocol.hpp>
#include <drishti/log.hpp>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace drishti {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// Parent environment with per-server overrides applied
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) merged[k] = v;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
    return out;
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

} // namespace

ProcessInterceptor::ProcessInterceptor(MessageBus& bus, ToolRegistry& registry,
                                       const ActivityScanner& scanner, InterceptorConfig config)
    : bus_(bus)
    , registry_(registry)
    , scanner_(scanner)
    , config_(config)
    , reassembler_(config.max_buffer_bytes) {}

ProcessInterceptor::~ProcessInterceptor() {
    stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

StartReport ProcessInterceptor::start(const std::vector<SourceDescriptor>& sources) {
    StartReport report;
    if (running_.load()) return report;

    // A child dying mid-write must not take the observer down
    std::signal(SIGPIPE, SIG_IGN);

    {
        std::lock_guard<std::mutex> lock(children_mutex_);
        for (const auto& source : sources) {
            if (!source.active()) {
                log_debug("interceptor", "%s: inactive, skipped", source.name.c_str());
                continue;
            }

            for (const auto& server : source.servers) {
                std::string key = source_key(source.name, server.name);
                if (server.command.empty()) {
                    log_warn("interceptor", "%s: no command, skipped", key.c_str());
                    report.skipped.push_back(key);
                    continue;
                }
                if (children_.count(key)) {
                    log_warn("interceptor", "%s: already tracked, skipped", key.c_str());
                    report.skipped.push_back(key);
                    continue;
                }

                Child child;
                std::string error;
                if (!spawn(source.name, server, child, error)) {
                    log_error("interceptor", "%s: spawn failed: %s", key.c_str(), error.c_str());
                    report.failed.emplace_back(key, error);
                    continue;
                }

                log_info("interceptor", "%s: started %s (pid %d)",
                         key.c_str(), server.command.c_str(), static_cast<int>(child.pid));
                children_[key] = std::move(child);
                report.started.push_back(key);
            }
        }
    }

    running_ = true;
    reader_ = std::thread([this]() { reader_loop(); });

    log_info("interceptor", "%zu started, %zu failed, %zu skipped",
             report.started.size(), report.failed.size(), report.skipped.size());
    return report;
}

void ProcessInterceptor::stop() {
    if (!running_.exchange(false)) return;

    if (reader_.joinable()) {
        reader_.join();
    }
    terminate_all();

    std::lock_guard<std::mutex> lock(ingest_mutex_);
    reassembler_.clear();
    pending_.clear();
    pending_order_.clear();
    log_info("interceptor", "stopped");
}

std::vector<std::string> ProcessInterceptor::active_sources() const {
    std::lock_guard<std::mutex> lock(children_mutex_);
    std::vector<std::string> keys;
    for (const auto& [key, child] : children_) {
        if (!child.exited) keys.push_back(key);
    }
    // std::map keeps them sorted
    return keys;
}

bool ProcessInterceptor::spawn(const std::string& host, const ServerCommand& server,
                               Child& child, std::string& error) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};    // Carries errno back if exec fails

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        error = std::string("pipe2() failed: ") + strerror(errno);
        close_all();
        return false;
    }

    // Everything exec needs is built before fork
    std::vector<std::string> arg_storage;
    arg_storage.push_back(server.command);
    arg_storage.insert(arg_storage.end(), server.args.begin(), server.args.end());
    std::vector<char*> argv;
    for (auto& a : arg_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage = build_environment(server.env);
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork() failed: ") + strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        // Servers get the default SIGPIPE, not the observer's ignore
        ::signal(SIGPIPE, SIG_DFL);
        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        error = "exec " + server.command + ": " + strerror(exec_errno);
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        return false;
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    child.host = host;
    child.server = server.name;
    child.pid = pid;
    child.stdin_fd = in_pipe[1];
    child.stdout_fd = out_pipe[0];
    child.stderr_fd = err_pipe[0];
    return true;
}

void ProcessInterceptor::reap(Child& child, bool blocking) {
    if (child.exited || child.pid <= 0) return;

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(child.pid, &status, blocking ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == child.pid) {
        child.exited = true;
        child.exit_status = status;
        log_info("interceptor", "%s: pid %d exited (%s)",
                 source_key(child.host, child.server).c_str(),
                 static_cast<int>(child.pid), describe_status(status).c_str());
    } else if (r < 0) {
        // Already reaped elsewhere; nothing left to wait for
        child.exited = true;
        log_warn("interceptor", "waitpid(%d) failed: %s",
                 static_cast<int>(child.pid), strerror(errno));
    }
}

void ProcessInterceptor::close_child_fds(Child& child) {
    close_fd(child.stdin_fd);
    close_fd(child.stdout_fd);
    close_fd(child.stderr_fd);
}

void ProcessInterceptor::terminate_all() {
    std::lock_guard<std::mutex> lock(children_mutex_);

    for (auto& [key, child] : children_) {
        close_fd(child.stdin_fd);
        if (!child.exited && ::kill(child.pid, SIGTERM) != 0 && errno != ESRCH) {
            log_warn("interceptor", "%s: SIGTERM failed: %s", key.c_str(), strerror(errno));
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.stop_grace_ms);
    while (true) {
        bool all_exited = true;
        for (auto& [key, child] : children_) {
            reap(child, false);
            if (!child.exited) all_exited = false;
        }
        if (all_exited || std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    for (auto& [key, child] : children_) {
        if (!child.exited) {
            log_warn("interceptor", "%s: still running after %d ms, killing",
                     key.c_str(), config_.stop_grace_ms);
            ::kill(child.pid, SIGKILL);
            reap(child, true);
        }
        close_child_fds(child);
    }
    children_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// Reading
// ═══════════════════════════════════════════════════════════════════════════

void ProcessInterceptor::reader_loop() {
    struct Watch {
        std::string key;
        std::string host;
        std::string server;
        StreamKind kind;
    };

    std::vector<char> buf(READ_CHUNK);

    while (running_.load()) {
        std::vector<pollfd> fds;
        std::vector<Watch> watches;
        {
            std::lock_guard<std::mutex> lock(children_mutex_);
            for (auto& [key, child] : children_) {
                if (child.stdout_fd >= 0) {
                    fds.push_back({child.stdout_fd, POLLIN, 0});
                    watches.push_back({key, child.host, child.server, StreamKind::Stdout});
                }
                if (child.stderr_fd >= 0) {
                    fds.push_back({child.stderr_fd, POLLIN, 0});
                    watches.push_back({key, child.host, child.server, StreamKind::Stderr});
                }
                // Pipes gone but process not yet collected
                if (child.stdout_fd < 0 && child.stderr_fd < 0) reap(child, false);
            }
        }

        if (fds.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
            continue;
        }

        int rc = ::poll(fds.data(), fds.size(), config_.poll_interval_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_error("interceptor", "poll() error: %s", strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
            continue;
        }
        if (rc == 0) continue;

        for (size_t i = 0; i < fds.size(); ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const Watch& w = watches[i];

            ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) {
                std::string chunk(buf.data(), static_cast<size_t>(n));
                {
                    std::lock_guard<std::mutex> lock(tap_mutex_);
                    if (tap_) tap_(w.host, w.server, w.kind, chunk);
                }
                ingest(w.host, w.server, w.kind, chunk, now());
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;

            // EOF or hard error: finish any unterminated line, then close
            ingest(w.host, w.server, w.kind, "\n", now());

            std::lock_guard<std::mutex> lock(children_mutex_);
            auto it = children_.find(w.key);
            if (it == children_.end()) continue;
            Child& child = it->second;
            log_debug("interceptor", "%s: %s closed", w.key.c_str(), stream_kind_name(w.kind));
            if (w.kind == StreamKind::Stdout) {
                close_fd(child.stdout_fd);
            } else {
                close_fd(child.stderr_fd);
            }
            if (child.stdout_fd < 0 && child.stderr_fd < 0) reap(child, false);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Framing and hand-off
// ═══════════════════════════════════════════════════════════════════════════

bool ProcessInterceptor::send(const std::string& host, const std::string& server,
                              const std::string& text) {
    if (!running_.load()) return false;

    std::string key = source_key(host, server);
    int fd = -1;
    {
        // Our own duplicate: stop() may close the child's descriptor mid-write
        std::lock_guard<std::mutex> lock(children_mutex_);
        auto it = children_.find(key);
        if (it != children_.end() && !it->second.exited && it->second.stdin_fd >= 0) {
            fd = ::fcntl(it->second.stdin_fd, F_DUPFD_CLOEXEC, 0);
            if (fd < 0) {
                log_warn("interceptor", "%s: dup failed: %s", key.c_str(), strerror(errno));
                return false;
            }
        }
    }
    if (fd < 0) {
        log_warn("interceptor", "%s: no writable stdin", key.c_str());
        return false;
    }

    // Captured before the write so a fast reply always finds its request
    ingest(host, server, StreamKind::Stdin, text, now());

    // Written without holding the table lock: the child may be slow to read
    bool ok = true;
    size_t written = 0;
    while (written < text.size()) {
        ssize_t n = ::write(fd, text.data() + written, text.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            log_warn("interceptor", "%s: write failed: %s", key.c_str(), strerror(errno));
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }
    close_fd(fd);
    return ok;
}

void ProcessInterceptor::ingest(const std::string& host, const std::string& server,
                                StreamKind kind, const std::string& chunk, Timestamp ts) {
    std::lock_guard<std::mutex> lock(ingest_mutex_);

    std::vector<json> frames;
    std::vector<std::string> noise;
    reassembler_.feed(StreamKey{host, server, kind}, chunk, frames,
                      kind == StreamKind::Stderr ? &noise : nullptr);

    std::string key = source_key(host, server);
    for (const auto& frame : frames) {
        auto latency = track_latency(key, kind, frame, ts);
        if (kind != StreamKind::Stdin && ToolRegistry::is_catalog_result(frame)) {
            registry_.update(host, server, frame["result"]["tools"]);
        }
        bus_.publish(frame, host, server, latency, ts);
    }

    for (const auto& line : noise) {
        for (const auto& frame : scanner_.scan(line, host, server, ts)) {
            bus_.publish(frame, host, server, std::nullopt, ts);
        }
    }
}

std::optional<int64_t> ProcessInterceptor::track_latency(const std::string& key, StreamKind kind,
                                                         const json& frame, Timestamp ts) {
    std::string id = protocol::id_key(frame);
    if (id.empty()) return std::nullopt;

    std::string pending_key = key + "#" + id;
    MessageType type = protocol::message_type(frame);

    if (kind == StreamKind::Stdin && type == MessageType::Request) {
        pending_[pending_key] = ts;
        pending_order_.push_back(pending_key);
        while (pending_order_.size() > config_.pending_capacity) {
            pending_.erase(pending_order_.front());
            pending_order_.pop_front();
        }
        return std::nullopt;
    }

    if (kind != StreamKind::Stdin && type == MessageType::Response) {
        auto it = pending_.find(pending_key);
        if (it == pending_.end()) return std::nullopt;
        int64_t latency = std::max<int64_t>(0, ts - it->second);
        pending_.erase(it);
        return latency;
    }

    return std::nullopt;
}

void ProcessInterceptor::set_output_tap(OutputTap tap) {
    std::lock_guard<std::mutex> lock(tap_mutex_);
    tap_ = std::move(tap);
}

size_t ProcessInterceptor::overflow_count() const {
    std::lock_guard<std::mutex> lock(ingest_mutex_);
    return reassembler_.overflow_count();
}

} // namespace drishti
