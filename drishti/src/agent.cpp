#include <drishti/agent.hpp>
#include <drishti/log.hpp>
#include <chrono>
#include <cstdlib>

namespace drishti {

namespace {

InterceptorConfig interceptor_config(const AgentConfig& config) {
    InterceptorConfig c;
    c.stop_grace_ms = config.stop_grace_ms;
    return c;
}

} // namespace

AgentConfig AgentConfig::from_env() {
    return from_env(AgentConfig{});
}

AgentConfig AgentConfig::from_env(AgentConfig base) {
    if (const char* dir = std::getenv("DRISHTI_REPORTS_DIR")) {
        base.reports_dir = dir;
    }
    if (const char* rules = std::getenv("DRISHTI_RULES")) {
        base.rules_path = rules;
    }
    if (const char* level = std::getenv("DRISHTI_LOG_LEVEL")) {
        base.log_level = level;
    }
    if (const char* threshold = std::getenv("DRISHTI_ALERT_THRESHOLD")) {
        char* end = nullptr;
        long value = std::strtol(threshold, &end, 10);
        if (end != threshold && *end == '\0' && value >= 0 && value <= 100) {
            base.alert_threshold = static_cast<int>(value);
        } else {
            log_warn("config", "ignoring DRISHTI_ALERT_THRESHOLD=%s", threshold);
        }
    }
    return base;
}

json to_json(const AgentStatus& status) {
    json bus = {
        {"running", status.bus.running},
        {"message_count", status.bus.message_count},
        {"retained", status.bus.retained},
        {"observers", status.bus.observers},
        {"dropped", status.bus.dropped},
        {"last_message_time", nullptr}
    };
    if (status.bus.last_message_time) {
        bus["last_message_time"] = format_iso8601(*status.bus.last_message_time);
    }
    return {
        {"running", status.running},
        {"bus", bus},
        {"analysis", to_json(status.analysis)},
        {"active_sources", status.active_sources},
        {"tool_catalogs", status.tools_catalogs},
        {"sinks", status.sinks},
        {"monitor_runs", status.monitor_runs},
        {"alerts_sent", status.alerts_sent}
    };
}

Agent::Agent(AgentConfig config, RuleConfig rules)
    : config_(std::move(config))
    , scanner_(&registry_)
    , analyzer_(std::move(rules))
    , bus_(analyzer_.rules().message_capacity, config_.dispatcher_capacity)
    , interceptor_(bus_, registry_, scanner_, interceptor_config(config_)) {
    if (!config_.reports_dir.empty()) {
        store_ = std::make_unique<ReportStore>(config_.reports_dir);
        analyzer_.attach_store(store_.get());
    }
    bus_.connect_analyzer(&analyzer_);
}

Agent::~Agent() {
    stop();
}

void Agent::add_sink(std::unique_ptr<IntegrationSink> sink) {
    if (!sink) return;
    if (running_.load()) {
        log_warn("agent", "sink %s added while running, ignored", sink->name().c_str());
        return;
    }

    std::shared_ptr<IntegrationSink> shared(std::move(sink));
    sink_queues_.push_back(std::make_unique<SinkQueue>(
        shared->name(),
        [shared](const SinkEvent& event) {
            if (event.kind == SinkEvent::Kind::Insight) {
                shared->send_insight(event.insight);
            } else {
                shared->send_alert(event.alert);
            }
        },
        config_.dispatcher_capacity));
    sinks_.push_back(std::move(shared));
}

StartReport Agent::start(const std::vector<SourceDescriptor>& sources) {
    if (running_.exchange(true)) {
        log_warn("agent", "already running");
        return {};
    }

    log_info("agent", "starting (%zu sources, %zu sinks)", sources.size(), sinks_.size());

    if (store_) store_->prepare();

    for (auto& queue : sink_queues_) queue->start();
    insight_listener_ = analyzer_.on_insight([this](const Insight& insight) {
        SinkEvent event;
        event.kind = SinkEvent::Kind::Insight;
        event.insight = insight;
        dispatch(event);
    });

    analyzer_.start();
    bus_.start();
    StartReport report = interceptor_.start(sources);

    if (config_.proactive && config_.proactive_interval_ms > 0) {
        monitor_ = std::thread([this]() { monitor_loop(); });
        log_info("agent", "proactive monitoring every %lld ms",
                 static_cast<long long>(config_.proactive_interval_ms));
    }

    log_info("agent", "ready: %zu sources active", interceptor_.active_sources().size());
    return report;
}

void Agent::stop() {
    if (!running_.exchange(false)) return;

    log_info("agent", "stopping");
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
    }
    monitor_cv_.notify_all();
    if (monitor_.joinable()) {
        monitor_.join();
    }

    // Input first, then the pipeline behind it, sinks drain last
    interceptor_.stop();
    bus_.stop();
    analyzer_.remove_insight_listener(insight_listener_);
    analyzer_.stop();
    for (auto& queue : sink_queues_) queue->stop();

    log_info("agent", "stopped");
}

void Agent::analyze_message(const json& payload, const std::string& host, const std::string& server) {
    bus_.publish(payload, host, server);
}

AgentStatus Agent::status() const {
    AgentStatus s;
    s.running = running_.load();
    s.bus = bus_.status();
    s.analysis = analyzer_.status();
    s.active_sources = interceptor_.active_sources();
    s.tools_catalogs = registry_.size();
    s.sinks = sinks_.size();
    s.monitor_runs = monitor_runs_.load();
    s.alerts_sent = alerts_sent_.load();
    return s;
}

std::vector<InterceptedMessage> Agent::recent_messages(size_t limit) const {
    return bus_.recent(limit);
}

size_t Agent::on_insight(InsightCallback callback) {
    return analyzer_.on_insight(std::move(callback));
}

TraceReport Agent::generate_trace_report(std::optional<TimeRange> range) {
    return analyzer_.generate_trace_report(range);
}

UsabilityReport Agent::generate_usability_report(const std::string& host,
                                                 std::optional<TimeRange> range) {
    return analyzer_.generate_usability_report(host, range);
}

// ═══════════════════════════════════════════════════════════════════════════
// Proactive monitoring
// ═══════════════════════════════════════════════════════════════════════════

std::optional<AlertData> Agent::review() {
    ++monitor_runs_;
    TraceReport report = analyzer_.generate_trace_report();

    if (report.usability_score >= config_.alert_threshold) return std::nullopt;

    log_warn("agent", "low usability: score %d/100", report.usability_score);
    if (report.friction_points.empty()) return std::nullopt;

    SinkEvent event;
    event.kind = SinkEvent::Kind::Alert;
    event.alert.type = "usability";
    event.alert.severity = "high";
    event.alert.message = std::to_string(report.friction_points.size()) + " friction points detected";
    for (const auto& p : report.friction_points) {
        event.alert.recommendations.push_back(p.recommendation);
    }

    ++alerts_sent_;
    dispatch(event);
    return event.alert;
}

void Agent::monitor_loop() {
    std::unique_lock<std::mutex> lock(monitor_mutex_);
    while (running_.load()) {
        bool stopping = monitor_cv_.wait_for(
            lock, std::chrono::milliseconds(config_.proactive_interval_ms),
            [this]() { return !running_.load(); });
        if (stopping) break;

        lock.unlock();
        review();
        lock.lock();
    }
}

void Agent::dispatch(const SinkEvent& event) {
    for (auto& queue : sink_queues_) queue->post(event);
}

bool Agent::flush(int timeout_ms) {
    bool drained = bus_.flush(timeout_ms);
    for (auto& queue : sink_queues_) {
        if (!queue->wait_idle(timeout_ms)) drained = false;
    }
    return drained;
}

} // namespace drishti
