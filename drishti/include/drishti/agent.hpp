#pragma once
// Agent: the whole observer wired together
//
// Owns every component. Sources go in, frames flow through the bus into
// the analyzer, insights and alerts go out to sinks. A monitor thread
// reviews the trace report on an interval and raises an alert when
// usability falls below the threshold with friction points to show for it.

#include "types.hpp"
#include "rules.hpp"
#include "sources.hpp"
#include "tool_registry.hpp"
#include "scanner.hpp"
#include "analyzer.hpp"
#include "message_bus.hpp"
#include "process_interceptor.hpp"
#include "report.hpp"
#include "sinks.hpp"
#include "dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace drishti {

struct AgentConfig {
    std::string reports_dir = "reports";        // Empty: reports stay in memory
    std::string rules_path;                     // Empty: built-in rules
    std::string log_level;                      // Empty: leave threshold alone
    bool proactive = true;
    int64_t proactive_interval_ms = 300000;     // 5 minutes between reviews
    int alert_threshold = 70;                   // Usability below this alerts
    size_t dispatcher_capacity = 1024;          // Per observer and per sink
    int stop_grace_ms = 2000;

    // DRISHTI_REPORTS_DIR, DRISHTI_RULES, DRISHTI_LOG_LEVEL, DRISHTI_ALERT_THRESHOLD
    static AgentConfig from_env();
    static AgentConfig from_env(AgentConfig base);
};

struct AgentStatus {
    bool running = false;
    BusStatus bus;
    AnalyzerStatus analysis;
    std::vector<std::string> active_sources;
    size_t tools_catalogs = 0;
    size_t sinks = 0;
    size_t monitor_runs = 0;
    size_t alerts_sent = 0;
};

json to_json(const AgentStatus& status);

class Agent {
public:
    explicit Agent(AgentConfig config = {}, RuleConfig rules = {});
    ~Agent();

    // Non-copyable (components hold references into this)
    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    // Sinks are fixed once started
    void add_sink(std::unique_ptr<IntegrationSink> sink);

    StartReport start(const std::vector<SourceDescriptor>& sources);
    void stop();
    bool is_running() const { return running_.load(); }

    // Direct ingestion, bypassing process capture
    void analyze_message(const json& payload, const std::string& host, const std::string& server);

    AgentStatus status() const;
    std::vector<InterceptedMessage> recent_messages(size_t limit) const;
    size_t on_insight(InsightCallback callback);

    TraceReport generate_trace_report(std::optional<TimeRange> range = std::nullopt);
    UsabilityReport generate_usability_report(const std::string& host,
                                              std::optional<TimeRange> range = std::nullopt);

    // One proactive review; returns the alert if one was raised
    std::optional<AlertData> review();

    // Wait for observer and sink queues to drain
    bool flush(int timeout_ms);

    MessageBus& bus() { return bus_; }
    CognitiveAnalyzer& analyzer() { return analyzer_; }
    ProcessInterceptor& interceptor() { return interceptor_; }
    const ToolRegistry& registry() const { return registry_; }
    const AgentConfig& config() const { return config_; }

private:
    struct SinkEvent {
        enum class Kind { Insight, Alert } kind = Kind::Insight;
        Insight insight;
        AlertData alert;
    };

    using SinkQueue = AsyncDispatcher<SinkEvent>;

    void monitor_loop();
    void dispatch(const SinkEvent& event);

    AgentConfig config_;

    ToolRegistry registry_;
    ActivityScanner scanner_;
    CognitiveAnalyzer analyzer_;
    MessageBus bus_;
    ProcessInterceptor interceptor_;
    std::unique_ptr<ReportStore> store_;

    std::vector<std::shared_ptr<IntegrationSink>> sinks_;
    std::vector<std::unique_ptr<SinkQueue>> sink_queues_;
    size_t insight_listener_ = 0;

    std::atomic<bool> running_{false};
    std::thread monitor_;
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;

    std::atomic<size_t> monitor_runs_{0};
    std::atomic<size_t> alerts_sent_{0};
};

} // namespace drishti
