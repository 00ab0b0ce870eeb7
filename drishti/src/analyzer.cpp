#include <drishti/analyzer.hpp>
#include <drishti/protocol.hpp>
#include <drishti/log.hpp>
#include <exception>

namespace drishti {

json to_json(const AnalyzerStatus& status) {
    json j = {
        {"running", status.running},
        {"message_count", status.message_count},
        {"interaction_count", status.interaction_count},
        {"cognitive_load", status.cognitive_load},
        {"insights_generated", status.insights_generated},
        {"last_analysis", nullptr}
    };
    if (status.last_analysis) j["last_analysis"] = format_iso8601(*status.last_analysis);
    return j;
}

CognitiveAnalyzer::CognitiveAnalyzer(RuleConfig rules)
    : rules_(std::move(rules)) {}

void CognitiveAnalyzer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    log_info("analyzer", "started (window %zu, capacity %zu)",
             rules_.window_size, rules_.message_capacity);
}

void CognitiveAnalyzer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
    log_info("analyzer", "stopped after %llu messages",
             static_cast<unsigned long long>(message_count_));
}

bool CognitiveAnalyzer::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

Trace CognitiveAnalyzer::make_trace(const InterceptedMessage& message) {
    const json& p = message.payload;
    Trace t;
    t.timestamp = message.timestamp;
    t.direction = message.direction;
    t.type = protocol::message_type(p);
    t.method = message.method();
    if (auto it = p.find("params"); it != p.end()) t.params = *it;
    if (auto it = p.find("result"); it != p.end()) t.result = *it;
    if (auto it = p.find("error"); it != p.end()) t.error = *it;
    t.latency_ms = message.latency_ms;
    t.host = message.host;
    t.server = message.server;
    return t;
}

Interaction CognitiveAnalyzer::make_interaction(const Trace& trace) {
    Interaction i;
    i.id = trace.host + "-" + trace.server + "-" + std::to_string(++interaction_seq_);
    i.start_time = trace.timestamp;
    i.end_time = trace.timestamp;
    i.duration_ms = trace.latency_ms.value_or(0);
    i.message_count = 1;
    i.success_rate = trace.has_error() ? 0.0 : 100.0;
    i.cognitive_load = interaction_load(trace, rules_);
    i.method = trace.has_method() ? trace.method : "unknown";
    i.host = trace.host;
    i.server = trace.server;
    i.messages.push_back(trace);
    return i;
}

TraceWindow CognitiveAnalyzer::window_locked(size_t size) const {
    TraceWindow window;
    size_t first = traces_.size() > size ? traces_.size() - size : 0;
    window.reserve(traces_.size() - first);
    for (size_t i = first; i < traces_.size(); ++i) window.push_back(&traces_[i]);
    return window;
}

void CognitiveAnalyzer::detect_patterns(const Trace& trace, std::vector<Insight>& out) const {
    if (trace.has_method()) {
        size_t same = 0;
        for (const Trace* t : window_locked(rules_.pattern_window)) {
            if (t->method == trace.method) ++same;
        }
        if (same >= rules_.pattern_min_repeats) {
            Insight insight;
            insight.type = "retry_pattern";
            insight.severity = "high";
            insight.message = "Multiple retries detected for " + trace.method;
            insight.details = {
                {"method", trace.method},
                {"retry_count", same},
                {"cognitive_load", {
                    {"score", score_.overall},
                    {"factors", json::array({"retry_frustration", "method_complexity"})}
                }}
            };
            insight.recommendation = "Consider simplifying " + trace.method +
                                     " parameters or improving error messages";
            out.push_back(std::move(insight));
        }
    }

    if (trace.has_error()) {
        std::string text = protocol::error_message(trace.error);
        Insight insight;
        insight.type = "error_pattern";
        insight.severity = "medium";
        insight.message = "Error in " + (trace.has_method() ? trace.method : std::string("unknown")) +
                          ": " + (text.empty() ? std::string("Unknown error") : text);
        insight.details = {
            {"method", trace.has_method() ? json(trace.method) : json(nullptr)},
            {"error", trace.error},
            {"cognitive_load", {{"score", score_.overall}}}
        };
        insight.recommendation = "Review error handling and user feedback mechanisms";
        out.push_back(std::move(insight));
    }
}

void CognitiveAnalyzer::analyze(const InterceptedMessage& message) {
    std::vector<Insight> insights;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;

        Trace trace = make_trace(message);
        traces_.push_back(trace);
        while (traces_.size() > rules_.message_capacity) traces_.pop_front();
        ++message_count_;
        last_analysis_ = message.timestamp;

        if (trace.has_result() || trace.has_error()) {
            interactions_.push_back(make_interaction(trace));
            while (interactions_.size() > rules_.interaction_capacity) interactions_.pop_front();
        }

        score_ = compute_scores(window_locked(rules_.window_size), rules_);

        detect_patterns(trace, insights);
        insights_generated_ += insights.size();
    }

    if (!insights.empty()) emit(insights);
}

void CognitiveAnalyzer::analyze_message(const json& payload, const std::string& host,
                                        const std::string& server) {
    InterceptedMessage message;
    message.timestamp = now();
    message.host = host;
    message.server = server;
    message.direction = protocol::infer_direction(payload);
    message.payload = payload;
    analyze(message);
}

void CognitiveAnalyzer::emit(const std::vector<Insight>& insights) {
    std::vector<InsightCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [id, cb] : listeners_) callbacks.push_back(cb);
    }

    for (const auto& insight : insights) {
        log_debug("analyzer", "insight %s/%s: %s", insight.type.c_str(),
                  insight.severity.c_str(), insight.message.c_str());
        for (const auto& cb : callbacks) {
            try {
                cb(insight);
            } catch (const std::exception& e) {
                log_error("analyzer", "insight listener failed: %s", e.what());
            } catch (...) {
                log_error("analyzer", "insight listener failed: unknown exception");
            }
        }
    }
}

size_t CognitiveAnalyzer::on_insight(InsightCallback callback) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    size_t id = next_listener_id_++;
    listeners_[id] = std::move(callback);
    return id;
}

bool CognitiveAnalyzer::remove_insight_listener(size_t id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return listeners_.erase(id) > 0;
}

AnalyzerStatus CognitiveAnalyzer::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AnalyzerStatus s;
    s.running = running_;
    s.message_count = message_count_;
    s.interaction_count = interactions_.size();
    s.cognitive_load = score_.overall;
    s.insights_generated = insights_generated_;
    s.last_analysis = last_analysis_;
    return s;
}

ScoreComponents CognitiveAnalyzer::score() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return score_;
}

std::vector<Interaction> CognitiveAnalyzer::interactions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {interactions_.begin(), interactions_.end()};
}

std::vector<Trace> CognitiveAnalyzer::traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {traces_.begin(), traces_.end()};
}

void CognitiveAnalyzer::attach_store(ReportStore* store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = store;
}

TraceReport CognitiveAnalyzer::generate_trace_report(std::optional<TimeRange> range) {
    Timestamp generated_at = now();
    TimeRange effective = range ? *range : TimeRange::last_day(generated_at);

    TraceReport report;
    ReportStore* store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Trace> traces(traces_.begin(), traces_.end());
        std::vector<Interaction> interactions(interactions_.begin(), interactions_.end());
        report = build_trace_report(traces, interactions, score_, effective, rules_, generated_at);
        store = store_;
    }

    log_info("analyzer", "trace report: %zu messages, %zu interactions, %zu friction points",
             report.total_messages, report.total_interactions, report.friction_points.size());
    if (store) store->save(report);
    return report;
}

UsabilityReport CognitiveAnalyzer::generate_usability_report(const std::string& host,
                                                             std::optional<TimeRange> range) {
    Timestamp generated_at = now();
    std::string label = range
        ? format_iso8601(range->start) + "/" + format_iso8601(range->end)
        : std::string("all");

    UsabilityReport report;
    ReportStore* store;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Trace> host_traces;
        for (const auto& t : traces_) {
            if (t.host != host) continue;
            if (range && !range->contains(t.timestamp)) continue;
            host_traces.push_back(t);
        }
        report = build_usability_report(host, host_traces, score_, label, rules_, generated_at);
        store = store_;
    }

    log_info("analyzer", "usability report for %s: overall %d, grade %s",
             host.c_str(), report.overall, report.grade.c_str());
    if (store) store->save(report);
    return report;
}

} // namespace drishti
