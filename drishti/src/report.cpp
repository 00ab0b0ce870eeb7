#include <drishti/report.hpp>
#include <drishti/scoring.hpp>
#include <drishti/protocol.hpp>
#include <drishti/log.hpp>
#include <drishti/version.hpp>
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <map>
#include <set>
#include <system_error>

namespace drishti {

namespace {

double error_rate_of(const std::vector<Trace>& traces) {
    size_t errors = 0;
    for (const auto& t : traces) {
        if (t.has_error()) ++errors;
    }
    return static_cast<double>(errors) / static_cast<double>(std::max<size_t>(1, traces.size()));
}

double average_latency_of(const std::vector<Trace>& traces) {
    double total = 0.0;
    for (const auto& t : traces) {
        if (t.latency_ms) total += static_cast<double>(*t.latency_ms);
    }
    return total / static_cast<double>(std::max<size_t>(1, traces.size()));
}

std::string format_percent(double rate) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", rate * 100.0);
    return buf;
}

json format_json() {
    return {{"major", DRISHTI_REPORT_FORMAT_MAJOR}, {"minor", DRISHTI_REPORT_FORMAT_MINOR}};
}

json range_json(const TimeRange& range) {
    return {{"start", format_iso8601(range.start)}, {"end", format_iso8601(range.end)}};
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Aggregation
// ═══════════════════════════════════════════════════════════════════════════

std::vector<FrictionPoint> identify_friction_points(const std::vector<Trace>& traces,
                                                    const RuleConfig& rules) {
    std::map<std::string, size_t> counts;
    std::map<std::string, size_t> errors;
    for (const auto& t : traces) {
        if (!t.has_method()) continue;
        counts[t.method]++;
        if (t.has_error()) errors[t.method]++;
    }

    std::vector<FrictionPoint> points;
    for (const auto& [method, error_count] : errors) {
        double rate = static_cast<double>(error_count) / static_cast<double>(counts[method]);
        if (rate <= rules.friction_error_rate) continue;

        FrictionPoint p;
        p.method = method;
        p.issue = "High error rate (" + format_percent(rate) + ")";
        p.severity = "high";
        p.recommendation = "Review " + method + " implementation and error handling";
        p.error_rate = rate;
        points.push_back(std::move(p));
    }
    return points;
}

std::vector<ErrorPattern> identify_error_patterns(const std::vector<Trace>& traces) {
    std::map<std::string, size_t> groups;
    for (const auto& t : traces) {
        if (!t.has_error()) continue;
        std::string key;
        int64_t code = protocol::error_code(t.error);
        if (code != 0) {
            key = std::to_string(code);
        } else {
            key = protocol::error_message(t.error);
            if (key.empty()) key = "Unknown error";
        }
        groups[key]++;
    }

    std::vector<ErrorPattern> patterns;
    for (const auto& [pattern, frequency] : groups) {
        ErrorPattern p;
        p.pattern = pattern;
        p.frequency = frequency;
        p.impact = frequency > 3 ? "High" : (frequency > 1 ? "Medium" : "Low");
        patterns.push_back(std::move(p));
    }
    // Map order already breaks ties by pattern
    std::stable_sort(patterns.begin(), patterns.end(),
                     [](const ErrorPattern& a, const ErrorPattern& b) {
                         return a.frequency > b.frequency;
                     });
    return patterns;
}

TraceReport build_trace_report(const std::vector<Trace>& traces,
                               const std::vector<Interaction>& interactions,
                               const ScoreComponents& current,
                               const TimeRange& range,
                               const RuleConfig& rules,
                               Timestamp generated_at) {
    TraceReport report;
    report.generated_at = generated_at;
    report.range = range;

    std::vector<Trace> in_range;
    for (const auto& t : traces) {
        if (range.contains(t.timestamp)) in_range.push_back(t);
    }
    for (const auto& i : interactions) {
        if (range.contains(i.start_time)) report.interactions.push_back(i);
    }

    report.total_interactions = report.interactions.size();
    report.total_messages = in_range.size();

    double load_sum = 0.0;
    for (const auto& i : report.interactions) load_sum += i.cognitive_load;
    report.average_cognitive_load =
        load_sum / static_cast<double>(std::max<size_t>(1, report.interactions.size()));

    report.success_rate = in_range.empty() ? 100.0 : (1.0 - error_rate_of(in_range)) * 100.0;

    std::map<std::string, size_t> method_counts;
    std::set<std::string> servers;
    for (const auto& t : in_range) {
        if (t.has_method()) method_counts[t.method]++;
        servers.insert(t.server);
    }

    for (const auto& [method, count] : method_counts) {
        report.most_used_methods.push_back({method, count});
    }
    std::stable_sort(report.most_used_methods.begin(), report.most_used_methods.end(),
                     [](const MethodCount& a, const MethodCount& b) { return a.count > b.count; });
    if (report.most_used_methods.size() > rules.top_methods) {
        report.most_used_methods.resize(rules.top_methods);
    }

    report.servers_analyzed.assign(servers.begin(), servers.end());
    report.average_latency = average_latency_of(in_range);
    report.friction_points = identify_friction_points(in_range, rules);
    report.usability_score = current.usability();
    return report;
}

UsabilityReport build_usability_report(const std::string& host,
                                       const std::vector<Trace>& host_traces,
                                       const ScoreComponents& current,
                                       const std::string& time_range,
                                       const RuleConfig& rules,
                                       Timestamp generated_at) {
    UsabilityReport report;
    report.generated_at = generated_at;
    report.host = host;
    report.time_range = time_range;

    // Breakdown over this host's own recent window
    TraceWindow window;
    size_t first = host_traces.size() > rules.window_size
        ? host_traces.size() - rules.window_size : 0;
    for (size_t i = first; i < host_traces.size(); ++i) window.push_back(&host_traces[i]);
    report.breakdown = compute_scores(window, rules);

    report.overall = current.overall;
    report.grade = current.grade();
    report.description = current.description();

    double error_rate = error_rate_of(host_traces);
    double latency = average_latency_of(host_traces);

    if (error_rate < rules.strength_error_rate) {
        report.strengths.push_back("Low error rate indicates robust implementation");
    }
    if (latency < rules.fast_latency_ms) {
        report.strengths.push_back("Fast response times enhance user experience");
    }
    if (!host_traces.empty()) {
        report.strengths.push_back("Active MCP communication indicates good integration");
    }

    if (error_rate > rules.weakness_error_rate) {
        report.weaknesses.push_back("High error rate may cause user frustration");
    }
    if (latency > rules.slow_latency_ms) {
        report.weaknesses.push_back("Slow response times impact user experience");
    }

    report.recommendations = {
        "Consider implementing caching for frequently accessed resources",
        "Optimize tool parameter validation to reduce cognitive load",
        "Add more detailed examples in tool documentation"
    };
    if (error_rate > rules.weakness_error_rate) {
        report.recommendations.push_back("Improve error handling and user feedback mechanisms");
    }

    report.average_response_time = latency;
    report.success_rate = (1.0 - error_rate) * 100.0;
    report.error_patterns = identify_error_patterns(host_traces);
    return report;
}

// ═══════════════════════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════════════════════

json to_json(const Trace& trace) {
    json j = {
        {"timestamp", format_iso8601(trace.timestamp)},
        {"direction", direction_name(trace.direction)},
        {"message_type", message_type_name(trace.type)},
        {"host", trace.host},
        {"server", trace.server}
    };
    if (trace.has_method()) j["method"] = trace.method;
    if (!trace.params.is_null()) j["params"] = trace.params;
    if (trace.has_result()) j["result"] = trace.result;
    if (trace.has_error()) j["error"] = trace.error;
    if (trace.latency_ms) j["latency_ms"] = *trace.latency_ms;
    return j;
}

json to_json(const Interaction& interaction) {
    json messages = json::array();
    for (const auto& m : interaction.messages) messages.push_back(to_json(m));
    return {
        {"id", interaction.id},
        {"start_time", format_iso8601(interaction.start_time)},
        {"end_time", format_iso8601(interaction.end_time)},
        {"duration_ms", interaction.duration_ms},
        {"message_count", interaction.message_count},
        {"success_rate", interaction.success_rate},
        {"cognitive_load", interaction.cognitive_load},
        {"method", interaction.method},
        {"host", interaction.host},
        {"server", interaction.server},
        {"messages", messages}
    };
}

json to_json(const ScoreComponents& score) {
    return {
        {"prompt_complexity", score.prompt_complexity},
        {"context_switching", score.context_switching},
        {"retry_frustration", score.retry_frustration},
        {"configuration_friction", score.configuration_friction},
        {"integration_cognition", score.integration_cognition},
        {"overall", score.overall}
    };
}

json to_json(const TraceReport& report) {
    json methods = json::array();
    for (const auto& m : report.most_used_methods) {
        methods.push_back({{"method", m.method}, {"count", m.count}});
    }
    json interactions = json::array();
    for (const auto& i : report.interactions) interactions.push_back(to_json(i));
    json friction = json::array();
    for (const auto& p : report.friction_points) {
        friction.push_back({
            {"method", p.method},
            {"issue", p.issue},
            {"severity", p.severity},
            {"recommendation", p.recommendation}
        });
    }

    return {
        {"format", format_json()},
        {"generated_at", format_iso8601(report.generated_at)},
        {"time_range", range_json(report.range)},
        {"summary", {
            {"total_interactions", report.total_interactions},
            {"total_messages", report.total_messages},
            {"average_cognitive_load", report.average_cognitive_load},
            {"success_rate", report.success_rate},
            {"most_used_methods", methods},
            {"servers_analyzed", report.servers_analyzed}
        }},
        {"component_interactions", interactions},
        {"cognitive_analysis", {
            {"average_latency", report.average_latency},
            {"friction_points", friction},
            {"usability_score", report.usability_score}
        }}
    };
}

json to_json(const UsabilityReport& report) {
    json patterns = json::array();
    for (const auto& p : report.error_patterns) {
        patterns.push_back({{"pattern", p.pattern}, {"frequency", p.frequency}, {"impact", p.impact}});
    }

    json breakdown = to_json(report.breakdown);
    breakdown.erase("overall");

    return {
        {"format", format_json()},
        {"generated_at", format_iso8601(report.generated_at)},
        {"host", report.host},
        {"time_range", report.time_range},
        {"cognitive_load", {
            {"overall", report.overall},
            {"breakdown", breakdown},
            {"grade", report.grade},
            {"description", report.description}
        }},
        {"usability_insights", {
            {"strengths", report.strengths},
            {"weaknesses", report.weaknesses},
            {"recommendations", report.recommendations}
        }},
        {"performance_metrics", {
            {"average_response_time", report.average_response_time},
            {"success_rate", report.success_rate},
            {"error_patterns", patterns}
        }},
        {"benchmark_comparison", {
            {"vs_industry_average", report.vs_industry_average},
            {"vs_last_week", report.vs_last_week},
            {"trend_direction", report.trend_direction}
        }}
    };
}

// ═══════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════

ReportStore::ReportStore(std::string directory)
    : directory_(std::move(directory)) {}

bool ReportStore::prepare() {
    std::lock_guard<std::mutex> lock(mutex_);
    return prepare_locked();
}

bool ReportStore::prepare_locked() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        last_error_ = "Cannot create " + directory_ + ": " + ec.message();
        log_error("reports", "%s", last_error_.c_str());
        return false;
    }
    return true;
}

// Names carry second resolution; a second report in the same second
// gets a numeric suffix instead of replacing the first
std::string ReportStore::unused_path(const std::string& filename) const {
    std::string path = directory_ + "/" + filename;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return path;

    auto dot = filename.rfind('.');
    std::string stem = (dot == std::string::npos) ? filename : filename.substr(0, dot);
    std::string ext = (dot == std::string::npos) ? "" : filename.substr(dot);
    for (int n = 2;; ++n) {
        path = directory_ + "/" + stem + "_" + std::to_string(n) + ext;
        if (!std::filesystem::exists(path, ec)) return path;
    }
}

bool ReportStore::save(const std::string& filename, const json& content) {
    std::string text = content.dump(2, ' ', false, json::error_handler_t::replace);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!prepare_locked()) return false;

    std::string path = unused_path(filename);
    bool ok = safe_save(path, [&text](FILE* f) {
        return std::fwrite(text.data(), 1, text.size(), f) == text.size() &&
               std::fputc('\n', f) != EOF;
    });

    if (!ok) {
        last_error_ = "Failed to write " + path;
        log_error("reports", "%s", last_error_.c_str());
        return false;
    }

    last_path_ = path;
    log_info("reports", "saved %s", path.c_str());
    return true;
}

std::string ReportStore::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

std::string ReportStore::last_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_path_;
}

bool ReportStore::save(const TraceReport& report) {
    return save(trace_report_name(report.generated_at), to_json(report));
}

bool ReportStore::save(const UsabilityReport& report) {
    return save(usability_report_name(report.host, report.generated_at), to_json(report));
}

std::string ReportStore::trace_report_name(Timestamp generated_at) {
    return "component_trace_" + format_compact(generated_at) + ".json";
}

std::string ReportStore::usability_report_name(const std::string& host, Timestamp generated_at) {
    // Host names come from descriptors; keep them out of path syntax
    std::string safe = host;
    for (char& c : safe) {
        if (c == '/' || c == '\\') c = '_';
    }
    return "usability_report_" + safe + "_" + format_compact(generated_at) + ".json";
}

} // namespace drishti
