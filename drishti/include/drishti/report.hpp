#pragma once
// Reports: on-demand aggregates over what the analyzer has retained
//
// Two views:
//   - trace report: every source, a time range, friction points by method
//   - usability report: one host, score breakdown, rule-picked advice
//
// Building a report is pure. Persisting it is best-effort: a failed write
// is logged and the caller still gets the report.

#include "types.hpp"
#include "rules.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace drishti {

struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;

    bool contains(Timestamp ts) const { return ts >= start && ts <= end; }

    static TimeRange last_day(Timestamp end) {
        return {end - MS_PER_DAY, end};
    }
};

struct MethodCount {
    std::string method;
    size_t count = 0;
};

struct FrictionPoint {
    std::string method;
    std::string issue;
    std::string severity;
    std::string recommendation;
    double error_rate = 0.0;
};

struct ErrorPattern {
    std::string pattern;
    size_t frequency = 0;
    std::string impact;     // High | Medium | Low
};

struct TraceReport {
    Timestamp generated_at = 0;
    TimeRange range;

    size_t total_interactions = 0;
    size_t total_messages = 0;
    double average_cognitive_load = 0.0;
    double success_rate = 100.0;
    std::vector<MethodCount> most_used_methods;
    std::vector<std::string> servers_analyzed;

    std::vector<Interaction> interactions;

    double average_latency = 0.0;
    std::vector<FrictionPoint> friction_points;
    int usability_score = 0;
};

struct UsabilityReport {
    Timestamp generated_at = 0;
    std::string host;
    std::string time_range;

    int overall = 0;
    ScoreComponents breakdown;
    std::string grade;
    std::string description;

    std::vector<std::string> strengths;
    std::vector<std::string> weaknesses;
    std::vector<std::string> recommendations;

    double average_response_time = 0.0;
    double success_rate = 100.0;
    std::vector<ErrorPattern> error_patterns;

    // Placeholder until a baseline exists
    int vs_industry_average = -12;
    int vs_last_week = 5;
    std::string trend_direction = "improving";
};

// ── Aggregation ─────────────────────────────────────────────────────────

// `traces` and `interactions` are the retained history, oldest first
TraceReport build_trace_report(const std::vector<Trace>& traces,
                               const std::vector<Interaction>& interactions,
                               const ScoreComponents& current,
                               const TimeRange& range,
                               const RuleConfig& rules,
                               Timestamp generated_at);

// `host_traces` are already filtered to the host (and range, if any)
UsabilityReport build_usability_report(const std::string& host,
                                       const std::vector<Trace>& host_traces,
                                       const ScoreComponents& current,
                                       const std::string& time_range,
                                       const RuleConfig& rules,
                                       Timestamp generated_at);

std::vector<FrictionPoint> identify_friction_points(const std::vector<Trace>& traces,
                                                    const RuleConfig& rules);
std::vector<ErrorPattern> identify_error_patterns(const std::vector<Trace>& traces);

// ── Serialization ───────────────────────────────────────────────────────

json to_json(const Trace& trace);
json to_json(const Interaction& interaction);
json to_json(const ScoreComponents& score);
json to_json(const TraceReport& report);
json to_json(const UsabilityReport& report);

// ── Persistence ─────────────────────────────────────────────────────────

class ReportStore {
public:
    explicit ReportStore(std::string directory);

    // Creates the directory if needed; false if it cannot
    bool prepare();

    // Atomic write of `<directory>/<filename>`; false on failure
    bool save(const std::string& filename, const json& content);

    bool save(const TraceReport& report);
    bool save(const UsabilityReport& report);

    static std::string trace_report_name(Timestamp generated_at);
    static std::string usability_report_name(const std::string& host, Timestamp generated_at);

    const std::string& directory() const { return directory_; }
    std::string last_error() const;
    std::string last_path() const;

private:
    bool prepare_locked();
    std::string unused_path(const std::string& filename) const;

    std::string directory_;
    mutable std::mutex mutex_;      // Serializes saves; guards last_error_, last_path_
    std::string last_error_;
    std::string last_path_;
};

} // namespace drishti
