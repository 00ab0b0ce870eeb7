#pragma once
// Cognitive Analyzer: traces in, friction scores and insights out
//
// Fed synchronously by the message bus. Every message becomes a Trace;
// every result/error becomes an Interaction. The rolling score is
// recomputed from the last window of traces on each message, so replaying
// the same messages always yields the same scores.
//
// One mutex guards all state. Insight listeners run after it is released.

#include "types.hpp"
#include "rules.hpp"
#include "scoring.hpp"
#include "report.hpp"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drishti {

using InsightCallback = std::function<void(const Insight&)>;

struct AnalyzerStatus {
    bool running = false;
    uint64_t message_count = 0;         // Analyzed since construction
    size_t interaction_count = 0;       // Retained
    int cognitive_load = 95;            // Current overall
    uint64_t insights_generated = 0;
    std::optional<Timestamp> last_analysis;
};

json to_json(const AnalyzerStatus& status);

class CognitiveAnalyzer {
public:
    explicit CognitiveAnalyzer(RuleConfig rules = {});

    // Non-copyable
    CognitiveAnalyzer(const CognitiveAnalyzer&) = delete;
    CognitiveAnalyzer& operator=(const CognitiveAnalyzer&) = delete;

    void start();
    void stop();
    bool is_running() const;

    // Bus entry point; ignored while stopped
    void analyze(const InterceptedMessage& message);

    // Direct entry for callers without a bus (timestamp = now)
    void analyze_message(const json& payload, const std::string& host, const std::string& server);

    size_t on_insight(InsightCallback callback);
    bool remove_insight_listener(size_t id);

    AnalyzerStatus status() const;
    ScoreComponents score() const;
    std::vector<Interaction> interactions() const;
    std::vector<Trace> traces() const;

    // Reports are persisted here when set; not owned
    void attach_store(ReportStore* store);

    TraceReport generate_trace_report(std::optional<TimeRange> range = std::nullopt);
    UsabilityReport generate_usability_report(const std::string& host,
                                              std::optional<TimeRange> range = std::nullopt);

    const RuleConfig& rules() const { return rules_; }

    // Message → Trace, no state involved
    static Trace make_trace(const InterceptedMessage& message);

private:
    Interaction make_interaction(const Trace& trace);
    void detect_patterns(const Trace& trace, std::vector<Insight>& out) const;
    void emit(const std::vector<Insight>& insights);
    TraceWindow window_locked(size_t size) const;

    const RuleConfig rules_;

    mutable std::mutex mutex_;
    bool running_ = false;
    std::deque<Trace> traces_;
    std::deque<Interaction> interactions_;
    ScoreComponents score_;
    uint64_t message_count_ = 0;
    uint64_t interaction_seq_ = 0;
    uint64_t insights_generated_ = 0;
    std::optional<Timestamp> last_analysis_;
    ReportStore* store_ = nullptr;

    mutable std::mutex listeners_mutex_;
    size_t next_listener_id_ = 1;
    std::map<size_t, InsightCallback> listeners_;
};

} // namespace drishti
