#pragma once
// Scoring: deterministic cognitive friction arithmetic
//
// Not learned, not sampled. Every number comes from a RuleConfig table
// applied to the traces in a window. Same window, same score.

#include "types.hpp"
#include "rules.hpp"
#include "protocol.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace drishti {

// Window of traces, oldest first. Pointers into analyzer-owned storage.
using TraceWindow = std::vector<const Trace*>;

inline double clamp_score(double value, double lo, double hi) {
    return std::min(hi, std::max(lo, value));
}

// Half-up rounding
inline int round_score(double value) {
    return static_cast<int>(std::floor(value + 0.5));
}

inline bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (!needle.empty() && haystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// 1. Per-interaction load
// ═══════════════════════════════════════════════════════════════════════════

inline int interaction_load(const Trace& trace, const RuleConfig& rules) {
    int load = rules.interaction_base;

    if (trace.has_method()) {
        auto it = rules.interaction_method_complexity.find(trace.method);
        load += (it != rules.interaction_method_complexity.end())
            ? it->second : rules.interaction_method_default;
    }

    if (!trace.params.is_null()) {
        int keys = (trace.params.is_object() || trace.params.is_array())
            ? static_cast<int>(trace.params.size()) : 0;
        bool nested = protocol::serialize(trace.params).find('{') != std::string::npos;
        int complexity = keys * rules.param_points_per_key + (nested ? rules.param_nested_bonus : 0);
        load += std::min(complexity, rules.param_cap);
    }

    if (trace.has_error()) {
        int64_t code = protocol::error_code(trace.error);
        if (code >= 500) {
            load += rules.error_server_bonus;
        } else if (code >= 400) {
            load += rules.error_client_bonus;
        } else {
            load += rules.error_other_bonus;
        }

        std::string text = protocol::to_lower(protocol::error_message(trace.error));
        if (contains_any(text, rules.auth_keywords)) {
            load += rules.error_auth_bonus;
        }
    }

    if (trace.has_result()) {
        std::string serialized = protocol::serialize(trace.result);
        if (serialized.size() > rules.result_large_size) {
            load += rules.result_large_bonus;
        } else if (serialized.size() > rules.result_medium_size) {
            load += rules.result_medium_bonus;
        }

        size_t arrays = static_cast<size_t>(std::count(serialized.begin(), serialized.end(), '['));
        if (arrays > rules.result_array_threshold) {
            load += rules.result_array_bonus;
        }
    }

    if (trace.latency_ms && *trace.latency_ms > 0) {
        int64_t latency = *trace.latency_ms;
        if (latency > rules.latency_very_slow_ms) {
            load += rules.latency_very_slow_bonus;
        } else if (latency > rules.latency_slow_ms) {
            load += rules.latency_slow_bonus;
        } else if (latency > rules.latency_moderate_ms) {
            load += rules.latency_moderate_bonus;
        }
    }

    return std::min(100, std::max(10, load));
}

// ═══════════════════════════════════════════════════════════════════════════
// 2. Rolling sub-scores over a window
// ═══════════════════════════════════════════════════════════════════════════

inline double prompt_complexity(const TraceWindow& window, const RuleConfig& rules) {
    if (window.empty()) return rules.prompt_empty_default;

    std::set<std::string> methods;
    double total = 0.0;
    for (const Trace* t : window) {
        if (!t->has_method()) continue;
        methods.insert(t->method);
        auto it = rules.prompt_method_complexity.find(t->method);
        total += (it != rules.prompt_method_complexity.end())
            ? it->second : rules.prompt_method_default;
    }

    double average = total / static_cast<double>(window.size());

    int penalty = 0;
    if (methods.size() > rules.diversity_high_methods) {
        penalty = rules.diversity_high_penalty;
    } else if (methods.size() > rules.diversity_low_methods) {
        penalty = rules.diversity_low_penalty;
    }

    return clamp_score(average + penalty, 0.0, 100.0);
}

inline double context_switching(const TraceWindow& window, const RuleConfig& rules) {
    if (window.size() < 2) return rules.switching_short_window_default;

    int switches = 0;
    int method_switches = 0;
    int host_switches = 0;

    for (size_t i = 1; i < window.size(); ++i) {
        const Trace* prev = window[i - 1];
        const Trace* curr = window[i];

        if (prev->host != curr->host) {
            ++host_switches;
            switches += rules.host_switch_weight;
        }
        if (prev->server != curr->server) {
            switches += rules.server_switch_weight;
        }
        if (prev->method != curr->method) {
            ++method_switches;
            switches += rules.method_switch_weight;
        }
    }

    double pairs = static_cast<double>(window.size() - 1);
    double score = rules.switching_base
        + (switches / pairs) * rules.switching_rate_factor
        + (method_switches / pairs) * rules.method_switch_rate_factor;

    if (host_switches > static_cast<double>(window.size()) / 3.0) {
        score += rules.host_switch_penalty;
    }

    return clamp_score(score, 0.0, 100.0);
}

inline double retry_frustration(const TraceWindow& window, const RuleConfig& rules) {
    size_t errors = 0;
    size_t run = 0;
    size_t longest_run = 0;
    std::map<std::string, size_t> per_method;

    for (const Trace* t : window) {
        if (t->has_error()) {
            ++errors;
            longest_run = std::max(longest_run, ++run);
        } else {
            run = 0;
        }
        if (t->has_method()) per_method[t->method]++;
    }

    double score = rules.error_rate_factor
        * static_cast<double>(errors) / static_cast<double>(std::max<size_t>(1, window.size()));
    score += rules.consecutive_error_factor * static_cast<double>(longest_run);

    size_t total_calls = 0;
    for (const auto& [method, count] : per_method) total_calls += count;
    double average_repeats = static_cast<double>(total_calls)
        / static_cast<double>(std::max<size_t>(1, per_method.size()));
    if (average_repeats > rules.repetition_threshold) {
        score += (average_repeats - rules.repetition_threshold) * rules.repetition_factor;
    }

    // Same method again within a short span reads as a retry
    size_t rapid = 0;
    for (size_t i = 1; i < window.size(); ++i) {
        const Trace* prev = window[i - 1];
        const Trace* curr = window[i];
        if (curr->has_method() && prev->method == curr->method &&
            curr->timestamp - prev->timestamp < rules.rapid_retry_ms) {
            ++rapid;
        }
    }
    score += rules.rapid_retry_factor * static_cast<double>(rapid);

    return clamp_score(score, rules.retry_min, 100.0);
}

inline double configuration_friction(const TraceWindow& window, const RuleConfig& rules) {
    double score = rules.config_base;

    for (const Trace* t : window) {
        if (t->has_error()) {
            std::string text = protocol::to_lower(protocol::serialize(t->error));
            if (contains_any(text, rules.config_error_keywords)) {
                score += rules.config_keyword_bonus;
            }

            int64_t code = protocol::error_code(t->error);
            if (std::find(rules.availability_error_codes.begin(),
                          rules.availability_error_codes.end(), code)
                != rules.availability_error_codes.end()) {
                score += rules.availability_bonus;
            }
        }

        if (t->latency_ms && *t->latency_ms > rules.timeout_latency_ms) {
            score += rules.timeout_bonus;
        }
    }

    return clamp_score(score, 0.0, 100.0);
}

inline double integration_cognition(const TraceWindow& window, const RuleConfig& rules) {
    std::set<std::string> hosts;
    std::set<std::string> servers;
    std::set<std::string> methods;
    size_t advanced = 0;

    for (const Trace* t : window) {
        hosts.insert(t->host);
        servers.insert(t->server);
        if (!t->has_method()) continue;
        methods.insert(t->method);
        if (std::find(rules.advanced_methods.begin(), rules.advanced_methods.end(), t->method)
            != rules.advanced_methods.end()) {
            ++advanced;
        }
    }

    double score = rules.integration_base
        + static_cast<double>(hosts.size()) * rules.per_host_points
        + static_cast<double>(servers.size()) * rules.per_server_points
        + static_cast<double>(methods.size()) * rules.per_method_points
        + static_cast<double>(advanced) * rules.advanced_method_points;

    if (methods.size() <= rules.simple_usage_max_methods && servers.size() == 1) {
        score -= rules.simple_usage_bonus;
    }

    return clamp_score(score, rules.integration_min, 100.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// 3. Weighted overall
// ═══════════════════════════════════════════════════════════════════════════

inline ScoreComponents compute_scores(const TraceWindow& window, const RuleConfig& rules) {
    ScoreComponents s;
    s.prompt_complexity = prompt_complexity(window, rules);
    s.context_switching = context_switching(window, rules);
    s.retry_frustration = retry_frustration(window, rules);
    s.configuration_friction = configuration_friction(window, rules);
    s.integration_cognition = integration_cognition(window, rules);

    const ScoreWeights& w = rules.weights;
    double weighted =
        s.prompt_complexity * w.prompt_complexity +
        s.context_switching * w.context_switching +
        s.retry_frustration * w.retry_frustration +
        s.configuration_friction * w.configuration_friction +
        s.integration_cognition * w.integration_cognition;

    s.overall = std::min(rules.overall_max, std::max(rules.overall_min, round_score(weighted)));
    return s;
}

} // namespace drishti
