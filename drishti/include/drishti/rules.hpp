#pragma once
// Rules: every table and threshold the scorer uses
//
// Defaults are the stock rule set. A JSON file may override any
// subset of keys; keys it does not mention keep their defaults.
//
// {
//   "weights": {"prompt_complexity": 0.25, ...},
//   "interaction_method_complexity": {"tools/call": 40, ...},
//   "config_error_keywords": ["not found", ...],
//   ...
// }

#include "types.hpp"
#include "log.hpp"
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace drishti {

struct ScoreWeights {
    double prompt_complexity = 0.25;
    double context_switching = 0.20;
    double retry_frustration = 0.25;
    double configuration_friction = 0.15;
    double integration_cognition = 0.15;
};

struct RuleConfig {
    // ── Capacities ───────────────────────────────────────────────────────
    size_t window_size = 20;            // Traces per rolling computation
    size_t message_capacity = 1000;     // Bus ring and analyzer trace buffer
    size_t interaction_capacity = 1000;
    size_t pattern_window = 5;          // Trailing traces for retry detection
    size_t pattern_min_repeats = 3;

    ScoreWeights weights;
    int overall_min = 10;
    int overall_max = 100;

    // ── Per-interaction load ─────────────────────────────────────────────
    int interaction_base = 30;
    std::map<std::string, int> interaction_method_complexity = {
        {"tools/list", 10},
        {"tools/call", 40},
        {"resources/list", 15},
        {"resources/read", 25},
        {"prompts/list", 10},
        {"prompts/get", 20},
        {"notifications/cancelled", 5},
        {"notifications/progress", 5},
        {"notifications/message", 15}
    };
    int interaction_method_default = 25;
    int param_points_per_key = 3;
    int param_nested_bonus = 10;
    int param_cap = 25;
    int error_server_bonus = 40;        // code >= 500
    int error_client_bonus = 25;        // code >= 400
    int error_other_bonus = 15;
    int error_auth_bonus = 20;
    std::vector<std::string> auth_keywords = {"auth", "permission", "unauthorized"};
    size_t result_medium_size = 1000;
    size_t result_large_size = 5000;
    int result_medium_bonus = 8;
    int result_large_bonus = 15;
    size_t result_array_threshold = 3;  // More than this many '[' adds the bonus
    int result_array_bonus = 10;
    int64_t latency_moderate_ms = 500;
    int64_t latency_slow_ms = 1000;
    int64_t latency_very_slow_ms = 2000;
    int latency_moderate_bonus = 5;
    int latency_slow_bonus = 10;
    int latency_very_slow_bonus = 20;

    // ── Prompt complexity ────────────────────────────────────────────────
    std::map<std::string, int> prompt_method_complexity = {
        {"tools/call", 85},
        {"resources/read", 70},
        {"prompts/get", 60},
        {"tools/list", 30},
        {"resources/list", 25},
        {"prompts/list", 20}
    };
    int prompt_method_default = 50;
    double prompt_empty_default = 50.0;
    size_t diversity_high_methods = 4;  // More than this → high penalty
    size_t diversity_low_methods = 2;   // More than this → low penalty
    int diversity_high_penalty = 15;
    int diversity_low_penalty = 8;

    // ── Context switching ────────────────────────────────────────────────
    double switching_short_window_default = 20.0;
    int host_switch_weight = 3;
    int server_switch_weight = 2;
    int method_switch_weight = 1;
    double switching_base = 40.0;
    double switching_rate_factor = 30.0;
    double method_switch_rate_factor = 20.0;
    int host_switch_penalty = 25;       // Host switches > window / 3

    // ── Retry frustration ────────────────────────────────────────────────
    double error_rate_factor = 60.0;
    double consecutive_error_factor = 15.0;
    double repetition_threshold = 3.0;
    double repetition_factor = 10.0;
    int64_t rapid_retry_ms = 5000;
    double rapid_retry_factor = 12.0;
    double retry_min = 5.0;

    // ── Configuration friction ───────────────────────────────────────────
    double config_base = 25.0;
    std::vector<std::string> config_error_keywords = {
        "not found", "invalid", "unsupported", "configuration", "setup",
        "permission", "unauthorized", "forbidden", "missing", "required"
    };
    int config_keyword_bonus = 20;
    std::vector<int64_t> availability_error_codes = {502, 503};
    int availability_bonus = 25;
    int64_t timeout_latency_ms = 10000;
    int timeout_bonus = 15;

    // ── Integration cognition ────────────────────────────────────────────
    double integration_base = 30.0;
    int per_host_points = 10;
    int per_server_points = 8;
    int per_method_points = 3;
    std::vector<std::string> advanced_methods = {
        "resources/subscribe", "prompts/call", "tools/cancel"
    };
    int advanced_method_points = 8;
    size_t simple_usage_max_methods = 3;
    int simple_usage_bonus = 15;        // Subtracted
    double integration_min = 20.0;

    // ── Reports ──────────────────────────────────────────────────────────
    double friction_error_rate = 0.3;
    size_t top_methods = 5;
    double strength_error_rate = 0.1;
    double weakness_error_rate = 0.2;
    double fast_latency_ms = 500.0;
    double slow_latency_ms = 1000.0;
};

namespace detail {

template <typename T>
void override_value(const json& obj, const char* key, T& target) {
    auto it = obj.find(key);
    if (it != obj.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

} // namespace detail

// Apply overrides from a parsed JSON object. Throws json::type_error on a
// value of the wrong type; load_rules() turns that into an error string.
inline void apply_rules(const json& j, RuleConfig& rules) {
    using detail::override_value;

    override_value(j, "window_size", rules.window_size);
    override_value(j, "message_capacity", rules.message_capacity);
    override_value(j, "interaction_capacity", rules.interaction_capacity);
    override_value(j, "pattern_window", rules.pattern_window);
    override_value(j, "pattern_min_repeats", rules.pattern_min_repeats);

    if (auto w = j.find("weights"); w != j.end() && w->is_object()) {
        override_value(*w, "prompt_complexity", rules.weights.prompt_complexity);
        override_value(*w, "context_switching", rules.weights.context_switching);
        override_value(*w, "retry_frustration", rules.weights.retry_frustration);
        override_value(*w, "configuration_friction", rules.weights.configuration_friction);
        override_value(*w, "integration_cognition", rules.weights.integration_cognition);
    }
    override_value(j, "overall_min", rules.overall_min);
    override_value(j, "overall_max", rules.overall_max);

    override_value(j, "interaction_base", rules.interaction_base);
    // Method tables merge: listed methods replace, others keep their defaults
    if (auto t = j.find("interaction_method_complexity"); t != j.end() && t->is_object()) {
        for (auto& [method, value] : t->items()) {
            rules.interaction_method_complexity[method] = value.get<int>();
        }
    }
    override_value(j, "interaction_method_default", rules.interaction_method_default);
    override_value(j, "param_points_per_key", rules.param_points_per_key);
    override_value(j, "param_nested_bonus", rules.param_nested_bonus);
    override_value(j, "param_cap", rules.param_cap);
    override_value(j, "error_server_bonus", rules.error_server_bonus);
    override_value(j, "error_client_bonus", rules.error_client_bonus);
    override_value(j, "error_other_bonus", rules.error_other_bonus);
    override_value(j, "error_auth_bonus", rules.error_auth_bonus);
    override_value(j, "auth_keywords", rules.auth_keywords);
    override_value(j, "result_medium_size", rules.result_medium_size);
    override_value(j, "result_large_size", rules.result_large_size);
    override_value(j, "result_medium_bonus", rules.result_medium_bonus);
    override_value(j, "result_large_bonus", rules.result_large_bonus);
    override_value(j, "result_array_threshold", rules.result_array_threshold);
    override_value(j, "result_array_bonus", rules.result_array_bonus);
    override_value(j, "latency_moderate_ms", rules.latency_moderate_ms);
    override_value(j, "latency_slow_ms", rules.latency_slow_ms);
    override_value(j, "latency_very_slow_ms", rules.latency_very_slow_ms);
    override_value(j, "latency_moderate_bonus", rules.latency_moderate_bonus);
    override_value(j, "latency_slow_bonus", rules.latency_slow_bonus);
    override_value(j, "latency_very_slow_bonus", rules.latency_very_slow_bonus);

    if (auto t = j.find("prompt_method_complexity"); t != j.end() && t->is_object()) {
        for (auto& [method, value] : t->items()) {
            rules.prompt_method_complexity[method] = value.get<int>();
        }
    }
    override_value(j, "prompt_method_default", rules.prompt_method_default);
    override_value(j, "prompt_empty_default", rules.prompt_empty_default);
    override_value(j, "diversity_high_methods", rules.diversity_high_methods);
    override_value(j, "diversity_low_methods", rules.diversity_low_methods);
    override_value(j, "diversity_high_penalty", rules.diversity_high_penalty);
    override_value(j, "diversity_low_penalty", rules.diversity_low_penalty);

    override_value(j, "switching_short_window_default", rules.switching_short_window_default);
    override_value(j, "host_switch_weight", rules.host_switch_weight);
    override_value(j, "server_switch_weight", rules.server_switch_weight);
    override_value(j, "method_switch_weight", rules.method_switch_weight);
    override_value(j, "switching_base", rules.switching_base);
    override_value(j, "switching_rate_factor", rules.switching_rate_factor);
    override_value(j, "method_switch_rate_factor", rules.method_switch_rate_factor);
    override_value(j, "host_switch_penalty", rules.host_switch_penalty);

    override_value(j, "error_rate_factor", rules.error_rate_factor);
    override_value(j, "consecutive_error_factor", rules.consecutive_error_factor);
    override_value(j, "repetition_threshold", rules.repetition_threshold);
    override_value(j, "repetition_factor", rules.repetition_factor);
    override_value(j, "rapid_retry_ms", rules.rapid_retry_ms);
    override_value(j, "rapid_retry_factor", rules.rapid_retry_factor);
    override_value(j, "retry_min", rules.retry_min);

    override_value(j, "config_base", rules.config_base);
    override_value(j, "config_error_keywords", rules.config_error_keywords);
    override_value(j, "config_keyword_bonus", rules.config_keyword_bonus);
    override_value(j, "availability_error_codes", rules.availability_error_codes);
    override_value(j, "availability_bonus", rules.availability_bonus);
    override_value(j, "timeout_latency_ms", rules.timeout_latency_ms);
    override_value(j, "timeout_bonus", rules.timeout_bonus);

    override_value(j, "integration_base", rules.integration_base);
    override_value(j, "per_host_points", rules.per_host_points);
    override_value(j, "per_server_points", rules.per_server_points);
    override_value(j, "per_method_points", rules.per_method_points);
    override_value(j, "advanced_methods", rules.advanced_methods);
    override_value(j, "advanced_method_points", rules.advanced_method_points);
    override_value(j, "simple_usage_max_methods", rules.simple_usage_max_methods);
    override_value(j, "simple_usage_bonus", rules.simple_usage_bonus);
    override_value(j, "integration_min", rules.integration_min);

    override_value(j, "friction_error_rate", rules.friction_error_rate);
    override_value(j, "top_methods", rules.top_methods);
    override_value(j, "strength_error_rate", rules.strength_error_rate);
    override_value(j, "weakness_error_rate", rules.weakness_error_rate);
    override_value(j, "fast_latency_ms", rules.fast_latency_ms);
    override_value(j, "slow_latency_ms", rules.slow_latency_ms);
}

// Sizes of zero would make every window empty; reject them
inline bool validate_rules(const RuleConfig& rules, std::string& error) {
    if (rules.window_size == 0) { error = "window_size must be > 0"; return false; }
    if (rules.message_capacity == 0) { error = "message_capacity must be > 0"; return false; }
    if (rules.interaction_capacity == 0) { error = "interaction_capacity must be > 0"; return false; }
    if (rules.pattern_window == 0) { error = "pattern_window must be > 0"; return false; }
    if (rules.overall_min > rules.overall_max) {
        error = "overall_min must not exceed overall_max";
        return false;
    }
    return true;
}

// Load overrides from a JSON file on top of `rules`. On failure `rules` is
// left untouched and `error` explains why.
inline bool load_rules(const std::string& path, RuleConfig& rules, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open rules file: " + path;
        return false;
    }

    std::stringstream ss;
    ss << in.rdbuf();

    RuleConfig candidate = rules;
    try {
        json j = json::parse(ss.str());
        if (!j.is_object()) {
            error = "rules file must contain a JSON object: " + path;
            return false;
        }
        apply_rules(j, candidate);
    } catch (const json::parse_error& e) {
        error = std::string("rules parse error: ") + e.what();
        return false;
    } catch (const json::type_error& e) {
        error = std::string("rules type error: ") + e.what();
        return false;
    }

    if (!validate_rules(candidate, error)) return false;

    rules = std::move(candidate);
    log_info("rules", "Loaded rule overrides from %s", path.c_str());
    return true;
}

} // namespace drishti
