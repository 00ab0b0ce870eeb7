#include <drishti/agent.hpp>
#include <drishti/version.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <chrono>
#include <atomic>
#include <mutex>
#include <vector>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

using namespace drishti;

static const Timestamp T0 = 1760000000000;  // Fixed epoch for deterministic traces

InterceptedMessage make_message(const json& payload, const std::string& host,
                                const std::string& server, Timestamp ts,
                                std::optional<int64_t> latency = std::nullopt) {
    InterceptedMessage m;
    m.timestamp = ts;
    m.host = host;
    m.server = server;
    m.direction = protocol::infer_direction(payload);
    m.payload = payload;
    m.latency_ms = latency;
    return m;
}

json request(int id, const std::string& method, const json& params = nullptr) {
    json j = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) j["params"] = params;
    return j;
}

json error_frame(int id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::string make_temp_dir() {
    char tmpl[] = "/tmp/drishti_test_XXXXXX";
    char* dir = mkdtemp(tmpl);
    assert(dir != nullptr);
    return dir;
}

bool file_exists(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0;
}

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// ═══════════════════════════════════════════════════════════════════════════
// Framing
// ═══════════════════════════════════════════════════════════════════════════

void test_protocol() {
    std::cout << "Testing protocol frames..." << std::endl;

    assert(protocol::parse_frame(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})"));
    assert(protocol::parse_frame(R"({"jsonrpc":"2.0","id":1,"result":{}})"));
    assert(!protocol::parse_frame(R"({"jsonrpc":"1.0","id":1,"method":"tools/list"})"));
    assert(!protocol::parse_frame(R"({"jsonrpc":"2.0","id":1})"));
    assert(!protocol::parse_frame(R"([{"jsonrpc":"2.0","method":"x"}])"));
    assert(!protocol::parse_frame("Server listening on port 3000"));
    assert(!protocol::parse_frame(R"({"jsonrpc":"2.0","method":)"));

    json req = request(1, "tools/call");
    json resp = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"ok", true}}}};
    assert(protocol::message_type(req) == MessageType::Request);
    assert(protocol::infer_direction(req) == Direction::Outbound);
    assert(protocol::message_type(resp) == MessageType::Response);
    assert(protocol::infer_direction(resp) == Direction::Inbound);

    assert(protocol::id_key(req) == "n:1");
    assert(protocol::id_key(json{{"id", "1"}}) == "s:1");
    assert(protocol::id_key(json{{"id", nullptr}}).empty());

    json err = error_frame(3, 503, "Service unavailable");
    assert(protocol::error_code(err["error"]) == 503);
    assert(protocol::error_message(err["error"]) == "Service unavailable");
    assert(protocol::error_code(json("oops")) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_reassembler_chunk_boundaries() {
    std::cout << "Testing reassembly across chunk boundaries..." << std::endl;

    std::string stream =
        std::string(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})") + "\n" +
        "noise line from the server\n" +
        "  " + R"({"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"a"}]}})" + "  \r\n" +
        "\n" +
        R"({"jsonrpc":"2.0","id":2,"error":{"code":-32601,"message":"nope"}})" + "\n";

    StreamKey key{"cursor", "weather", StreamKind::Stderr};

    FrameReassembler whole;
    std::vector<json> expected;
    std::vector<std::string> expected_noise;
    assert(whole.feed(key, stream, expected, &expected_noise) == 3);
    assert(expected.size() == 3);
    assert(expected_noise.size() == 1);
    assert(expected_noise[0] == "noise line from the server");

    // Byte at a time
    FrameReassembler bytes;
    std::vector<json> frames;
    std::vector<std::string> noise;
    for (char c : stream) bytes.feed(key, std::string(1, c), frames, &noise);
    assert(frames == expected);
    assert(noise == expected_noise);

    // Every two-way split
    for (size_t split = 0; split <= stream.size(); ++split) {
        FrameReassembler r;
        std::vector<json> out;
        r.feed(key, stream.substr(0, split), out);
        r.feed(key, stream.substr(split), out);
        assert(out == expected);
        assert(r.buffered_bytes(key) == 0);
    }

    // Partial line waits; other streams are independent
    FrameReassembler partial;
    std::vector<json> out;
    StreamKey other{"cursor", "weather", StreamKind::Stdout};
    partial.feed(key, R"({"jsonrpc":"2.0",)", out);
    partial.feed(other, R"({"jsonrpc":"2.0","id":9,"result":1})" "\n", out);
    assert(out.size() == 1);
    assert(partial.buffered_bytes(key) > 0);
    partial.feed(key, R"("id":3,"method":"ping"})" "\n", out);
    assert(out.size() == 2);
    assert(out[1]["method"] == "ping");

    partial.feed(key, "dangling", out);
    partial.reset(key);
    assert(partial.buffered_bytes(key) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_reassembler_overflow() {
    std::cout << "Testing reassembly overflow reset..." << std::endl;

    FrameReassembler r(64);
    StreamKey key{"h", "s", StreamKind::Stdout};
    std::vector<json> frames;

    r.feed(key, std::string(100, 'x'), frames);
    assert(r.overflow_count() == 1);
    assert(r.buffered_bytes(key) == 0);

    // Rest of the oversized line is discarded; the next line is framed
    r.feed(key, std::string(30, 'y') + "\n" + R"({"jsonrpc":"2.0","id":1,"result":{}})" + "\n", frames);
    assert(frames.size() == 1);
    assert(frames[0]["id"] == 1);
    assert(r.overflow_count() == 1);
    assert(r.max_buffer_bytes() == 64);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools and fallback scanning
// ═══════════════════════════════════════════════════════════════════════════

void test_tool_registry() {
    std::cout << "Testing tool registry..." << std::endl;

    ToolRegistry registry;
    assert(registry.lookup("cursor", "weather").empty());

    json result = json::parse(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[
        {"name":"getCurrentWeather"},{"name":"getForecast"},{"description":"unnamed"}]}})");
    assert(ToolRegistry::is_catalog_result(result));
    assert(!ToolRegistry::is_catalog_result(request(1, "tools/list")));

    registry.update("cursor", "weather", result["result"]["tools"]);
    auto tools = registry.lookup("cursor", "weather");
    assert(tools.size() == 2);
    assert(tools[0] == "getCurrentWeather");
    assert(tools[1] == "getForecast");

    // Replaced wholesale
    registry.update("cursor", "weather", json::parse(R"([{"name":"getAlerts"}])"));
    tools = registry.lookup("cursor", "weather");
    assert(tools.size() == 1);
    assert(tools[0] == "getAlerts");

    registry.set("claude", "files", {"read_file"});
    assert(registry.size() == 2);
    assert(registry.lookup("claude", "weather").empty());

    std::cout << "  PASS" << std::endl;
}

void test_activity_scanner() {
    std::cout << "Testing activity scanner..." << std::endl;

    ToolRegistry registry;
    registry.set("cursor", "weather", {"getCurrentWeather", "getForecast"});
    ActivityScanner scanner(&registry);

    // Embedded frames, string-aware brace matching
    auto frames = scanner.scan(
        R"(debug: {"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"x}{"}} and {"method":"ping"} done)",
        "cursor", "weather", T0);
    assert(frames.size() == 2);
    assert(frames[0]["method"] == "tools/call");
    assert(frames[0]["params"]["name"] == "x}{");
    assert(frames[1]["jsonrpc"] == "2.0");
    assert(frames[1]["method"] == "ping");

    // Known tool mention: exactly one synthesized call
    frames = scanner.scan("calling getForecast then getCurrentWeather", "cursor", "weather", T0);
    assert(frames.size() == 1);
    assert(frames[0]["method"] == "tools/call");
    assert(frames[0]["params"]["name"] == "getCurrentWeather");
    assert(frames[0]["params"]["arguments"].empty());
    assert(frames[0]["id"] == T0);

    // Method literal, first in well-known order
    frames = scanner.scan("handled prompts/list after tools/list", "claude", "files", T0 + 1);
    assert(frames.size() == 1);
    assert(frames[0]["method"] == "tools/list");

    assert(scanner.scan("nothing to see", "cursor", "weather", T0).empty());
    assert(scanner.scan("", "cursor", "weather", T0).empty());
    assert(scanner.scan(R"("method" but {broken)", "claude", "files", T0).empty());

    auto objects = ActivityScanner::extract_objects(R"(a {"k":"\"}"} b {"n":{"m":1}})");
    assert(objects.size() == 2);
    assert(objects[1] == R"({"n":{"m":1}})");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatch and bus
// ═══════════════════════════════════════════════════════════════════════════

void test_dispatcher_drop_oldest() {
    std::cout << "Testing async dispatcher drop-oldest..." << std::endl;

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::mutex mu;
    std::vector<int> seen;

    AsyncDispatcher<int> d("test", [&](const int& v) {
        if (v == 1) {
            entered = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        if (v == 5) throw std::runtime_error("consumer failure");
        if (v == 7) throw 7;
        std::lock_guard<std::mutex> lock(mu);
        seen.push_back(v);
    }, 2);

    d.start();
    d.post(1);
    assert(wait_until([&]() { return entered.load(); }, 2000));

    d.post(2);
    d.post(3);
    d.post(4);      // Queue holds 2; evicts 2
    assert(d.dropped() == 1);
    assert(d.pending() == 2);

    release = true;
    assert(d.wait_idle(2000));

    d.post(5);      // Throws; worker survives
    d.post(6);
    assert(d.wait_idle(2000));
    d.post(7);      // Throws a non-exception type; worker survives
    d.post(8);
    assert(d.wait_idle(2000));
    d.stop();

    std::lock_guard<std::mutex> lock(mu);
    assert((seen == std::vector<int>{1, 3, 4, 6, 8}));
    assert(d.delivered() == 5);
    assert(!d.running());

    std::cout << "  PASS" << std::endl;
}

void test_bus_ring_bound() {
    std::cout << "Testing message bus ring bound..." << std::endl;

    MessageBus bus;
    assert(!bus.publish(request(0, "tools/list"), "cursor", "weather"));    // Stopped
    assert(bus.status().message_count == 0);

    bus.start();
    for (int i = 1; i <= 1500; ++i) {
        assert(bus.publish(request(i, "tools/list"), "cursor", "weather", std::nullopt, T0 + i));
    }

    BusStatus s = bus.status();
    assert(s.running);
    assert(s.message_count == 1500);
    assert(s.retained == 1000);
    assert(s.last_message_time && *s.last_message_time == T0 + 1500);

    auto all = bus.recent(5000);
    assert(all.size() == 1000);
    assert(all.front().id == "msg_501");
    assert(all.front().payload["id"] == 501);
    assert(all.back().id == "msg_1500");
    assert(all.back().direction == Direction::Outbound);

    auto last = bus.recent(3);
    assert(last.size() == 3);
    assert(last[2].id == "msg_1500");

    bus.stop();
    assert(!bus.publish(request(2000, "tools/list"), "cursor", "weather"));
    assert(bus.status().message_count == 1500);

    std::cout << "  PASS" << std::endl;
}

void test_bus_observers() {
    std::cout << "Testing message bus observers..." << std::endl;

    MessageBus bus;
    std::mutex mu;
    std::vector<std::string> ids;

    size_t id = bus.subscribe("recorder", [&](const InterceptedMessage& m) {
        std::lock_guard<std::mutex> lock(mu);
        ids.push_back(m.id);
    });
    bus.start();

    for (int i = 0; i < 10; ++i) {
        bus.publish(request(i, "tools/call"), "cursor", "weather", std::nullopt, T0 + i);
    }
    assert(bus.flush(2000));
    {
        std::lock_guard<std::mutex> lock(mu);
        assert(ids.size() == 10);
        for (int i = 0; i < 10; ++i) assert(ids[i] == "msg_" + std::to_string(i + 1));
    }
    assert(bus.status().observers == 1);

    assert(bus.unsubscribe(id));
    assert(!bus.unsubscribe(id));
    bus.publish(request(11, "tools/call"), "cursor", "weather");
    {
        std::lock_guard<std::mutex> lock(mu);
        assert(ids.size() == 10);
    }
    bus.stop();

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scoring
// ═══════════════════════════════════════════════════════════════════════════

void test_interaction_load() {
    std::cout << "Testing interaction load..." << std::endl;

    RuleConfig rules;

    Trace call;
    call.method = "tools/call";
    call.params = {{"name", "getCurrentWeather"}, {"arguments", {{"city", "Paris"}}}};
    assert(interaction_load(call, rules) == 30 + 40 + 16);

    Trace failure;
    failure.error = {{"code", 503}, {"message", "Service unavailable: Unauthorized"}};
    assert(interaction_load(failure, rules) == 30 + 40 + 20);

    Trace big;
    big.result = std::string(6000, 'r');
    big.latency_ms = 2500;
    assert(interaction_load(big, rules) == 30 + 15 + 20);

    Trace small;
    small.result = {{"content", json::array({{{"type", "text"}, {"text", "sunny"}}})}};
    small.latency_ms = 250;
    assert(interaction_load(small, rules) == 30);

    Trace unknown;
    unknown.method = "custom/op";
    unknown.error = {{"code", 404}, {"message", "permission denied"}};
    unknown.latency_ms = 5000;
    // 30 + 25 + 25 + 20 + 20 = 120, clamped
    assert(interaction_load(unknown, rules) == 100);

    std::cout << "  PASS" << std::endl;
}

void test_initial_and_single_score() {
    std::cout << "Testing initial and single-message scores..." << std::endl;

    CognitiveAnalyzer analyzer;
    ScoreComponents initial = analyzer.score();
    assert(initial.overall == 95);
    assert(initial.prompt_complexity == 50.0);
    assert(initial.context_switching == 20.0);
    assert(initial.retry_frustration == 5.0);
    assert(initial.configuration_friction == 25.0);
    assert(initial.integration_cognition == 20.0);

    // Idle analyzer ignores input
    analyzer.analyze(make_message(request(1, "tools/list"), "cursor", "weather", T0));
    assert(analyzer.status().message_count == 0);

    analyzer.start();
    analyzer.analyze(make_message(request(1, "tools/list"), "cursor", "weather", T0));
    ScoreComponents s = analyzer.score();
    assert(s.prompt_complexity == 30.0);
    assert(s.context_switching == 20.0);
    assert(s.retry_frustration == 5.0);
    assert(s.configuration_friction == 25.0);
    assert(s.integration_cognition == 36.0);
    assert(s.overall == 22);
    assert(s.usability() == 78);
    assert(std::string(s.grade()) == "C");
    assert(std::string(s.description()).find("LOW FRICTION") == 0);

    // Requests alone are not interactions
    assert(analyzer.interactions().empty());

    AnalyzerStatus st = analyzer.status();
    assert(st.running);
    assert(st.message_count == 1);
    assert(st.cognitive_load == 22);
    assert(st.last_analysis && *st.last_analysis == T0);

    analyzer.stop();
    assert(!analyzer.is_running());

    std::cout << "  PASS" << std::endl;
}

std::vector<InterceptedMessage> mixed_traffic(Timestamp start, int count) {
    std::vector<InterceptedMessage> out;
    const char* methods[] = {"tools/list", "tools/call", "resources/read", "prompts/get", "tools/call"};
    const char* hosts[] = {"cursor", "claude"};
    const char* servers[] = {"weather", "files", "git"};
    for (int i = 0; i < count; ++i) {
        Timestamp ts = start + i * 1700;
        std::string host = hosts[i % 2];
        std::string server = servers[i % 3];
        json payload;
        if (i % 4 == 3) {
            payload = error_frame(i, (i % 8 == 3) ? 503 : 400, (i % 8 == 3) ? "missing token" : "bad input");
        } else if (i % 4 == 2) {
            payload = {{"jsonrpc", "2.0"}, {"id", i}, {"result", {{"items", json::array({1, 2, 3})}}}};
        } else {
            payload = request(i, methods[i % 5], {{"q", i}});
        }
        out.push_back(make_message(payload, host, server, ts, (i % 3 == 0) ? std::optional<int64_t>(i * 90) : std::nullopt));
    }
    return out;
}

bool same_scores(const ScoreComponents& a, const ScoreComponents& b) {
    return a.prompt_complexity == b.prompt_complexity &&
           a.context_switching == b.context_switching &&
           a.retry_frustration == b.retry_frustration &&
           a.configuration_friction == b.configuration_friction &&
           a.integration_cognition == b.integration_cognition &&
           a.overall == b.overall;
}

void test_determinism() {
    std::cout << "Testing replay determinism..." << std::endl;

    auto traffic = mixed_traffic(T0, 60);

    CognitiveAnalyzer a;
    CognitiveAnalyzer b;
    a.start();
    b.start();
    std::vector<int> overall_a;
    std::vector<int> overall_b;
    for (const auto& m : traffic) {
        a.analyze(m);
        overall_a.push_back(a.score().overall);
    }
    for (const auto& m : traffic) {
        b.analyze(m);
        overall_b.push_back(b.score().overall);
    }

    assert(overall_a == overall_b);
    assert(same_scores(a.score(), b.score()));
    assert(a.status().insights_generated == b.status().insights_generated);

    auto ia = a.interactions();
    auto ib = b.interactions();
    assert(ia.size() == ib.size());
    assert(!ia.empty());
    for (size_t i = 0; i < ia.size(); ++i) {
        assert(ia[i].id == ib[i].id);
        assert(ia[i].cognitive_load == ib[i].cognitive_load);
        assert(ia[i].start_time == ib[i].start_time);
    }
    assert(ia[0].id == ia[0].host + "-" + ia[0].server + "-1");

    std::cout << "  PASS" << std::endl;
}

void test_window_bound() {
    std::cout << "Testing window bound..." << std::endl;

    auto prefix = mixed_traffic(T0, 35);
    auto tail = mixed_traffic(T0 + 100000, 20);

    CognitiveAnalyzer with_history;
    CognitiveAnalyzer fresh;
    with_history.start();
    fresh.start();

    for (const auto& m : prefix) with_history.analyze(m);
    for (const auto& m : tail) {
        with_history.analyze(m);
        fresh.analyze(m);
    }

    assert(same_scores(with_history.score(), fresh.score()));
    assert(with_history.traces().size() == 55);

    std::cout << "  PASS" << std::endl;
}

void test_clamp_laws() {
    std::cout << "Testing clamp laws..." << std::endl;

    CognitiveAnalyzer analyzer;
    analyzer.start();
    for (int i = 0; i < 20; ++i) {
        json frame = {{"jsonrpc", "2.0"}, {"id", i}, {"method", "tools/call"},
                      {"error", {{"code", 500}, {"message", "internal failure"}}}};
        analyzer.analyze(make_message(frame, "cursor", "weather", T0 + i * 100));

        ScoreComponents s = analyzer.score();
        assert(s.prompt_complexity >= 0 && s.prompt_complexity <= 100);
        assert(s.context_switching >= 0 && s.context_switching <= 100);
        assert(s.retry_frustration >= 5 && s.retry_frustration <= 100);
        assert(s.configuration_friction >= 0 && s.configuration_friction <= 100);
        assert(s.integration_cognition >= 20 && s.integration_cognition <= 100);
        assert(s.overall >= 10 && s.overall <= 100);
    }
    assert(analyzer.score().retry_frustration == 100.0);
    assert(analyzer.score().overall == 63);

    // Heavy mixed traffic stays inside bounds too
    CognitiveAnalyzer mixed;
    mixed.start();
    for (const auto& m : mixed_traffic(T0, 200)) {
        mixed.analyze(m);
        ScoreComponents s = mixed.score();
        assert(s.overall >= 10 && s.overall <= 100);
        assert(s.retry_frustration >= 5 && s.retry_frustration <= 100);
        assert(s.integration_cognition >= 20 && s.integration_cognition <= 100);
    }
    for (const auto& i : mixed.interactions()) {
        assert(i.cognitive_load >= 10 && i.cognitive_load <= 100);
    }

    std::cout << "  PASS" << std::endl;
}

void test_friction_detection() {
    std::cout << "Testing friction pattern insights..." << std::endl;

    CognitiveAnalyzer analyzer;
    std::vector<Insight> received;
    size_t failing = analyzer.on_insight([](const Insight&) {
        throw std::runtime_error("listener failure");
    });
    analyzer.on_insight([](const Insight&) { throw 42; });
    analyzer.on_insight([&](const Insight& insight) { received.push_back(insight); });
    analyzer.start();

    analyzer.analyze(make_message(request(1, "tools/call"), "cursor", "weather", T0));
    analyzer.analyze(make_message(request(2, "tools/call"), "cursor", "weather", T0 + 100));
    assert(received.empty());

    analyzer.analyze(make_message(request(3, "tools/call"), "cursor", "weather", T0 + 200));
    assert(received.size() == 1);
    assert(received[0].type == "retry_pattern");
    assert(received[0].severity == "high");
    assert(received[0].message == "Multiple retries detected for tools/call");
    assert(received[0].details["retry_count"] == 3);

    // Error without a method: one error insight, no retry insight
    analyzer.analyze(make_message(error_frame(3, -32603, "boom"), "cursor", "weather", T0 + 300));
    assert(received.size() == 2);
    assert(received[1].type == "error_pattern");
    assert(received[1].severity == "medium");
    assert(received[1].message == "Error in unknown: boom");

    assert(analyzer.remove_insight_listener(failing));
    assert(!analyzer.remove_insight_listener(failing));
    assert(analyzer.status().insights_generated == 2);

    std::cout << "  PASS" << std::endl;
}

void test_weather_scenario() {
    std::cout << "Testing cursor/weather scenario..." << std::endl;

    CognitiveAnalyzer analyzer;
    size_t retries = 0;
    analyzer.on_insight([&](const Insight& insight) {
        if (insight.type == "retry_pattern") ++retries;
    });
    analyzer.start();

    for (int i = 0; i < 5; ++i) {
        json params = {{"name", "getCurrentWeather"}, {"arguments", {{"city", "Paris"}}}};
        analyzer.analyze(make_message(request(i, "tools/call", params), "cursor", "weather",
                                      T0 + i * 6000, 250));
    }

    ScoreComponents s = analyzer.score();
    assert(s.retry_frustration == 20.0);    // Repetition only; spaced beyond the rapid-retry span
    assert(s.prompt_complexity == 85.0);
    assert(s.context_switching == 40.0);
    assert(s.overall == 43);
    assert(retries == 3);

    std::cout << "  PASS" << std::endl;
}

void test_unavailable_unauthorized_scenario() {
    std::cout << "Testing 503 + unauthorized scenario..." << std::endl;

    CognitiveAnalyzer analyzer;
    analyzer.start();
    analyzer.analyze(make_message(error_frame(7, 503, "Service unavailable: unauthorized"),
                                  "cursor", "weather", T0));

    ScoreComponents s = analyzer.score();
    assert(s.configuration_friction >= 25.0 + 45.0);
    assert(s.configuration_friction == 70.0);
    assert(s.retry_frustration == 75.0);
    assert(s.overall == 38);

    auto interactions = analyzer.interactions();
    assert(interactions.size() == 1);
    assert(interactions[0].cognitive_load == 90);
    assert(interactions[0].success_rate == 0.0);
    assert(interactions[0].method == "unknown");
    assert(interactions[0].id == "cursor-weather-1");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════════════

void test_rules_loading() {
    std::cout << "Testing rule overrides..." << std::endl;

    std::string dir = make_temp_dir();
    std::string good = dir + "/rules.json";
    {
        std::ofstream out(good);
        out << R"({"window_size": 10, "weights": {"prompt_complexity": 0.5},
                   "interaction_method_complexity": {"custom/op": 33},
                   "availability_error_codes": [502, 503, 504]})";
    }

    RuleConfig rules;
    std::string error;
    assert(load_rules(good, rules, error));
    assert(rules.window_size == 10);
    assert(rules.weights.prompt_complexity == 0.5);
    assert(rules.weights.retry_frustration == 0.25);
    assert(rules.interaction_method_complexity.at("custom/op") == 33);
    assert(rules.interaction_method_complexity.at("tools/call") == 40);
    assert(rules.availability_error_codes.size() == 3);

    std::string malformed = dir + "/bad.json";
    {
        std::ofstream out(malformed);
        out << "{not json";
    }
    RuleConfig untouched;
    assert(!load_rules(malformed, untouched, error));
    assert(!error.empty());
    assert(untouched.window_size == 20);

    std::string wrong_type = dir + "/type.json";
    {
        std::ofstream out(wrong_type);
        out << R"({"window_size": 5, "param_cap": "lots"})";
    }
    assert(!load_rules(wrong_type, untouched, error));
    assert(untouched.window_size == 20);

    std::string invalid = dir + "/zero.json";
    {
        std::ofstream out(invalid);
        out << R"({"window_size": 0})";
    }
    assert(!load_rules(invalid, untouched, error));
    assert(!load_rules(dir + "/missing.json", untouched, error));

    // Overrides flow into scoring: a wider availability list
    CognitiveAnalyzer analyzer(rules);
    analyzer.start();
    analyzer.analyze(make_message(error_frame(1, 504, "gateway timeout"), "cursor", "weather", T0));
    assert(analyzer.score().configuration_friction == 50.0);

    std::cout << "  PASS" << std::endl;
}

void test_sources_loading() {
    std::cout << "Testing source descriptors..." << std::endl;

    std::string dir = make_temp_dir();
    std::string path = dir + "/sources.json";
    {
        std::ofstream out(path);
        out << R"({"hosts": [
            {"name": "cursor", "type": "ide", "configPath": "/home/u/.cursor/mcp.json",
             "servers": {"weather": {"command": "node", "args": ["w.js", "--port", "0"],
                                     "env": {"API_KEY": "k"}},
                         "broken": "not an object"}},
            {"name": "claude", "enabled": false, "servers": {}}
        ]})";
    }

    std::string error;
    auto sources = load_sources(path, error);
    assert(sources);
    assert(sources->size() == 2);
    const SourceDescriptor& cursor = (*sources)[0];
    assert(cursor.name == "cursor");
    assert(cursor.type == "ide");
    assert(cursor.active());
    assert(cursor.servers.size() == 1);
    assert(cursor.servers[0].name == "weather");
    assert(cursor.servers[0].args.size() == 3);
    assert(cursor.servers[0].env.at("API_KEY") == "k");
    assert(!(*sources)[1].active());

    auto bare = parse_sources(json::parse(R"([{"name":"vscode","exists":false}])"), error);
    assert(bare && bare->size() == 1 && !(*bare)[0].active());

    assert(!parse_sources(json::parse(R"({"servers": []})"), error));
    assert(!parse_sources(json::parse(R"([{"type":"ide"}])"), error));
    assert(!load_sources(dir + "/missing.json", error));

    std::cout << "  PASS" << std::endl;
}

void test_log_levels() {
    std::cout << "Testing log levels..." << std::endl;

    LogLevel level = LogLevel::Info;
    assert(parse_log_level("debug", level) && level == LogLevel::Debug);
    assert(!parse_log_level("loud", level) && level == LogLevel::Debug);

    set_log_level(LogLevel::Error);
    assert(!log_enabled(LogLevel::Warn));
    assert(log_enabled(LogLevel::Error));
    set_log_level(LogLevel::Warn);
    assert(log_enabled(LogLevel::Warn));
    assert(!log_enabled(LogLevel::Info));

    assert(version::report_format_compatible(DRISHTI_REPORT_FORMAT_MAJOR, 0));
    assert(!version::report_format_compatible(DRISHTI_REPORT_FORMAT_MAJOR + 1, 0));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Reports
// ═══════════════════════════════════════════════════════════════════════════

void feed_report_traffic(CognitiveAnalyzer& analyzer) {
    auto with_method_error = [](int id, const std::string& method) {
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method},
                    {"error", {{"code", -32603}, {"message", "boom"}}}};
    };

    analyzer.analyze(make_message(request(0, "prompts/list"), "cursor", "weather", T0 - 10 * MS_PER_DAY));
    analyzer.analyze(make_message(request(1, "tools/list"), "cursor", "weather", T0));
    analyzer.analyze(make_message(request(2, "tools/list"), "cursor", "files", T0 + 1000));
    analyzer.analyze(make_message(request(3, "tools/call"), "cursor", "weather", T0 + 2000));
    analyzer.analyze(make_message(with_method_error(4, "tools/call"), "cursor", "weather", T0 + 3000));
    analyzer.analyze(make_message(with_method_error(5, "tools/call"), "cursor", "weather", T0 + 4000));
    analyzer.analyze(make_message(request(6, "resources/list"), "cursor", "weather", T0 + 5000));
    analyzer.analyze(make_message(request(7, "tools/list"), "claude", "files", T0 + 5000));
}

void test_trace_report() {
    std::cout << "Testing trace report..." << std::endl;

    CognitiveAnalyzer analyzer;
    analyzer.start();
    feed_report_traffic(analyzer);

    TraceReport r = analyzer.generate_trace_report(TimeRange{T0, T0 + 5000});
    assert(r.total_messages == 7);
    assert(r.total_interactions == 2);
    assert(r.average_cognitive_load == 85.0);
    assert(std::fabs(r.success_rate - 5.0 / 7.0 * 100.0) < 1e-9);

    assert(r.most_used_methods.size() == 3);
    assert(r.most_used_methods[0].method == "tools/call" && r.most_used_methods[0].count == 3);
    assert(r.most_used_methods[1].method == "tools/list" && r.most_used_methods[1].count == 3);
    assert(r.most_used_methods[2].method == "resources/list");

    assert((r.servers_analyzed == std::vector<std::string>{"files", "weather"}));
    assert(r.average_latency == 0.0);

    assert(r.friction_points.size() == 1);
    assert(r.friction_points[0].method == "tools/call");
    assert(r.friction_points[0].issue == "High error rate (66.7%)");
    assert(r.friction_points[0].severity == "high");
    assert(r.friction_points[0].recommendation == "Review tools/call implementation and error handling");
    assert(r.usability_score == analyzer.score().usability());

    assert(r.interactions[0].id == "cursor-weather-1");
    assert(r.interactions[1].id == "cursor-weather-2");

    // Empty range
    TraceReport empty = analyzer.generate_trace_report(TimeRange{0, 1});
    assert(empty.total_messages == 0);
    assert(empty.success_rate == 100.0);
    assert(empty.average_cognitive_load == 0.0);
    assert(empty.friction_points.empty());

    // Top-N keeps the count order, ties broken by name
    std::vector<Trace> traces;
    for (const char* m : {"f", "e", "d", "c", "b", "a", "a"}) {
        Trace t;
        t.timestamp = T0;
        t.method = m;
        t.server = "s";
        traces.push_back(t);
    }
    TraceReport top = build_trace_report(traces, {}, ScoreComponents{}, TimeRange{T0, T0}, RuleConfig{}, T0);
    assert(top.most_used_methods.size() == 5);
    assert(top.most_used_methods[0].method == "a");
    assert(top.most_used_methods[1].method == "b");
    assert(top.most_used_methods[4].method == "e");

    json j = to_json(r);
    assert(j["summary"]["total_messages"] == 7);
    assert(j["cognitive_analysis"]["friction_points"].size() == 1);
    assert(j["component_interactions"].size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_usability_report() {
    std::cout << "Testing usability report..." << std::endl;

    CognitiveAnalyzer analyzer;
    analyzer.start();
    feed_report_traffic(analyzer);

    UsabilityReport r = analyzer.generate_usability_report("cursor");
    assert(r.host == "cursor");
    assert(r.time_range == "all");
    assert(r.overall == analyzer.score().overall);
    assert(r.grade == analyzer.score().grade());

    // 2 errors in 7 host traces
    assert((r.strengths == std::vector<std::string>{
        "Fast response times enhance user experience",
        "Active MCP communication indicates good integration"}));
    assert((r.weaknesses == std::vector<std::string>{"High error rate may cause user frustration"}));
    assert(r.recommendations.size() == 4);
    assert(r.recommendations[3] == "Improve error handling and user feedback mechanisms");

    assert(r.error_patterns.size() == 1);
    assert(r.error_patterns[0].pattern == "-32603");
    assert(r.error_patterns[0].frequency == 2);
    assert(r.error_patterns[0].impact == "Medium");
    assert(std::fabs(r.success_rate - 5.0 / 7.0 * 100.0) < 1e-9);
    assert(r.vs_industry_average == -12);
    assert(r.vs_last_week == 5);
    assert(r.trend_direction == "improving");

    // Range honored; other hosts excluded
    UsabilityReport ranged = analyzer.generate_usability_report("cursor", TimeRange{T0, T0 + 2000});
    assert(ranged.weaknesses.empty());
    assert(ranged.error_patterns.empty());
    assert(ranged.strengths.size() == 3);
    assert(ranged.recommendations.size() == 3);

    UsabilityReport nobody = analyzer.generate_usability_report("zed");
    assert(nobody.strengths.size() == 2);
    assert(nobody.success_rate == 100.0);
    assert(nobody.breakdown.prompt_complexity == 50.0);
    assert(nobody.breakdown.retry_frustration == 5.0);

    std::vector<Trace> many;
    for (int i = 0; i < 5; ++i) {
        Trace t;
        t.error = {{"message", "timeout"}};
        many.push_back(t);
    }
    auto patterns = identify_error_patterns(many);
    assert(patterns.size() == 1 && patterns[0].impact == "High" && patterns[0].pattern == "timeout");

    std::cout << "  PASS" << std::endl;
}

void test_report_persistence() {
    std::cout << "Testing report persistence..." << std::endl;

    std::string dir = make_temp_dir() + "/reports";
    ReportStore store(dir);

    CognitiveAnalyzer analyzer;
    analyzer.attach_store(&store);
    analyzer.start();
    feed_report_traffic(analyzer);

    TraceReport r = analyzer.generate_trace_report(TimeRange{T0, T0 + 5000});
    std::string path = store.last_path();
    assert(path == dir + "/" + ReportStore::trace_report_name(r.generated_at));
    assert(path.find("component_trace_") != std::string::npos);
    assert(file_exists(path));

    std::ifstream in(path);
    json saved = json::parse(in);
    assert(version::report_format_compatible(saved["format"]["major"].get<int>(),
                                             saved["format"]["minor"].get<int>()));
    assert(saved["summary"]["total_messages"] == 7);

    UsabilityReport u = analyzer.generate_usability_report("cursor");
    assert(store.last_path() == dir + "/" + ReportStore::usability_report_name("cursor", u.generated_at));
    assert(file_exists(store.last_path()));

    assert(ReportStore::trace_report_name(0) == "component_trace_19700101T000000.json");
    assert(ReportStore::usability_report_name("a/b", 0) == "usability_report_a_b_19700101T000000.json");

    // Unwritable directory: report still returned
    std::string blocker = make_temp_dir() + "/file";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    ReportStore broken(blocker + "/reports");
    analyzer.attach_store(&broken);
    TraceReport still = analyzer.generate_trace_report(TimeRange{T0, T0 + 5000});
    assert(still.total_messages == 7);
    assert(!broken.last_error().empty());
    assert(broken.last_path().empty());

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_report_saves() {
    std::cout << "Testing concurrent report saves..." << std::endl;

    std::string dir = make_temp_dir() + "/reports";
    ReportStore store(dir);

    CognitiveAnalyzer analyzer;
    analyzer.attach_store(&store);
    analyzer.start();
    feed_report_traffic(analyzer);

    const int rounds = 50;
    auto writer = [&analyzer, rounds] {
        for (int i = 0; i < rounds; ++i) {
            analyzer.generate_trace_report();
            analyzer.generate_usability_report("cursor");
        }
    };
    std::thread a(writer);
    std::thread b(writer);
    a.join();
    b.join();

    // Every report landed in its own whole file; no temp files left behind
    size_t reports = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        std::string name = entry.path().filename().string();
        assert(name.find(".tmp.") == std::string::npos);
        std::ifstream in(entry.path());
        json saved = json::parse(in);
        assert(saved.contains("format"));
        ++reports;
    }
    assert(reports == 4 * rounds);
    assert(store.last_error().empty());

    // Same name twice: the second gets a suffix
    assert(store.save("dup.json", json{{"n", 1}}));
    assert(store.save("dup.json", json{{"n", 2}}));
    assert(store.last_path() == dir + "/dup_2.json");
    assert(file_exists(dir + "/dup.json"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Processes
// ═══════════════════════════════════════════════════════════════════════════

ServerCommand shell_server(const std::string& name, const std::string& script) {
    ServerCommand s;
    s.name = name;
    s.command = "/bin/sh";
    s.args = {"-c", script};
    return s;
}

void test_process_interceptor() {
    std::cout << "Testing process interceptor..." << std::endl;

    MessageBus bus;
    ToolRegistry registry;
    ActivityScanner scanner(&registry);
    InterceptorConfig config;
    config.stop_grace_ms = 500;
    ProcessInterceptor interceptor(bus, registry, scanner, config);
    bus.start();

    SourceDescriptor host;
    host.name = "test";
    host.servers.push_back(shell_server("echo",
        R"(printf '{"jsonrpc":"2.0","id":1,"result":{"tools":[{"name":"getCurrentWeather"}]}}\n'; )"
        R"(echo "plain noise"; sleep 0.3; echo "calling getCurrentWeather now" >&2; sleep 5)"));

    ServerCommand env_server = shell_server("env",
        R"(printf '{"jsonrpc":"2.0","id":2,"result":{"v":"%s"}}\n' "$DRISHTI_TEST_VALUE")");
    env_server.env["DRISHTI_TEST_VALUE"] = "hello";
    host.servers.push_back(env_server);

    ServerCommand missing;
    missing.name = "missing";
    missing.command = "/nonexistent/drishti-server";
    host.servers.push_back(missing);

    ServerCommand empty;
    empty.name = "empty";
    host.servers.push_back(empty);

    SourceDescriptor disabled;
    disabled.name = "off";
    disabled.enabled = false;
    disabled.servers.push_back(shell_server("never", "sleep 5"));

    StartReport report = interceptor.start({host, disabled});
    assert(report.started.size() == 2);
    assert(report.failed.size() == 1);
    assert(report.failed[0].first == "test/missing");
    assert(report.skipped.size() == 1);
    assert(report.skipped[0] == "test/empty");
    assert(!report.ok());
    assert(interceptor.running());

    // Second start is a no-op
    StartReport again = interceptor.start({host});
    assert(again.started.empty() && again.failed.empty());

    assert(wait_until([&]() { return bus.status().message_count >= 3; }, 5000));
    assert(wait_until([&]() {
        auto active = interceptor.active_sources();
        return active.size() == 1 && active[0] == "test/echo";
    }, 5000));

    auto tools = registry.lookup("test", "echo");
    assert(tools.size() == 1 && tools[0] == "getCurrentWeather");

    bool saw_catalog = false;
    bool saw_env = false;
    bool saw_synthesized = false;
    for (const auto& m : bus.recent(10)) {
        if (m.server == "echo" && ToolRegistry::is_catalog_result(m.payload)) saw_catalog = true;
        if (m.server == "env" && m.payload["result"]["v"] == "hello") saw_env = true;
        if (m.server == "echo" && m.method() == "tools/call" &&
            m.payload["params"]["name"] == "getCurrentWeather") {
            saw_synthesized = true;
            assert(m.direction == Direction::Outbound);
        }
    }
    assert(saw_catalog);
    assert(saw_env);
    assert(saw_synthesized);
    assert(bus.status().message_count == 3);     // Noise on stdout produced nothing

    auto started = std::chrono::steady_clock::now();
    interceptor.stop();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    assert(elapsed < 3000);
    assert(!interceptor.running());
    assert(interceptor.active_sources().empty());
    interceptor.stop();     // Idempotent

    std::cout << "  PASS" << std::endl;
}

void test_interceptor_send_latency() {
    std::cout << "Testing relay send and latency..." << std::endl;

    MessageBus bus;
    ToolRegistry registry;
    ActivityScanner scanner(&registry);
    ProcessInterceptor interceptor(bus, registry, scanner);
    bus.start();

    std::mutex mu;
    std::string relayed;
    interceptor.set_output_tap([&](const std::string&, const std::string&, StreamKind kind,
                                   const std::string& chunk) {
        if (kind != StreamKind::Stdout) return;
        std::lock_guard<std::mutex> lock(mu);
        relayed += chunk;
    });

    SourceDescriptor host;
    host.name = "cursor";
    host.servers.push_back(shell_server("weather",
        R"(read line; printf '{"jsonrpc":"2.0","id":5,"result":{"temp":21}}\n'; sleep 5)"));

    StartReport report = interceptor.start({host});
    assert(report.ok() && report.started.size() == 1);

    assert(!interceptor.send("cursor", "nobody", "x\n"));
    json req = request(5, "tools/call", {{"name", "getCurrentWeather"}});
    assert(interceptor.send("cursor", "weather", req.dump() + "\n"));

    assert(wait_until([&]() { return bus.status().message_count >= 2; }, 5000));
    auto messages = bus.recent(2);
    assert(messages[0].direction == Direction::Outbound);
    assert(messages[0].method() == "tools/call");
    assert(!messages[0].latency_ms);
    assert(messages[1].direction == Direction::Inbound);
    assert(messages[1].latency_ms.has_value());
    assert(*messages[1].latency_ms >= 0);

    {
        std::lock_guard<std::mutex> lock(mu);
        assert(relayed.find("\"temp\":21") != std::string::npos);
    }

    assert(interceptor.overflow_count() == 0);
    interceptor.stop();
    assert(!interceptor.send("cursor", "weather", "late\n"));

    // Direct ingestion runs the same pipeline
    interceptor.ingest("cursor", "weather", StreamKind::Stdout,
                       R"({"jsonrpc":"2.0","id":9,"result":{}})" "\n", T0);
    assert(bus.status().message_count == 3);

    std::cout << "  PASS" << std::endl;
}

void test_child_signal_dispositions() {
    std::cout << "Testing child signal dispositions..." << std::endl;

    if (!file_exists("/proc/self/status")) {
        std::cout << "  SKIP (no /proc)" << std::endl;
        return;
    }

    MessageBus bus;
    ToolRegistry registry;
    ActivityScanner scanner(&registry);
    ProcessInterceptor interceptor(bus, registry, scanner);
    bus.start();

    std::mutex mu;
    std::string out;
    interceptor.set_output_tap([&](const std::string&, const std::string&, StreamKind kind,
                                   const std::string& chunk) {
        if (kind != StreamKind::Stdout) return;
        std::lock_guard<std::mutex> lock(mu);
        out += chunk;
    });

    SourceDescriptor host;
    host.name = "sig";
    host.servers.push_back(shell_server("status", "grep SigIgn /proc/self/status; sleep 5"));
    assert(interceptor.start({host}).ok());

    // The observer itself keeps ignoring SIGPIPE
    struct sigaction current;
    ::sigaction(SIGPIPE, nullptr, &current);
    assert(current.sa_handler == SIG_IGN);

    assert(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mu);
        return out.find('\n') != std::string::npos;
    }, 5000));
    interceptor.stop();

    std::string line;
    {
        std::lock_guard<std::mutex> lock(mu);
        line = out.substr(0, out.find('\n'));
    }
    auto colon = line.find(':');
    assert(line.rfind("SigIgn", 0) == 0 && colon != std::string::npos);
    unsigned long long mask = std::strtoull(line.c_str() + colon + 1, nullptr, 16);
    assert((mask & (1ULL << (SIGPIPE - 1))) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_send_during_stop() {
    std::cout << "Testing send racing stop..." << std::endl;

    MessageBus bus;
    ToolRegistry registry;
    ActivityScanner scanner(&registry);
    InterceptorConfig config;
    config.stop_grace_ms = 500;
    ProcessInterceptor interceptor(bus, registry, scanner, config);
    bus.start();

    SourceDescriptor host;
    host.name = "cursor";
    host.servers.push_back(shell_server("sink", "cat > /dev/null"));
    assert(interceptor.start({host}).ok());

    const std::string marker = "drishti-request-marker";
    std::string line = request(1, "tools/call", {{"name", marker}}).dump() + "\n";

    std::atomic<int> accepted{0};
    std::thread sender([&]() {
        while (interceptor.send("cursor", "sink", line)) ++accepted;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    interceptor.stop();

    // Descriptors opened right after stop must never receive request bytes
    std::string dir = make_temp_dir();
    std::vector<FILE*> files;
    for (int i = 0; i < 8; ++i) {
        FILE* f = std::fopen((dir + "/f" + std::to_string(i)).c_str(), "w+");
        assert(f != nullptr);
        files.push_back(f);
    }
    sender.join();

    for (FILE* f : files) std::fclose(f);
    for (int i = 0; i < 8; ++i) {
        std::ifstream in(dir + "/f" + std::to_string(i));
        std::stringstream ss;
        ss << in.rdbuf();
        assert(ss.str().find(marker) == std::string::npos);
    }

    assert(accepted.load() > 0);
    assert(!interceptor.send("cursor", "sink", line));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Agent
// ═══════════════════════════════════════════════════════════════════════════

class RecordingSink : public IntegrationSink {
public:
    std::string name() const override { return "recording"; }

    void send_insight(const Insight& insight) override {
        std::lock_guard<std::mutex> lock(mu);
        insights.push_back(insight);
    }

    void send_alert(const AlertData& alert) override {
        std::lock_guard<std::mutex> lock(mu);
        alerts.push_back(alert);
    }

    std::mutex mu;
    std::vector<Insight> insights;
    std::vector<AlertData> alerts;
};

void test_agent() {
    std::cout << "Testing agent wiring and proactive review..." << std::endl;

    AgentConfig config;
    config.reports_dir = make_temp_dir();
    config.proactive = false;

    Agent agent(config);
    auto sink = std::make_unique<RecordingSink>();
    RecordingSink* recorder = sink.get();
    agent.add_sink(std::move(sink));

    std::string jsonl = config.reports_dir + "/events.jsonl";
    agent.add_sink(std::make_unique<JsonlSink>(jsonl));

    StartReport report = agent.start({});
    assert(report.started.empty());
    assert(agent.is_running());

    // Healthy traffic: no alert
    agent.analyze_message(request(1, "tools/list"), "cursor", "weather");
    assert(!agent.review());

    for (int i = 0; i < 4; ++i) {
        json frame = {{"jsonrpc", "2.0"}, {"id", 10 + i}, {"method", "tools/call"},
                      {"error", {{"code", 500}, {"message", "internal failure"}}}};
        agent.analyze_message(frame, "cursor", "weather");
    }

    auto alert = agent.review();
    assert(alert);
    assert(alert->type == "usability");
    assert(alert->severity == "high");
    assert(alert->message == "1 friction points detected");
    assert(alert->recommendations.size() == 1);
    assert(alert->recommendations[0] == "Review tools/call implementation and error handling");

    assert(agent.flush(2000));
    {
        std::lock_guard<std::mutex> lock(recorder->mu);
        // One error insight per failure; retries from the 3rd tools/call on
        size_t errors = 0;
        size_t retries = 0;
        for (const auto& i : recorder->insights) {
            if (i.type == "error_pattern") ++errors;
            if (i.type == "retry_pattern") ++retries;
        }
        assert(errors == 4);
        assert(retries == 2);
        assert(recorder->alerts.size() == 1);
    }

    AgentStatus status = agent.status();
    assert(status.running);
    assert(status.bus.message_count == 5);
    assert(status.analysis.message_count == 5);
    assert(status.analysis.insights_generated == 6);
    assert(status.sinks == 2);
    assert(status.monitor_runs == 2);
    assert(status.alerts_sent == 1);
    assert(to_json(status)["analysis"]["insights_generated"] == 6);

    assert(agent.recent_messages(2).size() == 2);
    assert(agent.recent_messages(2)[1].payload["id"] == 13);

    agent.stop();
    assert(!agent.is_running());
    agent.stop();

    // JSONL sink wrote one line per event
    std::ifstream in(jsonl);
    std::string line;
    size_t lines = 0;
    size_t alerts = 0;
    while (std::getline(in, line)) {
        json event = json::parse(line);
        ++lines;
        if (event["kind"] == "alert") ++alerts;
    }
    assert(lines == 7);
    assert(alerts == 1);

    setenv("DRISHTI_ALERT_THRESHOLD", "55", 1);
    setenv("DRISHTI_REPORTS_DIR", "/tmp/drishti-env-reports", 1);
    AgentConfig from_env = AgentConfig::from_env();
    assert(from_env.alert_threshold == 55);
    assert(from_env.reports_dir == "/tmp/drishti-env-reports");
    setenv("DRISHTI_ALERT_THRESHOLD", "plenty", 1);
    assert(AgentConfig::from_env().alert_threshold == 70);
    unsetenv("DRISHTI_ALERT_THRESHOLD");
    unsetenv("DRISHTI_REPORTS_DIR");

    // Without overrides the base passes through untouched
    AgentConfig base;
    base.alert_threshold = 40;
    base.reports_dir.clear();
    AgentConfig kept = AgentConfig::from_env(base);
    assert(kept.alert_threshold == 40);
    assert(kept.reports_dir.empty());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Drishti C++ Tests ===" << std::endl;
    std::cout << "version " << DRISHTI_VERSION << std::endl;
    std::cout << std::endl;

    set_log_level(LogLevel::Warn);

    test_protocol();
    test_reassembler_chunk_boundaries();
    test_reassembler_overflow();
    test_tool_registry();
    test_activity_scanner();
    test_dispatcher_drop_oldest();
    test_bus_ring_bound();
    test_bus_observers();

    std::cout << std::endl;
    std::cout << "=== Scoring ===" << std::endl;
    test_interaction_load();
    test_initial_and_single_score();
    test_determinism();
    test_window_bound();
    test_clamp_laws();
    test_friction_detection();
    test_weather_scenario();
    test_unavailable_unauthorized_scenario();

    std::cout << std::endl;
    std::cout << "=== Configuration and reports ===" << std::endl;
    test_rules_loading();
    test_sources_loading();
    test_log_levels();
    test_trace_report();
    test_usability_report();
    test_report_persistence();
    test_concurrent_report_saves();

    std::cout << std::endl;
    std::cout << "=== Processes and agent ===" << std::endl;
    test_process_interceptor();
    test_interceptor_send_latency();
    test_child_signal_dispositions();
    test_send_during_stop();
    test_agent();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
