#pragma once
// Message Bus: the single ingestion point
//
// Every captured frame passes through accept(). The bus keeps the last
// N messages, counts everything, and hands each message on in arrival
// order: synchronously to the analyzer, through a bounded async queue to
// every observer. A stalled observer loses its oldest backlog; ingestion
// never waits for it.

#include "types.hpp"
#include "dispatcher.hpp"
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace drishti {

class CognitiveAnalyzer;

using MessageObserver = std::function<void(const InterceptedMessage&)>;

struct BusStatus {
    bool running = false;
    uint64_t message_count = 0;     // Accepted since construction
    size_t retained = 0;            // Currently in the ring
    std::optional<Timestamp> last_message_time;
    size_t observers = 0;
    size_t dropped = 0;             // Observer backlog evictions
};

class MessageBus {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit MessageBus(size_t capacity = DEFAULT_CAPACITY,
                        size_t observer_queue_capacity = AsyncDispatcher<InterceptedMessage>::DEFAULT_CAPACITY);
    ~MessageBus();

    // Non-copyable, non-movable (observer workers hold this)
    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    // Lifecycle
    void start();
    void stop();
    bool running() const;

    // Analyzer receives every message synchronously, before observers
    void connect_analyzer(CognitiveAnalyzer* analyzer);

    // Observers receive copies on their own worker thread
    size_t subscribe(const std::string& name, MessageObserver observer);
    bool unsubscribe(size_t id);

    // Ingest a complete message. Returns false while stopped.
    bool accept(InterceptedMessage message);

    // Wrap a frame into a message (id, timestamp, inferred direction) and accept it
    bool publish(const json& payload, const std::string& host, const std::string& server,
                 std::optional<int64_t> latency_ms = std::nullopt,
                 std::optional<Timestamp> timestamp = std::nullopt);

    // Copies; never live references
    std::vector<InterceptedMessage> recent(size_t limit) const;
    BusStatus status() const;

    // Wait until every observer queue is drained (tests, shutdown)
    bool flush(int timeout_ms);

private:
    using ObserverQueue = AsyncDispatcher<InterceptedMessage>;

    size_t capacity_;
    size_t observer_queue_capacity_;

    // Serializes accept(): global order = order of arrival here
    std::mutex ingest_mutex_;

    // Guards ring, counters, observer table; held briefly
    mutable std::mutex state_mutex_;
    bool running_ = false;
    std::deque<InterceptedMessage> ring_;
    uint64_t message_count_ = 0;
    uint64_t next_seq_ = 1;
    std::optional<Timestamp> last_message_time_;
    CognitiveAnalyzer* analyzer_ = nullptr;
    size_t next_observer_id_ = 1;
    std::map<size_t, std::shared_ptr<ObserverQueue>> observers_;
};

} // namespace drishti
