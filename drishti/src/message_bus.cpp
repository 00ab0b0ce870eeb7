#include <drishti/message_bus.hpp>
#include <drishti/analyzer.hpp>
#include <drishti/protocol.hpp>
#include <drishti/log.hpp>
#include <algorithm>

namespace drishti {

MessageBus::MessageBus(size_t capacity, size_t observer_queue_capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
    , observer_queue_capacity_(observer_queue_capacity) {}

MessageBus::~MessageBus() {
    stop();
}

void MessageBus::start() {
    std::vector<std::shared_ptr<ObserverQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (running_) return;
        running_ = true;
        for (auto& [id, queue] : observers_) queues.push_back(queue);
    }
    for (auto& queue : queues) queue->start();
    log_debug("bus", "started (%zu observers)", queues.size());
}

void MessageBus::stop() {
    std::vector<std::shared_ptr<ObserverQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) return;
        running_ = false;
        for (auto& [id, queue] : observers_) queues.push_back(queue);
    }
    // Joins outside the lock: a worker may be calling recent()/status()
    for (auto& queue : queues) queue->stop();
    log_debug("bus", "stopped after %llu messages",
              static_cast<unsigned long long>(status().message_count));
}

bool MessageBus::running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

void MessageBus::connect_analyzer(CognitiveAnalyzer* analyzer) {
    std::lock_guard<std::mutex> ingest(ingest_mutex_);
    std::lock_guard<std::mutex> lock(state_mutex_);
    analyzer_ = analyzer;
}

size_t MessageBus::subscribe(const std::string& name, MessageObserver observer) {
    auto queue = std::make_shared<ObserverQueue>(name, std::move(observer), observer_queue_capacity_);
    size_t id;
    bool start_now;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        id = next_observer_id_++;
        observers_[id] = queue;
        start_now = running_;
    }
    if (start_now) queue->start();
    return id;
}

bool MessageBus::unsubscribe(size_t id) {
    std::shared_ptr<ObserverQueue> queue;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = observers_.find(id);
        if (it == observers_.end()) return false;
        queue = std::move(it->second);
        observers_.erase(it);
    }
    queue->stop();
    return true;
}

bool MessageBus::accept(InterceptedMessage message) {
    std::lock_guard<std::mutex> ingest(ingest_mutex_);

    CognitiveAnalyzer* analyzer = nullptr;
    std::vector<std::shared_ptr<ObserverQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!running_) return false;

        if (message.id.empty()) {
            message.id = "msg_" + std::to_string(next_seq_);
        }
        ++next_seq_;
        ++message_count_;
        last_message_time_ = message.timestamp;

        ring_.push_back(message);
        while (ring_.size() > capacity_) ring_.pop_front();

        analyzer = analyzer_;
        queues.reserve(observers_.size());
        for (auto& [id, queue] : observers_) queues.push_back(queue);
    }

    if (analyzer) analyzer->analyze(message);
    for (auto& queue : queues) queue->post(message);
    return true;
}

bool MessageBus::publish(const json& payload, const std::string& host, const std::string& server,
                         std::optional<int64_t> latency_ms, std::optional<Timestamp> timestamp) {
    InterceptedMessage message;
    message.timestamp = timestamp ? *timestamp : now();
    message.host = host;
    message.server = server;
    message.direction = protocol::infer_direction(payload);
    message.payload = payload;
    message.latency_ms = latency_ms;
    return accept(std::move(message));
}

std::vector<InterceptedMessage> MessageBus::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    size_t n = std::min(limit, ring_.size());
    return std::vector<InterceptedMessage>(ring_.end() - static_cast<std::ptrdiff_t>(n), ring_.end());
}

BusStatus MessageBus::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    BusStatus s;
    s.running = running_;
    s.message_count = message_count_;
    s.retained = ring_.size();
    s.last_message_time = last_message_time_;
    s.observers = observers_.size();
    for (const auto& [id, queue] : observers_) s.dropped += queue->dropped();
    return s;
}

bool MessageBus::flush(int timeout_ms) {
    std::vector<std::shared_ptr<ObserverQueue>> queues;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& [id, queue] : observers_) queues.push_back(queue);
    }
    bool drained = true;
    for (auto& queue : queues) {
        if (!queue->wait_idle(timeout_ms)) drained = false;
    }
    return drained;
}

} // namespace drishti
