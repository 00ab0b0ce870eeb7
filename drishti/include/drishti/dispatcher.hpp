#pragma once
// Async Dispatcher: one bounded queue and one worker per consumer
//
// The producer never waits. When a consumer falls behind and its queue
// is full, the oldest pending item is dropped and counted.

#include "log.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace drishti {

template <typename T>
class AsyncDispatcher {
public:
    using Handler = std::function<void(const T&)>;

    static constexpr size_t DEFAULT_CAPACITY = 1024;

    AsyncDispatcher(std::string name, Handler handler, size_t capacity = DEFAULT_CAPACITY)
        : name_(std::move(name))
        , handler_(std::move(handler))
        , capacity_(capacity == 0 ? 1 : capacity) {}

    ~AsyncDispatcher() {
        stop();
    }

    // Non-copyable, non-movable (owns a thread bound to this)
    AsyncDispatcher(const AsyncDispatcher&) = delete;
    AsyncDispatcher& operator=(const AsyncDispatcher&) = delete;

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
        worker_ = std::thread([this]() { run_loop(); });
    }

    // Drains what is queued, then joins
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            running_ = false;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    // Never blocks on the consumer
    void post(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                ++dropped_;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    // Block until the queue is empty and the worker is idle
    bool wait_idle(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this]() { return queue_.empty() && !busy_; });
    }

    bool running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t dropped() const { return dropped_.load(); }
    size_t delivered() const { return delivered_.load(); }
    const std::string& name() const { return name_; }

private:
    void run_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
            if (queue_.empty()) break;  // Stopped and drained

            T item = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
            lock.unlock();

            try {
                handler_(item);
                ++delivered_;
            } catch (const std::exception& e) {
                log_error("dispatch", "%s: consumer failed: %s", name_.c_str(), e.what());
            } catch (...) {
                log_error("dispatch", "%s: consumer failed: unknown exception", name_.c_str());
            }

            lock.lock();
            busy_ = false;
            if (queue_.empty()) idle_cv_.notify_all();
        }
        busy_ = false;
        idle_cv_.notify_all();
    }

    std::string name_;
    Handler handler_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<T> queue_;
    bool running_ = false;
    bool busy_ = false;
    std::thread worker_;

    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> delivered_{0};
};

} // namespace drishti
