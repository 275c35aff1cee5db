#pragma once

#include "notifier.hpp"
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <memory>
#include <string>

class RedisBus;

// Delivers alerts on its own worker thread so evaluation never waits on ntfy.
class AlertDispatcher : public AlertSink {
public:
    AlertDispatcher(std::shared_ptr<Notifier> notifier,
                    std::shared_ptr<RedisBus> bus,
                    const std::string& event_stream,
                    size_t max_queue = 256);
    ~AlertDispatcher() override;

    AlertDispatcher(const AlertDispatcher&) = delete;
    AlertDispatcher& operator=(const AlertDispatcher&) = delete;

    void start();
    void stop();
    bool is_running() const { return running_; }

    void enqueue(Notification notification) override;

    // Synchronous delivery, used by the worker.
    DeliveryResult deliver(const Notification& notification);

    size_t pending() const;
    int delivered_count() const { return delivered_; }
    int failed_count() const { return failed_; }
    int skipped_count() const { return skipped_; }
    int dropped_count() const { return dropped_; }

private:
    std::shared_ptr<Notifier> notifier_;
    std::shared_ptr<RedisBus> bus_;
    std::string event_stream_;
    size_t max_queue_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Notification> queue_;

    std::atomic<bool> running_{false};
    std::thread worker_;

    std::atomic<int> delivered_{0};
    std::atomic<int> failed_{0};
    std::atomic<int> skipped_{0};
    std::atomic<int> dropped_{0};

    void worker_loop();
};
