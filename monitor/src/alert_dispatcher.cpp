#include "alert_dispatcher.hpp"
#include "redis_bus.hpp"
#include <spdlog/spdlog.h>

AlertDispatcher::AlertDispatcher(std::shared_ptr<Notifier> notifier,
                                 std::shared_ptr<RedisBus> bus,
                                 const std::string& event_stream,
                                 size_t max_queue)
    : notifier_(std::move(notifier))
    , bus_(std::move(bus))
    , event_stream_(event_stream)
    , max_queue_(max_queue)
{}

AlertDispatcher::~AlertDispatcher() {
    stop();
}

void AlertDispatcher::start() {
    if (running_) {
        spdlog::warn("Alert dispatcher already running");
        return;
    }

    running_ = true;
    worker_ = std::thread(&AlertDispatcher::worker_loop, this);
    spdlog::info("Alert dispatcher started");
}

void AlertDispatcher::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("Alert dispatcher stopped ({} delivered, {} failed, {} skipped)",
                 delivered_.load(), failed_.load(), skipped_.load());
}

void AlertDispatcher::enqueue(Notification notification) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= max_queue_) {
            spdlog::warn("Alert queue full, dropping oldest alert: {}", queue_.front().title);
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(std::move(notification));
    }
    cv_.notify_one();
}

size_t AlertDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

DeliveryResult AlertDispatcher::deliver(const Notification& notification) {
    if (bus_ && !event_stream_.empty()) {
        nlohmann::json event = notification.meta;
        event["title"] = notification.title;
        bus_->publish_event(event_stream_, event);
    }

    DeliveryResult result{DeliveryStatus::Skipped, "no notifier"};
    if (notifier_) {
        try {
            result = notifier_->send(notification);
        } catch (const std::exception& e) {
            result = {DeliveryStatus::Failed, e.what()};
        }
    }

    switch (result.status) {
        case DeliveryStatus::Delivered:
            delivered_++;
            spdlog::info("Alert delivered: {}", notification.title);
            break;
        case DeliveryStatus::Failed:
            failed_++;
            spdlog::error("Alert delivery failed ({}): {}", notification.title, result.detail);
            break;
        case DeliveryStatus::Skipped:
            skipped_++;
            spdlog::debug("Alert not delivered ({}): {}", notification.title, result.detail);
            break;
    }
    return result;
}

void AlertDispatcher::worker_loop() {
    while (true) {
        Notification next;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (queue_.empty()) {
                // stopped and drained
                return;
            }
            next = std::move(queue_.front());
            queue_.pop_front();
        }
        deliver(next);
    }
}
