#pragma once

#include <string>
#include <nlohmann/json.hpp>

struct Notification {
    std::string title;
    std::string message;
    std::string kind;     // "price" or "rsi"
    nlohmann::json meta;  // structured copy for the event stream
};

enum class DeliveryStatus {
    Delivered,
    Failed,
    Skipped
};

// Outcome of a delivery attempt. Independent of the trigger that produced it.
struct DeliveryResult {
    DeliveryStatus status;
    std::string detail;

    bool delivered() const { return status == DeliveryStatus::Delivered; }
};

class Notifier {
public:
    virtual ~Notifier() = default;

    virtual DeliveryResult send(const Notification& notification) = 0;
};

// Where the engines hand off alerts. Must not block on delivery.
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual void enqueue(Notification notification) = 0;
};
