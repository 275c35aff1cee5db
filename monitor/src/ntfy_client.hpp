#pragma once

#include "notifier.hpp"
#include "http_client.hpp"
#include <string>
#include <memory>

class NtfyClient : public Notifier {
public:
    NtfyClient(const std::string& server, const std::string& topic, std::shared_ptr<HttpClient> http);

    DeliveryResult send(const Notification& notification) override;

    bool enabled() const { return !topic_.empty(); }

    // HTTP header values must be ASCII; drops everything else.
    static std::string ascii_title(const std::string& title);

private:
    std::string server_;
    std::string topic_;
    std::shared_ptr<HttpClient> http_;
};
