#include "ntfy_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

NtfyClient::NtfyClient(const std::string& server, const std::string& topic,
                       std::shared_ptr<HttpClient> http)
    : server_(server)
    , topic_(topic)
    , http_(std::move(http))
{
    while (!server_.empty() && server_.back() == '/') {
        server_.pop_back();
    }
}

std::string NtfyClient::ascii_title(const std::string& title) {
    std::string out;
    for (char c : title) {
        auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x20 && uc < 0x7f) {
            out += c;
        }
    }
    return util::trim(out);
}

DeliveryResult NtfyClient::send(const Notification& notification) {
    if (!enabled()) {
        return {DeliveryStatus::Skipped, "no topic configured"};
    }

    std::string url = server_ + "/" + topic_;
    std::vector<std::string> headers = {
        "Title: " + ascii_title(notification.title),
        "Content-Type: text/plain; charset=utf-8"
    };
    if (!notification.kind.empty()) {
        headers.push_back("Tags: " + notification.kind);
    }

    try {
        auto response = http_->post(url, notification.message, headers);
        if (response.status >= 200 && response.status < 300) {
            return {DeliveryStatus::Delivered, ""};
        }
        spdlog::warn("ntfy rejected alert: HTTP {}", response.status);
        return {DeliveryStatus::Failed, "HTTP " + std::to_string(response.status)};
    } catch (const CollaboratorUnavailable& e) {
        spdlog::error("Failed to send alert: {}", e.what());
        return {DeliveryStatus::Failed, e.what()};
    }
}
