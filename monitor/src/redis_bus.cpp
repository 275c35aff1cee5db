#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace {
constexpr long long kStreamMaxLen = 10000;
}

RedisBus::RedisBus(const std::string& redis_url,
                   const std::string& key_prefix,
                   std::chrono::milliseconds timeout)
    : key_prefix_(key_prefix)
{
    try {
        sw::redis::ConnectionOptions options(redis_url);
        options.connect_timeout = timeout;
        options.socket_timeout = timeout;

        redis_ = std::make_shared<sw::redis::Redis>(options);
        spdlog::info("Connected to Redis: {} (timeout {} ms)", redis_url, timeout.count());
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

std::string RedisBus::document_key(const std::string& name) const {
    return key_prefix_ + ":" + name;
}

std::optional<nlohmann::json> RedisBus::load(const std::string& name) {
    try {
        auto val = redis_->get(document_key(name));
        if (!val) {
            return std::nullopt;
        }
        return nlohmann::json::parse(*val);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to load {} from Redis: {}", name, e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Stored document {} is not valid JSON: {}", name, e.what());
    }
    return std::nullopt;
}

bool RedisBus::save(const std::string& name, const nlohmann::json& document) {
    try {
        redis_->set(document_key(name), document.dump());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save {} to Redis: {}", name, e.what());
        return false;
    }
}

void RedisBus::publish_event(const std::string& stream, const nlohmann::json& data) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();

        redis_->xadd(stream, "*", fields.begin(), fields.end(), kStreamMaxLen);
        spdlog::debug("Published event to {}", stream);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish event: {}", e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        return false;
    }
}
