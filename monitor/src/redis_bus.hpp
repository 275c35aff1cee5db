#pragma once

#include "document_store.hpp"
#include <string>
#include <memory>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus : public DocumentStore {
public:
    // timeout bounds both connecting and every command on the socket.
    RedisBus(const std::string& redis_url,
             const std::string& key_prefix,
             std::chrono::milliseconds timeout);

    std::optional<nlohmann::json> load(const std::string& name) override;
    bool save(const std::string& name, const nlohmann::json& document) override;

    void publish_event(const std::string& stream, const nlohmann::json& data);

    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string key_prefix_;

    std::string document_key(const std::string& name) const;
};
