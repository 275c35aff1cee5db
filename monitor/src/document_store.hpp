#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

// Durable keyed storage for the service's JSON documents.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<nlohmann::json> load(const std::string& name) = 0;
    virtual bool save(const std::string& name, const nlohmann::json& document) = 0;
};
