#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

class CatalogSource;

// Immutable catalog view. Built completely before it is published.
struct RegistrySnapshot {
    uint64_t version = 0;
    std::vector<ModelDescriptor> models; // sorted by id
    std::unordered_map<std::string, size_t> by_id;
    std::unordered_map<std::string, std::vector<size_t>> by_capability;
    std::unordered_map<std::string, std::vector<size_t>> by_provider;

    const ModelDescriptor* find(const std::string& id) const;

    // Enabled models offering every capability in `required`, id order.
    std::vector<ModelDescriptor> matching(const CapabilitySet& required) const;
};

// Catalog of (provider, model) pairs. Reads go through an atomically
// swapped snapshot pointer; reload never exposes a partial catalog.
class ModelRegistry {
public:
    ModelRegistry();
    explicit ModelRegistry(std::vector<ModelDescriptor> models);

    // Validate and publish a new catalog. Throws GatewayError
    // (ConfigurationError) and keeps the old snapshot if invalid.
    void reload(std::vector<ModelDescriptor> models);

    // Pull a full catalog from a source and publish it.
    void load(CatalogSource& source);

    std::shared_ptr<const RegistrySnapshot> snapshot() const;

    // Enabled models with the capability (all enabled models if empty)
    std::vector<ModelDescriptor> list(const std::string& capability) const;
    std::vector<ModelDescriptor> list_matching(const CapabilitySet& required) const;
    std::vector<ModelDescriptor> list_all() const;
    std::vector<ModelDescriptor> list_by_provider(const std::string& provider) const;
    std::optional<ModelDescriptor> get(const std::string& id) const;

    std::vector<std::string> providers() const;
    uint64_t version() const;
    size_t size() const;

    nlohmann::json stats() const;

private:
    std::shared_ptr<const RegistrySnapshot> snapshot_;
    uint64_t next_version_ = 1; // guarded by reload_mutex_
    std::mutex reload_mutex_;
};

// Throws std::invalid_argument describing the first problem found.
void validate_catalog(const std::vector<ModelDescriptor>& models);

} // namespace modelgate
