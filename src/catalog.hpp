#pragma once
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace modelgate {

// Delivers a complete model catalog. Implementations must return the whole
// catalog on every call, never a delta.
class CatalogSource {
public:
    virtual ~CatalogSource() = default;

    // Throws GatewayError (ConfigurationError) if the catalog cannot be read.
    virtual std::vector<ModelDescriptor> load() = 0;

    virtual std::string source_name() const = 0;
};

// Reads {"models": [...]} (or a bare array) from a JSON file on every load.
class JsonCatalogSource : public CatalogSource {
public:
    explicit JsonCatalogSource(std::string path);

    std::vector<ModelDescriptor> load() override;
    std::string source_name() const override { return "file:" + path_; }

private:
    std::string path_;
};

// Catalog embedded in the gateway config ("models" array).
class InlineCatalogSource : public CatalogSource {
public:
    explicit InlineCatalogSource(nlohmann::json models);

    std::vector<ModelDescriptor> load() override;
    std::string source_name() const override { return "inline"; }

private:
    nlohmann::json models_;
};

ModelDescriptor model_from_json(const nlohmann::json& j);
nlohmann::json model_to_json(const ModelDescriptor& m);

// Accepts either an array of models or an object with a "models" array.
std::vector<ModelDescriptor> models_from_json(const nlohmann::json& j);

} // namespace modelgate
