#include "catalog.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>

namespace modelgate {

ModelDescriptor model_from_json(const nlohmann::json& j) {
    ModelDescriptor m;
    m.id = j.value("id", "");
    m.provider = j.value("provider", "");
    m.display_name = j.value("display_name", m.id);
    if (j.contains("capabilities") && j["capabilities"].is_array()) {
        std::vector<std::string> names;
        for (const auto& c : j["capabilities"]) {
            if (c.is_string()) names.push_back(c.get<std::string>());
        }
        m.capabilities = make_capabilities(names);
    }
    m.cost_per_input_token = j.value("cost_per_input_token", 0.0);
    m.cost_per_output_token = j.value("cost_per_output_token", 0.0);
    m.max_context_tokens = j.value("max_context_tokens", 0u);
    m.max_output_tokens = j.value("max_output_tokens", 4096u);
    m.latency_class = latency_class_from_string(j.value("latency_class", "standard"));
    m.enabled = j.value("enabled", true);
    if (j.contains("regions") && j["regions"].is_array()) {
        for (const auto& r : j["regions"]) {
            if (r.is_string()) m.regions.push_back(r.get<std::string>());
        }
    }
    return m;
}

nlohmann::json model_to_json(const ModelDescriptor& m) {
    return {
        {"id", m.id},
        {"provider", m.provider},
        {"display_name", m.display_name},
        {"capabilities", std::vector<std::string>(m.capabilities.begin(), m.capabilities.end())},
        {"cost_per_input_token", m.cost_per_input_token},
        {"cost_per_output_token", m.cost_per_output_token},
        {"max_context_tokens", m.max_context_tokens},
        {"max_output_tokens", m.max_output_tokens},
        {"latency_class", latency_class_to_string(m.latency_class)},
        {"enabled", m.enabled},
        {"regions", m.regions}
    };
}

std::vector<ModelDescriptor> models_from_json(const nlohmann::json& j) {
    const nlohmann::json* arr = &j;
    if (j.is_object()) {
        if (!j.contains("models") || !j["models"].is_array()) {
            throw GatewayError(ErrorKind::ConfigurationError,
                               "Catalog object has no \"models\" array");
        }
        arr = &j["models"];
    } else if (!j.is_array()) {
        throw GatewayError(ErrorKind::ConfigurationError,
                           "Catalog must be an array or an object with \"models\"");
    }

    std::vector<ModelDescriptor> models;
    models.reserve(arr->size());
    for (const auto& item : *arr) {
        if (!item.is_object()) {
            throw GatewayError(ErrorKind::ConfigurationError, "Catalog entry is not an object");
        }
        try {
            models.push_back(model_from_json(item));
        } catch (const nlohmann::json::exception& e) {
            throw GatewayError(ErrorKind::ConfigurationError,
                               std::string("Malformed catalog entry: ") + e.what());
        }
    }
    return models;
}

// ── JsonCatalogSource ───────────────────────────────────────────

JsonCatalogSource::JsonCatalogSource(std::string path)
    : path_(expand_home(path)) {}

std::vector<ModelDescriptor> JsonCatalogSource::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw GatewayError(ErrorKind::ConfigurationError,
                           "Cannot open model catalog: " + path_);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw GatewayError(ErrorKind::ConfigurationError,
                           "Model catalog " + path_ + " is not valid JSON: " + e.what());
    }

    auto models = models_from_json(j);
    std::cerr << "[catalog] Read " << models.size() << " models from " << path_ << "\n";
    return models;
}

// ── InlineCatalogSource ─────────────────────────────────────────

InlineCatalogSource::InlineCatalogSource(nlohmann::json models)
    : models_(std::move(models)) {}

std::vector<ModelDescriptor> InlineCatalogSource::load() {
    return models_from_json(models_);
}

} // namespace modelgate
