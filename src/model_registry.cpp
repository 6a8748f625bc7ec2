#include "model_registry.hpp"
#include "catalog.hpp"
#include "errors.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace modelgate {

namespace {

std::shared_ptr<const RegistrySnapshot> build_snapshot(std::vector<ModelDescriptor> models,
                                                       uint64_t version) {
    auto snap = std::make_shared<RegistrySnapshot>();
    snap->version = version;

    std::sort(models.begin(), models.end(),
              [](const ModelDescriptor& a, const ModelDescriptor& b) { return a.id < b.id; });
    snap->models = std::move(models);

    for (size_t i = 0; i < snap->models.size(); ++i) {
        const auto& m = snap->models[i];
        snap->by_id[m.id] = i;
        snap->by_provider[m.provider].push_back(i);
        for (const auto& cap : m.capabilities) {
            snap->by_capability[cap].push_back(i);
        }
    }
    return snap;
}

} // namespace

// ── RegistrySnapshot ────────────────────────────────────────────

const ModelDescriptor* RegistrySnapshot::find(const std::string& id) const {
    auto it = by_id.find(id);
    if (it == by_id.end()) return nullptr;
    return &models[it->second];
}

std::vector<ModelDescriptor> RegistrySnapshot::matching(const CapabilitySet& required) const {
    std::vector<ModelDescriptor> out;

    if (required.empty()) {
        for (const auto& m : models) {
            if (m.enabled) out.push_back(m);
        }
        return out;
    }

    // Walk the shortest capability posting list, check the rest per model.
    const std::vector<size_t>* smallest = nullptr;
    for (const auto& cap : required) {
        auto it = by_capability.find(cap);
        if (it == by_capability.end()) return out;
        if (!smallest || it->second.size() < smallest->size()) smallest = &it->second;
    }

    for (size_t idx : *smallest) {
        const auto& m = models[idx];
        if (m.enabled && m.supports(required)) out.push_back(m);
    }
    return out;
}

// ── Validation ──────────────────────────────────────────────────

void validate_catalog(const std::vector<ModelDescriptor>& models) {
    std::unordered_set<std::string> seen;
    for (const auto& m : models) {
        if (m.id.empty())
            throw std::invalid_argument("model id is required");
        if (m.provider.empty())
            throw std::invalid_argument("model " + m.id + ": provider is required");
        if (m.max_context_tokens == 0)
            throw std::invalid_argument("model " + m.id + ": max_context_tokens must be positive");
        if (m.max_output_tokens == 0)
            throw std::invalid_argument("model " + m.id + ": max_output_tokens must be positive");
        if (m.cost_per_input_token < 0.0 || m.cost_per_output_token < 0.0)
            throw std::invalid_argument("model " + m.id + ": costs must be non-negative");
        if (!seen.insert(m.id).second)
            throw std::invalid_argument("duplicate model id: " + m.id);
    }
}

// ── ModelRegistry ───────────────────────────────────────────────

ModelRegistry::ModelRegistry()
    : snapshot_(build_snapshot({}, 0)) {}

ModelRegistry::ModelRegistry(std::vector<ModelDescriptor> models)
    : snapshot_(build_snapshot({}, 0)) {
    reload(std::move(models));
}

void ModelRegistry::reload(std::vector<ModelDescriptor> models) {
    try {
        validate_catalog(models);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[registry] Rejected catalog: " << e.what() << "\n";
        throw GatewayError(ErrorKind::ConfigurationError,
                           std::string("Invalid model catalog: ") + e.what());
    }

    std::lock_guard<std::mutex> lock(reload_mutex_);
    size_t count = models.size();
    auto snap = build_snapshot(std::move(models), next_version_++);
    std::atomic_store(&snapshot_, snap);
    std::cerr << "[registry] Loaded catalog v" << snap->version
              << " (" << count << " models)\n";
}

void ModelRegistry::load(CatalogSource& source) {
    reload(source.load());
}

std::shared_ptr<const RegistrySnapshot> ModelRegistry::snapshot() const {
    return std::atomic_load(&snapshot_);
}

std::vector<ModelDescriptor> ModelRegistry::list(const std::string& capability) const {
    if (capability.empty()) return snapshot()->matching({});
    return snapshot()->matching({capability});
}

std::vector<ModelDescriptor> ModelRegistry::list_matching(const CapabilitySet& required) const {
    return snapshot()->matching(required);
}

std::vector<ModelDescriptor> ModelRegistry::list_all() const {
    return snapshot()->models;
}

std::vector<ModelDescriptor> ModelRegistry::list_by_provider(const std::string& provider) const {
    auto snap = snapshot();
    std::vector<ModelDescriptor> out;
    auto it = snap->by_provider.find(provider);
    if (it == snap->by_provider.end()) return out;
    for (size_t idx : it->second) out.push_back(snap->models[idx]);
    return out;
}

std::optional<ModelDescriptor> ModelRegistry::get(const std::string& id) const {
    auto snap = snapshot();
    const ModelDescriptor* m = snap->find(id);
    if (!m) return std::nullopt;
    return *m;
}

std::vector<std::string> ModelRegistry::providers() const {
    auto snap = snapshot();
    std::vector<std::string> out;
    out.reserve(snap->by_provider.size());
    for (const auto& [name, idxs] : snap->by_provider) {
        (void)idxs;
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

uint64_t ModelRegistry::version() const {
    return snapshot()->version;
}

size_t ModelRegistry::size() const {
    return snapshot()->models.size();
}

nlohmann::json ModelRegistry::stats() const {
    auto snap = snapshot();

    size_t enabled = 0;
    std::map<std::string, size_t> per_provider;
    std::map<std::string, size_t> per_capability;
    for (const auto& m : snap->models) {
        if (m.enabled) ++enabled;
        per_provider[m.provider]++;
        for (const auto& c : m.capabilities) per_capability[c]++;
    }

    return {
        {"version", snap->version},
        {"models", snap->models.size()},
        {"enabled", enabled},
        {"providers", per_provider},
        {"capabilities", per_capability}
    };
}

} // namespace modelgate
