#include "gateway.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "util.hpp"
#ifdef MODELGATE_HAS_SQLITE
#include "stores/sqlite_cache_store.hpp"
#endif
#include <iostream>

namespace modelgate {

namespace {

// How long an idle worker waits before re-checking for shutdown
constexpr Duration kWorkerPoll = std::chrono::milliseconds(200);

std::unique_ptr<CatalogSource> catalog_from_config(const GatewayConfig& config) {
    if (!config.catalog_path.empty()) {
        return std::make_unique<JsonCatalogSource>(expand_home(config.catalog_path));
    }
    return std::make_unique<InlineCatalogSource>(config.models);
}

} // namespace

Gateway::Gateway(GatewayConfig config, GatewayParts parts)
    : config_(std::move(config)),
      owned_clock_(parts.clock ? std::unique_ptr<SystemClock>() : std::make_unique<SystemClock>()),
      clock_(parts.clock ? *parts.clock : *owned_clock_),
      catalog_(std::move(parts.catalog)),
      limiter_(config_.rate_limit, clock_),
      breaker_(config_.circuit_breaker, clock_),
      embedder_(std::move(parts.embedder)),
      cache_(config_.cache, embedder_.get(), clock_, std::move(parts.cache_store)),
      queue_(config_.queue, clock_),
      router_(registry_, breaker_, limiter_, config_.router, clock_),
      adapters_(std::move(parts.adapters)) {
    if (!catalog_) catalog_ = catalog_from_config(config_);
    registry_.load(*catalog_);
    std::cerr << "[gateway] Catalog " << catalog_->source_name() << ": "
              << registry_.size() << " models, " << adapters_.size() << " adapters\n";

    queue_.set_expiry_handler([this](const InferenceRequest& req) {
        fail_pending(req.request_id, std::make_exception_ptr(GatewayError(
            ErrorKind::RequestExpired,
            "Request " + req.request_id + " expired while queued")));
    });

    cache_.warm_start();
}

Gateway::~Gateway() {
    stop();
}

std::unique_ptr<Gateway> Gateway::from_config(const GatewayConfig& config, HttpClient& http) {
    GatewayParts parts;

    for (const auto& [name, settings] : config.providers) {
        std::string type = settings.type.empty() ? name : settings.type;
        if ((type == "openai" || type == "anthropic") && settings.api_key.empty()) {
            std::cerr << "[gateway] Provider " << name << " has no API key; not registered\n";
            continue;
        }
        parts.adapters.add(create_adapter(name, settings, http));
    }

    parts.embedder = create_embedder(config, http);

    if (!config.cache_path.empty()) {
#ifdef MODELGATE_HAS_SQLITE
        try {
            parts.cache_store = std::make_shared<SqliteCacheStore>(expand_home(config.cache_path));
        } catch (const std::exception& e) {
            std::cerr << "[cache] Persistence disabled: " << e.what() << "\n";
        }
#else
        std::cerr << "[cache] Built without SQLite; ignoring cache.path\n";
#endif
    }

    return std::make_unique<Gateway>(config, std::move(parts));
}

void Gateway::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load() || queue_.closed()) return;
    running_.store(true);

    for (uint32_t i = 0; i < config_.gateway.workers; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
    maintenance_ = std::thread([this]() { maintenance_loop(); });
    std::cerr << "[gateway] Started " << config_.gateway.workers << " workers\n";
}

void Gateway::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    queue_.close();

    if (running_.exchange(false)) {
        // Workers finish everything already queued, then exit
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();

        {
            std::lock_guard<std::mutex> mlock(maintenance_mutex_);
            stopping_ = true;
        }
        maintenance_cv_.notify_all();
        if (maintenance_.joinable()) maintenance_.join();
        std::cerr << "[gateway] Stopped\n";
    }

    // Never started: nothing will serve what is left
    for (auto& req : queue_.drain()) {
        fail_pending(req.request_id, std::make_exception_ptr(GatewayError(
            ErrorKind::QueueRejected, "Gateway stopped before request " +
            req.request_id + " was served")));
    }
}

InferenceResult Gateway::infer(InferenceRequest request) {
    // Without workers the future would only settle at stop()
    if (!running_.load()) {
        requests_++;
        throw GatewayError(ErrorKind::QueueRejected, "Gateway is not running");
    }
    return submit(std::move(request)).get();
}

std::future<InferenceResult> Gateway::submit(InferenceRequest request) {
    requests_++;
    if (request.request_id.empty()) request.request_id = generate_id();
    const std::string id = request.request_id;

    auto pending = std::make_unique<Pending>();
    auto hit = cache_.lookup(request, &pending->embedding);
    if (hit) {
        cache_served_++;
        pending->promise.set_value(hit->to_result(id));
        return pending->promise.get_future();
    }

    std::future<InferenceResult> future = pending->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.count(id)) {
            std::cerr << "[gateway] Rejected " << id << ": already in flight\n";
            throw GatewayError(ErrorKind::QueueRejected,
                               "Request " + id + " is already in flight");
        }
        pending_[id] = std::move(pending);
    }

    EnqueueResult admitted = queue_.enqueue(std::move(request));
    if (!admitted) {
        take_pending(id);
        if (admitted.reason == RejectReason::AlreadyExpired) {
            throw GatewayError(ErrorKind::RequestExpired,
                               "Request " + id + " deadline already passed");
        }
        throw GatewayError(ErrorKind::QueueRejected,
                           "Request " + id + " rejected: " +
                           reject_reason_to_string(admitted.reason));
    }
    return future;
}

std::unique_ptr<Gateway::Pending> Gateway::take_pending(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(request_id);
    if (it == pending_.end()) return nullptr;
    auto p = std::move(it->second);
    pending_.erase(it);
    return p;
}

void Gateway::fail_pending(const std::string& request_id, std::exception_ptr error) {
    auto p = take_pending(request_id);
    if (!p) return;
    failed_++;
    p->promise.set_exception(std::move(error));
}

void Gateway::worker_loop() {
    while (true) {
        auto req = queue_.wait_dequeue(kWorkerPoll);
        if (req) {
            process(std::move(*req));
            continue;
        }
        if (queue_.closed() && queue_.depth() == 0) break;
    }
}

void Gateway::process(InferenceRequest request) {
    const std::string id = request.request_id;
    Embedding embedding;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        embedding = it->second->embedding;
    }

    try {
        InferenceResult result = router_.dispatch(request, adapters_);

        if (request.expired(clock_.now())) {
            late_results_++;
            std::cerr << "[gateway] Discarding late result for " << id
                      << " from " << result.provider << "/" << result.model_id << "\n";
            throw GatewayError(ErrorKind::RequestExpired,
                               "Request " + id + " deadline passed while in flight");
        }

        cache_.store(request, result, embedding.empty() ? nullptr : &embedding);

        auto p = take_pending(id);
        if (!p) return;
        completed_++;
        p->promise.set_value(std::move(result));
    } catch (const GatewayError&) {
        fail_pending(id, std::current_exception());
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Request " << id << " failed: " << e.what() << "\n";
        fail_pending(id, std::current_exception());
    }
}

void Gateway::maintenance_loop() {
    std::unique_lock<std::mutex> lock(maintenance_mutex_);
    while (!stopping_) {
        if (maintenance_cv_.wait_for(lock, config_.gateway.sweep_interval,
                                     [this]() { return stopping_; })) {
            break;
        }
        lock.unlock();
        run_maintenance();
        lock.lock();
    }
}

void Gateway::run_maintenance() {
    cache_.sweep_expired();
    queue_.sweep_expired();
    limiter_.evict_idle();
}

size_t Gateway::in_flight() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

nlohmann::json Gateway::stats() const {
    return {
        {"gateway", {
            {"running", running_.load()},
            {"workers", config_.gateway.workers},
            {"requests", requests_.load()},
            {"cache_served", cache_served_.load()},
            {"completed", completed_.load()},
            {"failed", failed_.load()},
            {"late_results", late_results_.load()},
            {"in_flight", in_flight()},
            {"adapters", adapters_.names()}
        }},
        {"cache", cache_.stats()},
        {"circuits", breaker_.snapshot()},
        {"rate_limits", limiter_.snapshot()},
        {"queue", queue_.stats()},
        {"registry", registry_.stats()},
        {"router", router_.stats()}
    };
}

void Gateway::clear_cache() {
    cache_.clear();
}

void Gateway::reload_registry() {
    uint64_t before = registry_.version();
    registry_.load(*catalog_);
    std::cerr << "[gateway] Reloaded catalog from " << catalog_->source_name()
              << ": version " << before << " -> " << registry_.version()
              << ", " << registry_.size() << " models\n";
}

void Gateway::reset_provider(const std::string& provider) {
    breaker_.reset(provider);
}

nlohmann::json Gateway::health_check() {
    nlohmann::json providers = nlohmann::json::object();
    size_t healthy = 0;
    auto names = adapters_.names();

    for (const auto& name : names) {
        ProviderHealth health;
        try {
            health = adapters_.find(name)->health_check(config_.gateway.health_timeout);
        } catch (const std::exception& e) {
            health.status = HealthStatus::Unavailable;
            health.detail = e.what();
        }
        if (health.healthy()) {
            healthy++;
        } else {
            std::cerr << "[gateway] Health check " << name << ": "
                      << health_status_to_string(health.status);
            if (!health.detail.empty()) std::cerr << " (" << health.detail << ")";
            std::cerr << "\n";
        }

        providers[name] = {
            {"status", health_status_to_string(health.status)},
            {"http_status", health.http_status},
            {"detail", health.detail},
            {"circuit", circuit_state_to_string(breaker_.state(name))}
        };
    }

    HealthStatus overall = HealthStatus::Healthy;
    if (healthy == 0) overall = HealthStatus::Unavailable;
    else if (healthy < names.size()) overall = HealthStatus::Degraded;

    return {
        {"status", health_status_to_string(overall)},
        {"running", running_.load()},
        {"catalog_version", registry_.version()},
        {"providers", providers}
    };
}

} // namespace modelgate
