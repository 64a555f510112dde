#pragma once

#include <memory>
#include <mutex>
#include <core/config.hpp>
#include <cache/cache_service.hpp>
#include <gateway/remote_gateway.hpp>
#include <realtime/update_engine.hpp>
#include "pipeline_data_service.hpp"

// Headless facade for one client session: owns the cache, the cache-fronted
// data service and the update engine, all configured from Settings. Any
// frontend (tree view, CLI, status bar) talks to this.
class WatchService {
public:
    WatchService(RemoteDataGateway& remote, const Settings& settings);
    ~WatchService();

    WatchService(const WatchService&) = delete;
    WatchService& operator=(const WatchService&) = delete;

    CacheService& cache() { return cache_; }
    PipelineDataService& data() { return data_; }
    UpdateEngine& engine() { return *engine_; }

    // Validates, then pushes refresh interval, auto refresh, subscription
    // limit and log level to the running session. Cache size and TTL are
    // fixed for the life of the session.
    Result<void> apply_settings(const Settings& settings);
    Settings settings() const;

    static UpdateEngineConfig engine_config_from(const Settings& settings);
    static CacheConfig cache_config_from(const Settings& settings);

private:
    mutable std::mutex settings_mutex_;
    Settings settings_;
    CacheService cache_;
    PipelineDataService data_;
    std::shared_ptr<UpdateEngine> engine_;
};
