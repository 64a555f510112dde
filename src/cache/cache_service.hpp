#pragma once

#include <any>
#include <chrono>
#include <optional>
#include <string>
#include <typeinfo>
#include <vector>
#include <core/types.hpp>
#include <core/log.hpp>
#include <core/constants.hpp>
#include "ttl_lru_cache.hpp"

struct CacheConfig {
    std::chrono::milliseconds default_ttl{DEFAULT_CACHE_TTL_MS};
    std::size_t max_size = DEFAULT_CACHE_MAX_SIZE;
};

// One shared cache for every CI entity type. Values are type-erased; the
// typed helpers below own the key scheme.
class CacheService {
public:
    using Cache = TtlLruCache<std::any>;

    explicit CacheService(const CacheConfig& config = CacheConfig{},
                          Cache::NowFn now = nullptr);

    // A stored value of a different type is treated as a miss.
    template <typename T>
    std::optional<T> get(const std::string& key) {
        auto raw = cache_.get(key);
        if (!raw) return std::nullopt;
        if (raw->type() != typeid(T)) {
            log_warn("cache: type mismatch for key " + key);
            return std::nullopt;
        }
        return std::any_cast<T>(std::move(*raw));
    }

    template <typename T>
    void set(const std::string& key, T value) {
        cache_.set(key, std::any(std::move(value)));
    }

    template <typename T>
    void set(const std::string& key, T value, std::chrono::milliseconds ttl) {
        cache_.set(key, std::any(std::move(value)), ttl);
    }

    void invalidate(const std::string& key) { cache_.invalidate(key); }
    void clear() { cache_.clear(); }
    std::size_t cleanup() { return cache_.cleanup(); }
    bool is_expired(const std::string& key) const { return cache_.is_expired(key); }
    CacheStats stats() const { return cache_.stats(); }

    // ── CI entities ─────────────────────────────────────────

    std::optional<std::vector<Project>> cached_projects();
    void set_cached_projects(std::vector<Project> projects);

    std::optional<std::vector<Pipeline>> cached_pipelines(const std::string& project_id);
    void set_cached_pipelines(const std::string& project_id, std::vector<Pipeline> pipelines);

    std::optional<std::vector<PipelineRun>> cached_pipeline_runs(int pipeline_id,
                                                                 const std::string& project_id);
    void set_cached_pipeline_runs(int pipeline_id, const std::string& project_id,
                                  std::vector<PipelineRun> runs);

    std::optional<WallTime> last_update_timestamp(int pipeline_id, const std::string& project_id);
    void set_last_update_timestamp(int pipeline_id, const std::string& project_id, WallTime ts);

    // Drops every pipeline and run entry belonging to the project.
    void invalidate_project(const std::string& project_id);
    void invalidate_pipeline(int pipeline_id, const std::string& project_id);

    static std::string pipelines_key(const std::string& project_id);
    static std::string runs_key(int pipeline_id, const std::string& project_id);
    static std::string timestamp_key(int pipeline_id, const std::string& project_id);

private:
    Cache cache_;
};
