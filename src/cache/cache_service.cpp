#include "cache_service.hpp"
#include <fmt/format.h>

CacheService::CacheService(const CacheConfig& config, Cache::NowFn now)
    : cache_(config.max_size, config.default_ttl, std::move(now)) {}

std::string CacheService::pipelines_key(const std::string& project_id) {
    return fmt::format(CACHE_KEY_PIPELINES, project_id);
}

std::string CacheService::runs_key(int pipeline_id, const std::string& project_id) {
    return fmt::format(CACHE_KEY_RUNS, project_id, pipeline_id);
}

std::string CacheService::timestamp_key(int pipeline_id, const std::string& project_id) {
    return fmt::format(CACHE_KEY_TIMESTAMP, project_id, pipeline_id);
}

std::optional<std::vector<Project>> CacheService::cached_projects() {
    return get<std::vector<Project>>(CACHE_KEY_PROJECTS);
}

void CacheService::set_cached_projects(std::vector<Project> projects) {
    set(CACHE_KEY_PROJECTS, std::move(projects));
}

std::optional<std::vector<Pipeline>> CacheService::cached_pipelines(const std::string& project_id) {
    return get<std::vector<Pipeline>>(pipelines_key(project_id));
}

void CacheService::set_cached_pipelines(const std::string& project_id,
                                        std::vector<Pipeline> pipelines) {
    set(pipelines_key(project_id), std::move(pipelines));
}

std::optional<std::vector<PipelineRun>> CacheService::cached_pipeline_runs(
        int pipeline_id, const std::string& project_id) {
    return get<std::vector<PipelineRun>>(runs_key(pipeline_id, project_id));
}

void CacheService::set_cached_pipeline_runs(int pipeline_id, const std::string& project_id,
                                            std::vector<PipelineRun> runs) {
    set(runs_key(pipeline_id, project_id), std::move(runs));
}

std::optional<WallTime> CacheService::last_update_timestamp(int pipeline_id,
                                                            const std::string& project_id) {
    return get<WallTime>(timestamp_key(pipeline_id, project_id));
}

void CacheService::set_last_update_timestamp(int pipeline_id, const std::string& project_id,
                                             WallTime ts) {
    set(timestamp_key(pipeline_id, project_id), ts);
}

void CacheService::invalidate_project(const std::string& project_id) {
    // "pipelines:{p}" and "runs:{p}:" share the project id right after the
    // prefix. The trailing ':' on runs keeps "p1" from matching "p10".
    std::string pipelines = pipelines_key(project_id);
    std::string runs = fmt::format("runs:{}:", project_id);
    std::size_t n = cache_.invalidate_if([&](const std::string& key) {
        return key == pipelines || key.compare(0, runs.size(), runs) == 0;
    });
    log_debug(fmt::format("cache: invalidated {} entries for project {}", n, project_id));
}

void CacheService::invalidate_pipeline(int pipeline_id, const std::string& project_id) {
    cache_.invalidate(runs_key(pipeline_id, project_id));
}
