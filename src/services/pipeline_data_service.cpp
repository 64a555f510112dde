#include "pipeline_data_service.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

PipelineDataService::PipelineDataService(RemoteDataGateway& remote, CacheService& cache,
                                         DataServiceConfig config)
    : remote_(remote), cache_(cache), config_(config) {}

// ── Reads ───────────────────────────────────────────────────

Result<std::vector<Project>> PipelineDataService::fetch_projects() {
    if (config_.cache_enabled) {
        if (auto cached = cache_.cached_projects()) {
            return Result<std::vector<Project>>::Ok(std::move(*cached));
        }
    }

    auto r = remote_.fetch_projects();
    if (r.is_err()) {
        return Result<std::vector<Project>>::Err(
            "Failed to fetch projects: " + r.error, r.code);
    }

    if (config_.cache_enabled) {
        cache_.set_cached_projects(r.value);
    }
    return r;
}

Result<std::vector<Pipeline>> PipelineDataService::fetch_pipelines(const std::string& project_id) {
    if (config_.cache_enabled) {
        if (auto cached = cache_.cached_pipelines(project_id)) {
            return Result<std::vector<Pipeline>>::Ok(std::move(*cached));
        }
    }

    auto r = remote_.fetch_pipelines(project_id);
    if (r.is_err()) {
        return Result<std::vector<Pipeline>>::Err(
            fmt::format("Failed to fetch pipelines for project {}: {}", project_id, r.error),
            r.code);
    }

    if (config_.cache_enabled) {
        cache_.set_cached_pipelines(project_id, r.value);
    }
    return r;
}

Result<std::vector<PipelineRun>> PipelineDataService::fetch_pipeline_runs(
        int pipeline_id, const std::string& project_id) {
    if (config_.cache_enabled) {
        if (auto cached = cache_.cached_pipeline_runs(pipeline_id, project_id)) {
            return Result<std::vector<PipelineRun>>::Ok(std::move(*cached));
        }
    }

    auto r = remote_.fetch_pipeline_runs(pipeline_id, project_id);
    if (r.is_err()) {
        return Result<std::vector<PipelineRun>>::Err(
            fmt::format("Failed to fetch runs for pipeline {}: {}", pipeline_id, r.error),
            r.code);
    }

    if (config_.cache_enabled) {
        cache_.set_cached_pipeline_runs(pipeline_id, project_id, r.value);
        cache_.set_last_update_timestamp(pipeline_id, project_id, WallClock::now());
    }
    return r;
}

Result<std::vector<PipelineRun>> PipelineDataService::pipeline_runs(
        int pipeline_id, const std::string& project_id, std::size_t top) {
    auto r = fetch_pipeline_runs(pipeline_id, project_id);
    if (r.is_ok() && r.value.size() > top) {
        r.value.resize(top);
    }
    return r;
}

Result<PipelineRun> PipelineDataService::fetch_run_details(int run_id, int pipeline_id,
                                                           const std::string& project_id) {
    auto r = remote_.fetch_run_details(run_id, pipeline_id, project_id);
    if (r.is_err()) {
        return Result<PipelineRun>::Err(
            fmt::format("Failed to fetch run {}: {}", run_id, r.error), r.code);
    }
    return r;
}

// ── Mutations ───────────────────────────────────────────────

Result<PipelineRun> PipelineDataService::trigger_run(int pipeline_id,
                                                     const std::string& project_id,
                                                     const RunParameters& params) {
    auto r = remote_.trigger_run(pipeline_id, project_id, params);
    if (r.is_err()) {
        return Result<PipelineRun>::Err(
            fmt::format("Failed to trigger pipeline {}: {}", pipeline_id, r.error), r.code);
    }

    if (config_.cache_enabled) {
        cache_.invalidate_pipeline(pipeline_id, project_id);
    }
    log_info(fmt::format("data: triggered run {} of pipeline {} on {}",
                         r.value.id, pipeline_id, params.source_branch));
    return r;
}

Result<void> PipelineDataService::cancel_run(int run_id, int pipeline_id,
                                             const std::string& project_id) {
    auto r = remote_.cancel_run(run_id, pipeline_id, project_id);
    if (r.is_err()) {
        return Result<void>::Err(
            fmt::format("Failed to cancel run {}: {}", run_id, r.error), r.code);
    }

    if (config_.cache_enabled) {
        cache_.invalidate_pipeline(pipeline_id, project_id);
    }
    log_info(fmt::format("data: canceled run {} of pipeline {}", run_id, pipeline_id));
    return r;
}

// ── Explicit refresh ────────────────────────────────────────

void PipelineDataService::refresh_project(const std::string& project_id) {
    if (config_.cache_enabled) {
        cache_.invalidate_project(project_id);
    }
}

void PipelineDataService::refresh_pipeline(int pipeline_id, const std::string& project_id) {
    if (config_.cache_enabled) {
        cache_.invalidate_pipeline(pipeline_id, project_id);
    }
}

void PipelineDataService::clear_cache() {
    if (config_.cache_enabled) {
        cache_.clear();
    }
}
