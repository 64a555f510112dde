#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <cache/cache_service.hpp>
#include <gateway/remote_gateway.hpp>

struct DataServiceConfig {
    bool cache_enabled = true;
};

// Cache-fronted view of the remote CI service. Reads go through the cache;
// mutations go straight to the inner gateway and drop the affected entries.
// Implements RemoteDataGateway itself, so the update engine can poll either
// through it or around it.
class PipelineDataService : public RemoteDataGateway {
public:
    PipelineDataService(RemoteDataGateway& remote, CacheService& cache,
                        DataServiceConfig config = DataServiceConfig{});

    Result<std::vector<Project>> fetch_projects() override;
    Result<std::vector<Pipeline>> fetch_pipelines(const std::string& project_id) override;
    Result<std::vector<PipelineRun>> fetch_pipeline_runs(int pipeline_id,
                                                         const std::string& project_id) override;

    // Not cached: this is what the update engine polls for changes.
    Result<PipelineRun> fetch_run_details(int run_id, int pipeline_id,
                                          const std::string& project_id) override;

    Result<PipelineRun> trigger_run(int pipeline_id, const std::string& project_id,
                                    const RunParameters& params) override;
    Result<void> cancel_run(int run_id, int pipeline_id,
                            const std::string& project_id) override;

    // At most `top` runs, newest first as returned by the service.
    Result<std::vector<PipelineRun>> pipeline_runs(int pipeline_id, const std::string& project_id,
                                                   std::size_t top = DEFAULT_RUNS_TOP);

    void refresh_project(const std::string& project_id);
    void refresh_pipeline(int pipeline_id, const std::string& project_id);
    void clear_cache();

    const DataServiceConfig& config() const { return config_; }

private:
    RemoteDataGateway& remote_;
    CacheService& cache_;
    DataServiceConfig config_;
};
