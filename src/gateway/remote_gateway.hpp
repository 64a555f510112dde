#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Access to the remote CI service. Implementations own transport, auth,
// retries and timeouts; callers only look at success vs failure.
// Implementations must tolerate calls from several threads at once.
class RemoteDataGateway {
public:
    virtual ~RemoteDataGateway() = default;

    virtual Result<PipelineRun> fetch_run_details(int run_id, int pipeline_id,
                                                  const std::string& project_id) = 0;

    virtual Result<std::vector<PipelineRun>> fetch_pipeline_runs(int pipeline_id,
                                                                 const std::string& project_id) = 0;

    virtual Result<std::vector<Project>> fetch_projects() = 0;

    virtual Result<std::vector<Pipeline>> fetch_pipelines(const std::string& project_id) = 0;

    virtual Result<PipelineRun> trigger_run(int pipeline_id, const std::string& project_id,
                                            const RunParameters& params) = 0;

    virtual Result<void> cancel_run(int run_id, int pipeline_id,
                                    const std::string& project_id) = 0;
};
