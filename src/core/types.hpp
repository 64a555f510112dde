#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <chrono>
#include <functional>
#include <cstdint>

// Failure categories carried by Result. None on success.
enum class ErrorCode {
    None,
    CapacityExceeded,
    Disposed,
    FetchFailure,
    InvalidConfig,
    IoError,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err, ErrorCode code = ErrorCode::FetchFailure) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err, ErrorCode code = ErrorCode::FetchFailure) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// ── Remote CI entities ──────────────────────────────────────

enum class RunState {
    Unknown,
    InProgress,
    Cancelling,
    Completed,
};

enum class RunResult {
    None,           // not finished yet
    Succeeded,
    Failed,
    Canceled,
    Abandoned,
    PartiallySucceeded,
};

std::string to_string(RunState state);
std::string to_string(RunResult result);
RunState run_state_from_string(const std::string& s);
RunResult run_result_from_string(const std::string& s);

// A run in this state will not transition again.
inline bool is_terminal(RunState state) { return state == RunState::Completed; }

struct Project {
    std::string id;
    std::string name;
    std::string description;
    std::string url;
    std::string state = "wellFormed";
    std::string visibility = "private";
};

struct Pipeline {
    int id = 0;
    std::string name;
    std::string project_id;
    std::string folder;
    int revision = 0;
    std::string url;
};

struct PipelineRun {
    int id = 0;
    std::string name;
    int pipeline_id = 0;
    std::string project_id;
    RunState state = RunState::Unknown;
    RunResult result = RunResult::None;
    WallTime created_date{};
    std::optional<WallTime> finished_date;
    std::string url;
};

// Parameters for queueing a new run.
struct RunParameters {
    std::string source_branch = "refs/heads/main";
    std::map<std::string, std::string> variables;
};
