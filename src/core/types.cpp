#include "types.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                return "none";
        case ErrorCode::CapacityExceeded:    return "capacity_exceeded";
        case ErrorCode::Disposed:            return "disposed";
        case ErrorCode::FetchFailure:        return "fetch_failure";
        case ErrorCode::InvalidConfig:       return "invalid_config";
        case ErrorCode::IoError:             return "io_error";
    }
    return "unknown";
}

std::string to_string(RunState state) {
    switch (state) {
        case RunState::InProgress: return "inProgress";
        case RunState::Cancelling: return "cancelling";
        case RunState::Completed:  return "completed";
        case RunState::Unknown:    break;
    }
    return "unknown";
}

std::string to_string(RunResult result) {
    switch (result) {
        case RunResult::Succeeded:          return "succeeded";
        case RunResult::Failed:             return "failed";
        case RunResult::Canceled:           return "canceled";
        case RunResult::Abandoned:          return "abandoned";
        case RunResult::PartiallySucceeded: return "partiallySucceeded";
        case RunResult::None:               break;
    }
    return "";
}

RunState run_state_from_string(const std::string& s) {
    if (s == "inProgress") return RunState::InProgress;
    if (s == "cancelling") return RunState::Cancelling;
    if (s == "completed") return RunState::Completed;
    return RunState::Unknown;
}

RunResult run_result_from_string(const std::string& s) {
    if (s == "succeeded") return RunResult::Succeeded;
    if (s == "failed") return RunResult::Failed;
    if (s == "canceled") return RunResult::Canceled;
    if (s == "abandoned") return RunResult::Abandoned;
    if (s == "partiallySucceeded") return RunResult::PartiallySucceeded;
    return RunResult::None;
}
