#include "sandbox/execution_types.hpp"

namespace runbox::sandbox {

const char* ToString(ExecutionState state) {
    switch (state) {
        case ExecutionState::kCreated: return "CREATED";
        case ExecutionState::kRunning: return "RUNNING";
        case ExecutionState::kCompleted: return "COMPLETED";
        case ExecutionState::kTimedOut: return "TIMED_OUT";
        case ExecutionState::kFailed: return "FAILED";
        case ExecutionState::kFinalized: return "FINALIZED";
    }
    return "UNKNOWN";
}

nlohmann::json ToJson(const ExecutionResult& result) {
    return {
        {"status", result.Status()},
        {"returncode", result.returncode},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"artifacts", {
            {"files", result.files},
            {"session_dir", result.session_dir}
        }},
        {"execution_time", result.execution_time},
        {"timestamp", result.timestamp}
    };
}

nlohmann::json ToJson(const SessionInfo& info) {
    return {
        {"session_id", info.session_id},
        {"session_dir", info.session_dir},
        {"files", info.files},
        {"exists", info.exists}
    };
}

}  // namespace runbox::sandbox
