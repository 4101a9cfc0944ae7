#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace runbox::sandbox {

struct ExecutionRequest {
    std::string code;
    std::string session_id;
    std::optional<std::chrono::milliseconds> timeout;
    nlohmann::json context = nlohmann::json::object();
    bool capture_artifacts = true;
};

// CREATED -> RUNNING -> {COMPLETED, TIMED_OUT, FAILED} -> FINALIZED
enum class ExecutionState {
    kCreated,
    kRunning,
    kCompleted,
    kTimedOut,
    kFailed,
    kFinalized
};

const char* ToString(ExecutionState state);

struct ExecutionResult {
    bool success = false;
    int returncode = -1;
    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> files;
    std::string session_dir;
    double execution_time = 0.0;
    std::string timestamp;
    // State the execution was in right before it was finalized.
    ExecutionState terminal_state = ExecutionState::kFailed;

    const char* Status() const { return success ? "success" : "error"; }
};

struct SessionInfo {
    std::string session_id;
    std::string session_dir;
    std::vector<std::string> files;
    bool exists = false;
};

nlohmann::json ToJson(const ExecutionResult& result);
nlohmann::json ToJson(const SessionInfo& info);

}  // namespace runbox::sandbox
