#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/safety_check.hpp"
#include "session/session_store.hpp"

namespace runbox::sandbox {

// Runs scripts in per-session working directories. Build one engine at
// start-up and hand it to whoever needs it; it holds no per-execution state,
// so Execute may be called from several threads. Executions against the same
// session share its directory without any locking.
class SandboxEngine {
public:
    SandboxEngine(session::SessionStore store,
                  ProcessRunner runner,
                  std::unique_ptr<SafetyCheck> safety_check = nullptr);

    static SandboxEngine FromConfig(const config::Config& config);

    // Never throws. Every failure, including invalid input and filesystem
    // faults, comes back as an error result with stderr describing it.
    ExecutionResult Execute(const ExecutionRequest& request) const;

    // The following throw InvalidSessionKeyError or StorageError.
    SessionInfo GetSessionInfo(const std::string& session_id) const;
    bool ClearSession(const std::string& session_id) const;
    std::vector<std::string> ListSessions() const;
    std::vector<std::string> ListFiles(const std::string& session_id) const;

    const session::SessionStore& Store() const { return store_; }
    const ProcessRunner& Runner() const { return runner_; }
    bool HasSafetyCheck() const { return safety_check_ != nullptr; }

private:
    ExecutionState ExecuteInternal(const ExecutionRequest& request, ExecutionResult& result) const;

    session::SessionStore store_;
    ProcessRunner runner_;
    std::unique_ptr<SafetyCheck> safety_check_;
};

}  // namespace runbox::sandbox
