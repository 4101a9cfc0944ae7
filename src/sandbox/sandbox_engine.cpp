#include "sandbox/sandbox_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#include "errors.hpp"
#include "sandbox/artifact_tracker.hpp"
#include "sandbox/context_injector.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

const char* kTag = "engine";

void LogTransition(const std::string& session_id, ExecutionState state) {
    utils::Log(kTag, utils::LogMessage{
        utils::LogLevel::kDebug,
        "state",
        {{"session", session_id}, {"state", ToString(state)}}});
}

ExecutionState FromRunStatus(RunStatus status) {
    switch (status) {
        case RunStatus::kCompleted: return ExecutionState::kCompleted;
        case RunStatus::kTimedOut: return ExecutionState::kTimedOut;
        case RunStatus::kFailed: return ExecutionState::kFailed;
    }
    return ExecutionState::kFailed;
}

ExecutionState Reject(ExecutionResult& result, std::string message) {
    result.success = false;
    result.returncode = -1;
    result.stderr_text = std::move(message);
    return ExecutionState::kFailed;
}

}  // namespace

SandboxEngine::SandboxEngine(session::SessionStore store,
                             ProcessRunner runner,
                             std::unique_ptr<SafetyCheck> safety_check)
    : store_(std::move(store))
    , runner_(std::move(runner))
    , safety_check_(std::move(safety_check)) {}

SandboxEngine SandboxEngine::FromConfig(const config::Config& config) {
    ProcessRunnerOptions options{};
    options.interpreter = config.sandbox.interpreter;
    options.interpreter_args = config.sandbox.interpreter_args;
    options.script_suffix = config.sandbox.script_suffix;
    options.search_path_var = config.sandbox.search_path_var;
    options.kill_grace = std::chrono::milliseconds(std::max(0, config.sandbox.kill_grace_ms));
    options.poll_interval = std::chrono::milliseconds(std::max(1, config.sandbox.poll_interval_ms));

    std::unique_ptr<SafetyCheck> safety_check;
    if (config.safety.enabled) {
        if (config.safety.blocked_tokens.empty()) {
            safety_check = std::make_unique<BlockedTokenCheck>();
        } else {
            safety_check = std::make_unique<BlockedTokenCheck>(config.safety.blocked_tokens);
        }
    }
    return SandboxEngine(
        session::SessionStore(config.sandbox.sessions_dir),
        ProcessRunner(std::move(options)),
        std::move(safety_check));
}

ExecutionResult SandboxEngine::Execute(const ExecutionRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result{};
    result.timestamp = utils::ToIsoString(utils::Now());

    ExecutionState terminal = ExecutionState::kFailed;
    try {
        terminal = ExecuteInternal(request, result);
    } catch (const StorageError& ex) {
        utils::Log(utils::LogLevel::kError, kTag, ex.what());
        terminal = Reject(result, std::string("Storage error: ") + ex.what());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, kTag,
                   std::string("unexpected failure: ") + ex.what());
        terminal = Reject(result, std::string("Execution error: ") + ex.what());
    }

    result.terminal_state = terminal;
    result.execution_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    LogTransition(request.session_id, ExecutionState::kFinalized);

    utils::Log(kTag, utils::LogMessage{
        terminal == ExecutionState::kTimedOut ? utils::LogLevel::kWarn : utils::LogLevel::kInfo,
        "execution finished",
        {{"session", request.session_id},
         {"status", result.Status()},
         {"returncode", std::to_string(result.returncode)},
         {"state", ToString(terminal)},
         {"artifacts", std::to_string(result.files.size())},
         {"seconds", std::to_string(result.execution_time)}}});
    return result;
}

ExecutionState SandboxEngine::ExecuteInternal(const ExecutionRequest& request,
                                              ExecutionResult& result) const {
    LogTransition(request.session_id, ExecutionState::kCreated);

    if (utils::Trim(request.code).empty()) {
        utils::Log(utils::LogLevel::kWarn, kTag, "rejected request: empty code");
        return Reject(result, "Code cannot be empty");
    }
    if (auto error = session::SessionStore::ValidateKey(request.session_id)) {
        utils::Log(utils::LogLevel::kWarn, kTag, "rejected request: " + *error);
        return Reject(result, *error);
    }
    if (safety_check_) {
        const auto verdict = safety_check_->Check(request.code);
        if (!verdict.accepted) {
            utils::Log(utils::LogLevel::kWarn, kTag, verdict.message);
            return Reject(result, verdict.message);
        }
    }

    std::filesystem::path session_dir;
    try {
        session_dir = store_.Resolve(request.session_id);
    } catch (const StorageError& ex) {
        utils::Log(utils::LogLevel::kError, kTag, ex.what());
        return Reject(result, std::string("Storage error: ") + ex.what());
    }
    result.session_dir = session_dir.string();

    DirectorySnapshot before{};
    if (request.capture_artifacts) {
        before = ArtifactTracker::Snapshot(session_dir);
    }

    std::string code;
    try {
        code = ContextInjector::Inject(request.code, request.context);
    } catch (const ContextSerializationError& ex) {
        utils::Log(utils::LogLevel::kError, kTag, std::string("context rejected: ") + ex.what());
        return Reject(result, std::string("Context serialization error: ") + ex.what());
    }

    LogTransition(request.session_id, ExecutionState::kRunning);
    const auto outcome = runner_.RunCode(code, session_dir, request.timeout);
    const auto terminal = FromRunStatus(outcome.status);
    LogTransition(request.session_id, terminal);

    result.returncode = outcome.exit_code;
    result.success = terminal == ExecutionState::kCompleted && outcome.exit_code == 0;
    result.stdout_text = outcome.output;
    result.stderr_text = outcome.error;

    if (request.capture_artifacts) {
        const auto after = ArtifactTracker::Snapshot(session_dir);
        result.files = ArtifactTracker::Diff(before, after, &ProcessRunner::IsScriptFileName);
    }
    return terminal;
}

SessionInfo SandboxEngine::GetSessionInfo(const std::string& session_id) const {
    SessionInfo info{};
    info.session_id = session_id;
    info.session_dir = store_.Resolve(session_id).string();
    info.files = store_.ListFiles(session_id);
    info.exists = store_.Exists(session_id);
    return info;
}

bool SandboxEngine::ClearSession(const std::string& session_id) const {
    const bool cleared = store_.Clear(session_id);
    utils::Log(kTag, utils::LogMessage{
        utils::LogLevel::kInfo,
        "clear session",
        {{"session", session_id}, {"removed", cleared ? "true" : "false"}}});
    return cleared;
}

std::vector<std::string> SandboxEngine::ListSessions() const {
    auto sessions = store_.ListSessions();
    std::sort(sessions.begin(), sessions.end());
    return sessions;
}

std::vector<std::string> SandboxEngine::ListFiles(const std::string& session_id) const {
    return store_.ListFiles(session_id);
}

}  // namespace runbox::sandbox
