#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace runbox::sandbox {

struct ProcessRunnerOptions {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args;
    std::string script_suffix = ".py";
    // Set to the working directory in the child's environment.
    std::string search_path_var = "PYTHONPATH";
    std::chrono::milliseconds kill_grace{500};
    std::chrono::milliseconds poll_interval{10};
};

enum class RunStatus {
    kCompleted,
    kTimedOut,
    kFailed
};

const char* ToString(RunStatus status);

struct RunOutcome {
    RunStatus status = RunStatus::kFailed;
    int exit_code = -1;
    std::string output;
    std::string error;
};

using Environment = std::map<std::string, std::string>;

class ProcessRunner {
public:
    static constexpr const char* kScriptPrefix = "_exec_";

    explicit ProcessRunner(ProcessRunnerOptions options = {});

    // Writes code to a freshly named script file inside working_dir, runs it
    // and removes the file again on every path.
    RunOutcome RunCode(const std::string& code,
                       const std::filesystem::path& working_dir,
                       std::optional<std::chrono::milliseconds> deadline,
                       const Environment& env = {}) const;

    // Runs the interpreter on an existing script. The child gets its own
    // process group; on deadline expiry the whole group receives SIGTERM,
    // then SIGKILL after the grace period. A deadline too long for the steady
    // clock is treated as no deadline. Never throws.
    RunOutcome Run(const std::filesystem::path& script_path,
                   const std::filesystem::path& working_dir,
                   const Environment& env,
                   std::optional<std::chrono::milliseconds> deadline) const;

    // Unique within the process and across processes: timestamp, pid,
    // counter and a random token.
    std::string NextScriptName() const;

    static bool IsScriptFileName(const std::string& name);
    static std::optional<std::string> ResolveInterpreter(const std::string& interpreter);

    const ProcessRunnerOptions& Options() const { return options_; }

private:
    ProcessRunnerOptions options_;
};

}  // namespace runbox::sandbox
