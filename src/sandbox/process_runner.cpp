#include "sandbox/process_runner.hpp"

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

std::atomic<std::uint64_t> g_script_counter{0};

std::string RandomToken() {
    static const char kChars[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string token;
    token.reserve(8);
    for (int i = 0; i < 8; ++i) {
        token.push_back(kChars[dist(gen)]);
    }
    return token;
}

std::string TimestampForName() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count() % 1000000000;
    std::tm local_time{};
    localtime_r(&time, &local_time);
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y%m%d_%H%M%S")
        << "_" << std::setw(9) << std::setfill('0') << nanos;
    return oss.str();
}

// Removes the file it owns when it goes out of scope. Failures are ignored.
class ScopedFile {
public:
    explicit ScopedFile(std::filesystem::path path)
        : path_(std::move(path)) {}
    ~ScopedFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Polls until the child exits or the deadline passes. Returns true if it
// exited; ec is set when polling itself failed.
bool WaitUntil(bp::child& child_process,
               std::chrono::steady_clock::time_point deadline,
               std::chrono::milliseconds poll_interval,
               std::error_code& ec) {
    while (true) {
        if (!child_process.running(ec)) {
            return !ec;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(poll_interval, remaining));
    }
}

// False when adding the duration to the steady clock would overflow.
bool FitsSteadyClock(std::chrono::milliseconds duration) {
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - std::chrono::steady_clock::now());
    return duration < headroom;
}

void TerminateGroup(bp::child& child_process, std::chrono::milliseconds grace,
                    std::chrono::milliseconds poll_interval) {
    const pid_t pid = child_process.id();
    std::error_code ec;
    ::killpg(pid, SIGTERM);
    WaitUntil(child_process, std::chrono::steady_clock::now() + grace, poll_interval, ec);
    // Descendants may outlive the direct child; the group gets SIGKILL either way.
    if (::killpg(pid, SIGKILL) != 0 && child_process.running(ec)) {
        child_process.terminate(ec);
    }
    child_process.wait(ec);
}

}  // namespace

const char* ToString(RunStatus status) {
    switch (status) {
        case RunStatus::kCompleted: return "completed";
        case RunStatus::kTimedOut: return "timed_out";
        case RunStatus::kFailed: return "failed";
    }
    return "unknown";
}

ProcessRunner::ProcessRunner(ProcessRunnerOptions options)
    : options_(std::move(options)) {}

std::string ProcessRunner::NextScriptName() const {
    std::ostringstream oss;
    oss << kScriptPrefix << TimestampForName()
        << "_" << ::getpid()
        << "_" << g_script_counter.fetch_add(1)
        << "_" << RandomToken()
        << options_.script_suffix;
    return oss.str();
}

bool ProcessRunner::IsScriptFileName(const std::string& name) {
    return name.rfind(kScriptPrefix, 0) == 0;
}

std::optional<std::string> ProcessRunner::ResolveInterpreter(const std::string& interpreter) {
    if (interpreter.empty()) {
        return std::nullopt;
    }
    if (interpreter.find('/') != std::string::npos) {
        if (::access(interpreter.c_str(), X_OK) == 0) {
            return interpreter;
        }
        return std::nullopt;
    }
    const auto found = bp::search_path(interpreter);
    if (found.empty()) {
        return std::nullopt;
    }
    return found.string();
}

RunOutcome ProcessRunner::RunCode(const std::string& code,
                                  const std::filesystem::path& working_dir,
                                  std::optional<std::chrono::milliseconds> deadline,
                                  const Environment& env) const {
    ScopedFile script(working_dir / NextScriptName());
    {
        std::ofstream output(script.Path(), std::ios::binary | std::ios::trunc);
        if (!output.is_open()) {
            RunOutcome outcome{};
            outcome.error = "Execution error: cannot write script file " + script.Path().string();
            return outcome;
        }
        output << code;
        output.flush();
        if (!output) {
            RunOutcome outcome{};
            outcome.error = "Execution error: failed to write script file " + script.Path().string();
            return outcome;
        }
    }
    return Run(script.Path(), working_dir, env, deadline);
}

RunOutcome ProcessRunner::Run(const std::filesystem::path& script_path,
                              const std::filesystem::path& working_dir,
                              const Environment& env,
                              std::optional<std::chrono::milliseconds> deadline) const {
    RunOutcome outcome{};

    const auto interpreter = ResolveInterpreter(options_.interpreter);
    if (!interpreter) {
        outcome.error = "Execution error: interpreter not found: " + options_.interpreter;
        return outcome;
    }

    std::error_code temp_ec;
    auto temp_dir = std::filesystem::temp_directory_path(temp_ec);
    if (temp_ec) {
        temp_dir = "/tmp";
    }
    const auto stamp = TimestampForName() + "_" + std::to_string(::getpid()) + "_" + RandomToken();
    const ScopedFile stdout_file(temp_dir / ("runbox_stdout_" + stamp + ".log"));
    const ScopedFile stderr_file(temp_dir / ("runbox_stderr_" + stamp + ".log"));

    bp::environment child_env = boost::this_process::environment();
    for (const auto& [key, value] : env) {
        child_env[key] = value;
    }
    if (!options_.search_path_var.empty()) {
        child_env[options_.search_path_var] = working_dir.string();
    }

    std::vector<std::string> args = options_.interpreter_args;
    args.push_back(script_path.string());

    try {
        bp::child child_process(
            bp::exe = *interpreter,
            bp::args = args,
            child_env,
            bp::start_dir = working_dir.string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_file.Path().string(),
            bp::std_err > stderr_file.Path().string(),
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
        // Same call from the parent so killpg cannot race the child's exec setup.
        ::setpgid(child_process.id(), child_process.id());

        std::error_code ec;
        bool finished = false;
        if (!deadline || !FitsSteadyClock(*deadline)) {
            child_process.wait(ec);
            finished = !ec;
        } else {
            const auto until = std::chrono::steady_clock::now() + *deadline;
            finished = WaitUntil(child_process, until, options_.poll_interval, ec);
            if (!finished && !ec) {
                utils::Log("runner", utils::LogMessage{
                    utils::LogLevel::kDebug,
                    "deadline reached, terminating process group",
                    {{"pid", std::to_string(child_process.id())},
                     {"deadline", utils::FormatSeconds(*deadline)}}});
                TerminateGroup(child_process, options_.kill_grace, options_.poll_interval);
                outcome.status = RunStatus::kTimedOut;
            }
        }

        if (finished) {
            outcome.status = RunStatus::kCompleted;
            outcome.exit_code = DecodeStatus(child_process.native_exit_code());
        } else if (outcome.status != RunStatus::kTimedOut) {
            TerminateGroup(child_process, std::chrono::milliseconds(0), options_.poll_interval);
            outcome.error = "Execution error: waiting for process failed: " + ec.message() + "\n";
        }
    } catch (const bp::process_error& ex) {
        outcome.status = RunStatus::kFailed;
        outcome.exit_code = -1;
        outcome.error = std::string("Execution error: failed to start ") + *interpreter + ": " + ex.what();
        return outcome;
    }

    outcome.output = ReadFile(stdout_file.Path());
    const auto captured_error = ReadFile(stderr_file.Path());
    if (outcome.status == RunStatus::kTimedOut) {
        outcome.exit_code = -1;
        outcome.error = "Execution timeout (" + utils::FormatSeconds(*deadline) + " exceeded)\n" +
                        captured_error;
    } else {
        outcome.error += captured_error;
    }
    return outcome;
}

}  // namespace runbox::sandbox
