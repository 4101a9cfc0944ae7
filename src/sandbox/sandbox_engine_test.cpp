#include "sandbox/sandbox_engine.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include "errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test_support/temp_dir.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MatchesRegex;
using ::testing::StartsWith;

using runbox::sandbox::BlockedTokenCheck;
using runbox::sandbox::ExecutionRequest;
using runbox::sandbox::ExecutionResult;
using runbox::sandbox::ExecutionState;
using runbox::sandbox::ProcessRunner;
using runbox::sandbox::ProcessRunnerOptions;
using runbox::sandbox::SandboxEngine;
using runbox::session::SessionStore;
using runbox::test_support::ReadFile;
using runbox::test_support::TempDir;
using runbox::test_support::WriteFile;

using namespace std::chrono_literals;

ProcessRunnerOptions ShellOptions() {
    ProcessRunnerOptions options{};
    options.interpreter = "/bin/sh";
    options.script_suffix = ".sh";
    options.kill_grace = 200ms;
    options.poll_interval = 5ms;
    return options;
}

ExecutionRequest Request(const std::string& session_id, const std::string& code) {
    ExecutionRequest request{};
    request.session_id = session_id;
    request.code = code;
    request.timeout = 10s;
    return request;
}

class SandboxEngineTest : public ::testing::Test {
protected:
    SandboxEngineTest()
        : tmp_("engine")
        , engine_(SessionStore(tmp_.Path() / "sessions"), ProcessRunner(ShellOptions())) {}

    std::filesystem::path SessionsDir() const { return tmp_.Path() / "sessions"; }

    TempDir tmp_;
    SandboxEngine engine_;
};

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, SuccessfulExecution) {
    const auto result = engine_.Execute(Request("s1", "echo hello"));
    EXPECT_TRUE(result.success);
    EXPECT_STREQ(result.Status(), "success");
    EXPECT_EQ(result.returncode, 0);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_EQ(result.session_dir, (SessionsDir() / "s1").string());
    EXPECT_EQ(result.terminal_state, ExecutionState::kCompleted);
    EXPECT_GE(result.execution_time, 0.0);
    EXPECT_THAT(result.timestamp, MatchesRegex("[0-9]{4}-.*T.*\\.[0-9]{6}"));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, ResultJsonShape) {
    const auto json = runbox::sandbox::ToJson(engine_.Execute(Request("s1", "echo hi > out.txt")));
    EXPECT_EQ(json.at("status"), "success");
    EXPECT_EQ(json.at("returncode"), 0);
    EXPECT_EQ(json.at("stdout"), "");
    EXPECT_EQ(json.at("stderr"), "");
    EXPECT_EQ(json.at("artifacts").at("files"), nlohmann::json::array({"out.txt"}));
    EXPECT_EQ(json.at("artifacts").at("session_dir"), (SessionsDir() / "s1").string());
    EXPECT_TRUE(json.at("execution_time").is_number());
    EXPECT_TRUE(json.at("timestamp").is_string());
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, FilesPersistAcrossExecutions) {
    ASSERT_TRUE(engine_.Execute(Request("s1", "printf persisted > state.txt")).success);
    const auto result = engine_.Execute(Request("s1", "cat state.txt"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "persisted");
    EXPECT_THAT(result.files, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, SessionsAreIsolated) {
    ASSERT_TRUE(engine_.Execute(Request("alice", "echo secret > data.txt")).success);
    const auto result = engine_.Execute(Request("bob", "cat data.txt"));
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.returncode, 0);
    EXPECT_THAT(result.stderr_text, HasSubstr("data.txt"));
    EXPECT_THAT(engine_.ListFiles("bob"), IsEmpty());
    EXPECT_THAT(engine_.ListFiles("alice"), ElementsAre("data.txt"));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, ReportsOnlyNewArtifacts) {
    ASSERT_TRUE(engine_.Execute(Request("s1", "echo v1 > existing.txt")).success);
    const auto result = engine_.Execute(Request(
        "s1",
        "echo v2 > existing.txt\n"
        "echo b > b.txt\n"
        "echo a > a.txt\n"
        "mkdir nested\n"
        "echo h > .hidden\n"));
    EXPECT_TRUE(result.success);
    EXPECT_THAT(result.files, ElementsAre("a.txt", "b.txt"));
    EXPECT_EQ(ReadFile(SessionsDir() / "s1" / "existing.txt"), "v2\n");
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, CaptureArtifactsDisabled) {
    auto request = Request("s1", "echo x > made.txt");
    request.capture_artifacts = false;
    const auto result = engine_.Execute(request);
    EXPECT_TRUE(result.success);
    EXPECT_THAT(result.files, IsEmpty());
    EXPECT_TRUE(std::filesystem::exists(SessionsDir() / "s1" / "made.txt"));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, FailingScriptIsAnErrorWithItsExitCode) {
    const auto result = engine_.Execute(Request("s1", "echo partial\necho boom >&2\nexit 4"));
    EXPECT_FALSE(result.success);
    EXPECT_STREQ(result.Status(), "error");
    EXPECT_EQ(result.returncode, 4);
    EXPECT_EQ(result.stdout_text, "partial\n");
    EXPECT_EQ(result.stderr_text, "boom\n");
    EXPECT_EQ(result.terminal_state, ExecutionState::kCompleted);
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, TimeoutIsBoundedAndReported) {
    auto request = Request("s1", "echo before\nsleep 10\necho after");
    request.timeout = 250ms;
    const auto result = engine_.Execute(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, -1);
    EXPECT_EQ(result.stdout_text, "before\n");
    EXPECT_THAT(result.stderr_text, StartsWith("Execution timeout (0.25s exceeded)"));
    EXPECT_EQ(result.terminal_state, ExecutionState::kTimedOut);
    EXPECT_LT(result.execution_time, 5.0);
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, InvalidSessionKeysTouchNothing) {
    for (const std::string key : {"..", "../escape", "a/b", "a\\b"}) {
        const auto result = engine_.Execute(Request(key, "echo pwned > pwned.txt"));
        EXPECT_FALSE(result.success) << key;
        EXPECT_EQ(result.returncode, -1) << key;
        EXPECT_EQ(result.stderr_text, "Session ID contains invalid characters") << key;
        EXPECT_EQ(result.terminal_state, ExecutionState::kFailed) << key;
    }
    EXPECT_FALSE(std::filesystem::exists(SessionsDir()));
    EXPECT_FALSE(std::filesystem::exists(tmp_.Path() / "pwned.txt"));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, EmptyInputsAreRejected) {
    auto result = engine_.Execute(Request("s1", "  \n\t"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stderr_text, "Code cannot be empty");

    result = engine_.Execute(Request(" ", "echo hi"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.stderr_text, "Session ID cannot be empty");
    EXPECT_FALSE(std::filesystem::exists(SessionsDir()));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, NonObjectContextIsRejectedBeforeRunning) {
    auto request = Request("s1", "touch ran.txt");
    request.context = nlohmann::json::array({1, 2});
    const auto result = engine_.Execute(request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, -1);
    EXPECT_THAT(result.stderr_text, StartsWith("Context serialization error: "));
    EXPECT_FALSE(std::filesystem::exists(SessionsDir() / "s1" / "ran.txt"));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, StorageFailureBecomesErrorResult) {
    WriteFile(tmp_.Path() / "blocker", "a file where a directory should be");
    SandboxEngine engine(SessionStore(tmp_.Path() / "blocker" / "sessions"), ProcessRunner(ShellOptions()));
    const auto result = engine.Execute(Request("s1", "echo hi"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, -1);
    EXPECT_THAT(result.stderr_text, StartsWith("Storage error: "));
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, MissingInterpreterBecomesErrorResult) {
    auto options = ShellOptions();
    options.interpreter = "runbox-no-such-interpreter";
    SandboxEngine engine((SessionStore(SessionsDir())), ProcessRunner(options));
    const auto result = engine.Execute(Request("s1", "echo hi"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, -1);
    EXPECT_THAT(result.stderr_text, HasSubstr("interpreter not found"));
    EXPECT_EQ(result.terminal_state, ExecutionState::kFailed);
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, SafetyCheckRejectsBeforeSessionIsCreated) {
    SandboxEngine engine(SessionStore(SessionsDir()), ProcessRunner(ShellOptions()),
                         std::make_unique<BlockedTokenCheck>(std::vector<std::string>{"rm -rf"}));
    EXPECT_TRUE(engine.HasSafetyCheck());
    const auto result = engine.Execute(Request("s1", "rm -rf /tmp/nothing"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, -1);
    EXPECT_EQ(result.stderr_text, "Code safety check failed: blocked token 'rm -rf'");
    EXPECT_FALSE(std::filesystem::exists(SessionsDir()));

    EXPECT_TRUE(engine.Execute(Request("s1", "echo fine")).success);
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, SessionManagement) {
    ASSERT_TRUE(engine_.Execute(Request("zeta", "echo z > z.txt")).success);
    ASSERT_TRUE(engine_.Execute(Request("alpha", "echo a > a.txt")).success);
    EXPECT_THAT(engine_.ListSessions(), ElementsAre("alpha", "zeta"));

    const auto info = engine_.GetSessionInfo("zeta");
    EXPECT_EQ(info.session_id, "zeta");
    EXPECT_EQ(info.session_dir, (SessionsDir() / "zeta").string());
    EXPECT_THAT(info.files, ElementsAre("z.txt"));
    EXPECT_TRUE(info.exists);

    EXPECT_TRUE(engine_.ClearSession("zeta"));
    EXPECT_FALSE(engine_.ClearSession("zeta"));
    EXPECT_THAT(engine_.ListFiles("zeta"), IsEmpty());
    EXPECT_THAT(engine_.ListSessions(), ElementsAre("alpha"));

    const auto fresh = engine_.Execute(Request("zeta", "ls"));
    EXPECT_TRUE(fresh.success);
    EXPECT_THAT(fresh.stdout_text, StartsWith(ProcessRunner::kScriptPrefix));
    EXPECT_THAT(fresh.files, IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(SandboxEngineTest, SessionManagementRejectsInvalidKeys) {
    EXPECT_THROW(engine_.ClearSession(".."), runbox::InvalidSessionKeyError);  // NOLINT
    EXPECT_THROW(engine_.GetSessionInfo("a/b"), runbox::InvalidSessionKeyError);  // NOLINT
    EXPECT_THROW(engine_.ListFiles(""), runbox::InvalidSessionKeyError);  // NOLINT
}

// NOLINTNEXTLINE
TEST(SandboxEngineFromConfig, BuildsFromConfig) {
    TempDir tmp("engine_config");
    runbox::config::Config config{};
    config.sandbox.sessions_dir = (tmp.Path() / "data").string();
    config.sandbox.interpreter = "/bin/sh";
    config.sandbox.script_suffix = ".sh";
    config.sandbox.kill_grace_ms = -5;
    config.sandbox.poll_interval_ms = 0;
    config.safety.enabled = true;

    const auto engine = SandboxEngine::FromConfig(config);
    EXPECT_EQ(engine.Store().BaseDir(), tmp.Path() / "data");
    EXPECT_EQ(engine.Runner().Options().kill_grace, 0ms);
    EXPECT_EQ(engine.Runner().Options().poll_interval, 1ms);
    EXPECT_TRUE(engine.HasSafetyCheck());

    const auto result = engine.Execute(Request("s", "echo subprocess"));
    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.stderr_text, HasSubstr("blocked token 'subprocess'"));
}

class PythonSandboxTest : public ::testing::Test {
protected:
    PythonSandboxTest()
        : tmp_("engine_python")
        , engine_(SessionStore(tmp_.Path() / "sessions"), ProcessRunner()) {}

    void SetUp() override {
        if (!ProcessRunner::ResolveInterpreter("python3")) {
            GTEST_SKIP() << "python3 not available";
        }
    }

    TempDir tmp_;
    SandboxEngine engine_;
};

// NOLINTNEXTLINE
TEST_F(PythonSandboxTest, ContextValuesAreGlobals) {
    auto request = Request("py", "print(f'hello {name} {n + 1} {len(items)} {_context[\"name\"]}')");
    request.context = {{"name", "world"}, {"n", 41}, {"items", {1, 2, 3}}};
    const auto result = engine_.Execute(request);
    EXPECT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "hello world 42 3 world\n");
}

// NOLINTNEXTLINE
TEST_F(PythonSandboxTest, ContextStringsAreNotEvaluated) {
    auto request = Request("py", "print(payload)");
    request.context = {{"payload", "\"); import sys; sys.exit(9); (\""}};
    const auto result = engine_.Execute(request);
    EXPECT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "\"); import sys; sys.exit(9); (\"\n");
}

// NOLINTNEXTLINE
TEST_F(PythonSandboxTest, ContextKeyMayShadowPreambleNames) {
    auto request = Request("py", "print(_runbox_json, value)");
    request.context = {{"_runbox_json", "kept"}, {"value", 1}};
    const auto result = engine_.Execute(request);
    EXPECT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "kept 1\n");
}

// NOLINTNEXTLINE
TEST_F(PythonSandboxTest, SessionDirectoryIsImportable) {
    ASSERT_TRUE(engine_.Execute(Request("py", "open('helper.py', 'w').write('VALUE = 7\\n')")).success);
    const auto result = engine_.Execute(Request("py", "import helper\nprint(helper.VALUE * 6)"));
    EXPECT_TRUE(result.success) << result.stderr_text;
    EXPECT_EQ(result.stdout_text, "42\n");
}

// NOLINTNEXTLINE
TEST_F(PythonSandboxTest, ExceptionsReachStderr) {
    const auto result = engine_.Execute(Request("py", "1 / 0"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.returncode, 1);
    EXPECT_THAT(result.stderr_text, HasSubstr("ZeroDivisionError"));
}

}  // namespace
