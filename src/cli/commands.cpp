#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "errors.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  runbox run <session> [--timeout S] [--context JSON] [--no-artifacts] [--file PATH | CODE]\n"
              << "  runbox info <session>\n"
              << "  runbox files <session>\n"
              << "  runbox clear <session>\n"
              << "  runbox sessions" << std::endl;
}

void PrintJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

std::optional<std::string> ReadFileText(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

int RunCommand(const runbox::sandbox::SandboxEngine& engine,
               const runbox::config::Config& config,
               const std::vector<std::string>& args) {
    if (args.empty()) {
        PrintUsage();
        return 2;
    }
    runbox::sandbox::ExecutionRequest request{};
    request.session_id = runbox::utils::Trim(args[0]);
    if (config.sandbox.default_timeout_s > 0) {
        request.timeout = std::chrono::seconds(config.sandbox.default_timeout_s);
    }

    std::optional<std::string> code;
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--timeout" && i + 1 < args.size()) {
            request.timeout = runbox::utils::ParseSeconds(args[++i]);
            if (!request.timeout) {
                std::cerr << "invalid timeout: " << args[i] << std::endl;
                return 2;
            }
        } else if (arg == "--context" && i + 1 < args.size()) {
            request.context = nlohmann::json::parse(args[++i], nullptr, false);
            if (request.context.is_discarded()) {
                std::cerr << "invalid context JSON" << std::endl;
                return 2;
            }
        } else if (arg == "--no-artifacts") {
            request.capture_artifacts = false;
        } else if (arg == "--file" && i + 1 < args.size()) {
            code = ReadFileText(args[++i]);
            if (!code) {
                std::cerr << "cannot read " << args[i] << std::endl;
                return 2;
            }
        } else {
            code = arg;
        }
    }
    if (!code) {
        code = std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    request.code = runbox::utils::Trim(*code);

    const auto result = engine.Execute(request);
    PrintJson(runbox::sandbox::ToJson(result));
    return result.success ? 0 : 1;
}

int SessionCommand(const runbox::sandbox::SandboxEngine& engine,
                   const std::string& command,
                   const std::string& session_id) {
    if (command == "info") {
        PrintJson(runbox::sandbox::ToJson(engine.GetSessionInfo(session_id)));
        return 0;
    }
    if (command == "files") {
        PrintJson({{"session_id", session_id}, {"files", engine.ListFiles(session_id)}});
        return 0;
    }
    const bool cleared = engine.ClearSession(session_id);
    PrintJson({
        {"success", cleared},
        {"message", cleared ? "Session '" + session_id + "' cleared successfully"
                            : "Session '" + session_id + "' not found"}
    });
    return cleared ? 0 : 1;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    const auto config = runbox::config::LoadConfig();
    runbox::utils::LogConfig log_config{};
    if (auto level = runbox::utils::ParseLogLevel(config.logging.level)) {
        log_config.min_level = *level;
    }
    runbox::utils::ConfigureLogging(log_config);

    const auto engine = runbox::sandbox::SandboxEngine::FromConfig(config);
    runbox::utils::Log(runbox::utils::LogLevel::kDebug, "runbox",
                       "sessions directory " + engine.Store().BaseDir().string());

    try {
        if (command == "run") {
            return RunCommand(engine, config, args);
        }
        if (command == "sessions") {
            const auto sessions = engine.ListSessions();
            PrintJson({{"success", true}, {"sessions", sessions}, {"count", sessions.size()}});
            return 0;
        }
        if ((command == "info" || command == "files" || command == "clear") && args.size() == 1) {
            return SessionCommand(engine, command, runbox::utils::Trim(args[0]));
        }
    } catch (const runbox::InvalidSessionKeyError& ex) {
        PrintJson({{"success", false}, {"message", ex.what()}});
        return 1;
    } catch (const runbox::StorageError& ex) {
        runbox::utils::Log(runbox::utils::LogLevel::kError, "runbox", ex.what());
        PrintJson({{"success", false}, {"message", ex.what()}});
        return 1;
    }

    PrintUsage();
    return 2;
}
