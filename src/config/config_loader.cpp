#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("RUNBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".runbox" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

std::vector<std::string> ReadStringArray(const nlohmann::json& source) {
    std::vector<std::string> items;
    for (const auto& item : source) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("sessionsDir") && sandbox["sessionsDir"].is_string()) {
            config.sandbox.sessions_dir = sandbox["sessionsDir"].get<std::string>();
        }
        if (sandbox.contains("interpreter") && sandbox["interpreter"].is_string()) {
            config.sandbox.interpreter = sandbox["interpreter"].get<std::string>();
        }
        if (sandbox.contains("interpreterArgs") && sandbox["interpreterArgs"].is_array()) {
            config.sandbox.interpreter_args = ReadStringArray(sandbox["interpreterArgs"]);
        }
        if (sandbox.contains("scriptSuffix") && sandbox["scriptSuffix"].is_string()) {
            config.sandbox.script_suffix = sandbox["scriptSuffix"].get<std::string>();
        }
        if (sandbox.contains("searchPathVar") && sandbox["searchPathVar"].is_string()) {
            config.sandbox.search_path_var = sandbox["searchPathVar"].get<std::string>();
        }
        if (sandbox.contains("defaultTimeoutS") && sandbox["defaultTimeoutS"].is_number_integer()) {
            config.sandbox.default_timeout_s = sandbox["defaultTimeoutS"].get<int>();
        }
        if (sandbox.contains("killGraceMs") && sandbox["killGraceMs"].is_number_integer()) {
            config.sandbox.kill_grace_ms = sandbox["killGraceMs"].get<int>();
        }
        if (sandbox.contains("pollIntervalMs") && sandbox["pollIntervalMs"].is_number_integer()) {
            config.sandbox.poll_interval_ms = sandbox["pollIntervalMs"].get<int>();
        }
    }

    if (data.contains("safety") && data["safety"].is_object()) {
        const auto& safety = data["safety"];
        if (safety.contains("enabled") && safety["enabled"].is_boolean()) {
            config.safety.enabled = safety["enabled"].get<bool>();
        }
        if (safety.contains("blockedTokens") && safety["blockedTokens"].is_array()) {
            config.safety.blocked_tokens = ReadStringArray(safety["blockedTokens"]);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto sessions_dir = GetEnvFallback(
        "RUNBOX_SANDBOX__SESSIONS_DIR",
        "SESSIONS_DIR");
    if (!sessions_dir.empty()) {
        config.sandbox.sessions_dir = sessions_dir;
    }

    const auto interpreter = GetEnvFallback(
        "RUNBOX_SANDBOX__INTERPRETER",
        "RUNBOX_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        config.sandbox.interpreter = interpreter;
    }

    const auto default_timeout = GetEnvFallback(
        "RUNBOX_SANDBOX__DEFAULT_TIMEOUT_S",
        "RUNBOX_SANDBOX_DEFAULT_TIMEOUT_S");
    if (!default_timeout.empty()) {
        config.sandbox.default_timeout_s = ParseInt(default_timeout, config.sandbox.default_timeout_s);
    }

    const auto kill_grace = GetEnvFallback(
        "RUNBOX_SANDBOX__KILL_GRACE_MS",
        "RUNBOX_SANDBOX_KILL_GRACE_MS");
    if (!kill_grace.empty()) {
        config.sandbox.kill_grace_ms = ParseInt(kill_grace, config.sandbox.kill_grace_ms);
    }

    const auto poll_interval = GetEnvFallback(
        "RUNBOX_SANDBOX__POLL_INTERVAL_MS",
        "RUNBOX_SANDBOX_POLL_INTERVAL_MS");
    if (!poll_interval.empty()) {
        config.sandbox.poll_interval_ms = ParseInt(poll_interval, config.sandbox.poll_interval_ms);
    }

    const auto search_path_var = GetEnvFallback(
        "RUNBOX_SANDBOX__SEARCH_PATH_VAR",
        "RUNBOX_SANDBOX_SEARCH_PATH_VAR");
    if (!search_path_var.empty()) {
        config.sandbox.search_path_var = search_path_var;
    }

    const auto safety_enabled = GetEnvFallback(
        "RUNBOX_SAFETY__ENABLED",
        "RUNBOX_SAFETY_ENABLED");
    if (!safety_enabled.empty()) {
        config.safety.enabled = ParseBool(safety_enabled);
    }

    const auto blocked_tokens = GetEnvFallback(
        "RUNBOX_SAFETY__BLOCKED_TOKENS",
        "RUNBOX_SAFETY_BLOCKED_TOKENS");
    if (!blocked_tokens.empty()) {
        config.safety.blocked_tokens = utils::SplitCsv(blocked_tokens);
    }

    const auto log_level = GetEnvFallback(
        "RUNBOX_LOGGING__LEVEL",
        "RUNBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfigFrom(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "ignoring malformed config file " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfigFrom(GetConfigPath());
}

}  // namespace runbox::config
