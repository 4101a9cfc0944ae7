#pragma once

#include <string>
#include <vector>

namespace runbox::config {

struct SandboxConfig {
    std::string sessions_dir = "sessions";
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args;
    std::string script_suffix = ".py";
    std::string search_path_var = "PYTHONPATH";
    int default_timeout_s = 0;
    int kill_grace_ms = 500;
    int poll_interval_ms = 10;
};

struct SafetyConfig {
    bool enabled = false;
    std::vector<std::string> blocked_tokens;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    SafetyConfig safety;
    LoggingConfig logging;
};

}  // namespace runbox::config
