#include "sandbox/safety_check.hpp"

namespace runbox::sandbox {

BlockedTokenCheck::BlockedTokenCheck(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {}

std::vector<std::string> BlockedTokenCheck::DefaultTokens() {
    return {
        "os.system(",
        "os.popen(",
        "os.fork(",
        "os.kill(",
        "os.killpg(",
        "os.exec",
        "os.spawn",
        "subprocess",
        "pty.spawn(",
        "shutil.rmtree(",
        "ctypes",
        "__import__("
    };
}

SafetyVerdict BlockedTokenCheck::Check(const std::string& code) const {
    for (const auto& token : tokens_) {
        if (!token.empty() && code.find(token) != std::string::npos) {
            return SafetyVerdict{false, "Code safety check failed: blocked token '" + token + "'"};
        }
    }
    return SafetyVerdict{};
}

}  // namespace runbox::sandbox
