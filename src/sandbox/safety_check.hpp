#pragma once

#include <string>
#include <vector>

namespace runbox::sandbox {

struct SafetyVerdict {
    bool accepted = true;
    std::string message;
};

// Pre-execution lint over the raw script text. A rejection stops the
// execution before any process is spawned. Passing the check does not make a
// script safe to run.
class SafetyCheck {
public:
    virtual ~SafetyCheck() = default;
    virtual SafetyVerdict Check(const std::string& code) const = 0;
};

class BlockedTokenCheck : public SafetyCheck {
public:
    explicit BlockedTokenCheck(std::vector<std::string> tokens = DefaultTokens());

    SafetyVerdict Check(const std::string& code) const override;

    const std::vector<std::string>& Tokens() const { return tokens_; }

    static std::vector<std::string> DefaultTokens();

private:
    std::vector<std::string> tokens_;
};

}  // namespace runbox::sandbox
