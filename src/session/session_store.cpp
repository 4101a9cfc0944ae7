#include "session/session_store.hpp"

#include <algorithm>
#include <system_error>

#include "errors.hpp"
#include "utils/common.hpp"

namespace runbox::session {
namespace {

std::filesystem::path MakeAbsolute(std::filesystem::path path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return path.lexically_normal();
    }
    return absolute.lexically_normal();
}

std::string Describe(const std::string& action, const std::filesystem::path& path,
                     const std::error_code& ec) {
    return action + " " + path.string() + ": " + ec.message();
}

}  // namespace

SessionStore::SessionStore(std::filesystem::path base_dir)
    : base_dir_(MakeAbsolute(std::move(base_dir))) {}

std::optional<std::string> SessionStore::ValidateKey(const std::string& key) {
    if (utils::Trim(key).empty()) {
        return std::string("Session ID cannot be empty");
    }
    if (key.find("..") != std::string::npos ||
        key.find('/') != std::string::npos ||
        key.find('\\') != std::string::npos ||
        key.find('\0') != std::string::npos ||
        key == ".") {
        return std::string("Session ID contains invalid characters");
    }
    return std::nullopt;
}

std::filesystem::path SessionStore::PathFor(const std::string& key) const {
    if (auto error = ValidateKey(key)) {
        throw InvalidSessionKeyError(*error);
    }
    return base_dir_ / key;
}

std::filesystem::path SessionStore::Resolve(const std::string& key) const {
    const auto path = PathFor(key);
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw StorageError(Describe("cannot create session directory", path, ec));
    }
    if (!std::filesystem::is_directory(path, ec)) {
        throw StorageError("session path is not a directory: " + path.string());
    }
    return path;
}

bool SessionStore::Exists(const std::string& key) const {
    std::error_code ec;
    return std::filesystem::is_directory(PathFor(key), ec);
}

std::vector<std::string> SessionStore::ListSessions() const {
    std::vector<std::string> sessions;
    std::error_code ec;
    if (!std::filesystem::exists(base_dir_, ec)) {
        return sessions;
    }
    for (const auto& entry : utils::ReadDirectory(base_dir_)) {
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            sessions.push_back(entry.path().filename().string());
        }
    }
    return sessions;
}

bool SessionStore::Clear(const std::string& key) const {
    const auto path = PathFor(key);
    std::error_code ec;
    const auto removed = std::filesystem::remove_all(path, ec);
    if (ec) {
        throw StorageError(Describe("cannot remove session directory", path, ec));
    }
    return removed > 0;
}

std::vector<std::string> SessionStore::ListFiles(const std::string& key) const {
    const auto path = PathFor(key);
    std::vector<std::string> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        return files;
    }
    for (const auto& entry : utils::ReadDirectory(path)) {
        const auto name = entry.path().filename().string();
        std::error_code entry_ec;
        if (IsHiddenName(name) || !entry.is_regular_file(entry_ec)) {
            continue;
        }
        files.push_back(name);
    }
    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace runbox::session
