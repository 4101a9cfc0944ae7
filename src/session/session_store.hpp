#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::session {

// Names starting with this character are hidden from file listings and
// artifact detection.
inline constexpr char kHiddenMarker = '.';

inline bool IsHiddenName(const std::string& name) {
    return !name.empty() && name.front() == kHiddenMarker;
}

// Maps a session key to baseDir/<key>. The directory is the only state a
// session has; nothing is cached in memory. The store does not lock session
// directories, concurrent executions in one session may race.
class SessionStore {
public:
    explicit SessionStore(std::filesystem::path base_dir);

    const std::filesystem::path& BaseDir() const { return base_dir_; }

    // Pure function of key and base directory. Throws InvalidSessionKeyError.
    std::filesystem::path PathFor(const std::string& key) const;

    // Returns the session directory, creating it and its parents if needed.
    // Throws StorageError when the directory cannot be created.
    std::filesystem::path Resolve(const std::string& key) const;

    bool Exists(const std::string& key) const;
    std::vector<std::string> ListSessions() const;
    bool Clear(const std::string& key) const;
    std::vector<std::string> ListFiles(const std::string& key) const;

    // Returns an error message when the key is not usable as a directory name.
    static std::optional<std::string> ValidateKey(const std::string& key);
    static bool IsValidKey(const std::string& key) { return !ValidateKey(key).has_value(); }

private:
    std::filesystem::path base_dir_;
};

}  // namespace runbox::session
