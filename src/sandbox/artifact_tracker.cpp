#include "sandbox/artifact_tracker.hpp"

#include <algorithm>
#include <system_error>

#include "session/session_store.hpp"
#include "utils/common.hpp"

namespace runbox::sandbox {

DirectorySnapshot ArtifactTracker::Snapshot(const std::filesystem::path& directory) {
    DirectorySnapshot snapshot{};
    snapshot.directory = directory;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return snapshot;
    }
    for (const auto& entry : utils::ReadDirectory(directory)) {
        auto name = entry.path().filename().string();
        if (session::IsHiddenName(name)) {
            continue;
        }
        std::error_code entry_ec;
        const auto type = entry.status(entry_ec).type();
        snapshot.entries.emplace(std::move(name),
                                 entry_ec ? std::filesystem::file_type::unknown : type);
    }
    return snapshot;
}

std::vector<std::string> ArtifactTracker::Diff(const DirectorySnapshot& before,
                                               const DirectorySnapshot& after,
                                               const ExcludePredicate& exclude) {
    std::vector<std::string> created;
    for (const auto& [name, type] : after.entries) {
        if (type != std::filesystem::file_type::regular || before.Contains(name)) {
            continue;
        }
        if (session::IsHiddenName(name) || (exclude && exclude(name))) {
            continue;
        }
        created.push_back(name);
    }
    std::sort(created.begin(), created.end());
    return created;
}

}  // namespace runbox::sandbox
