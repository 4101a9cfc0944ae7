#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace runbox::sandbox {

// Entries of a directory at one point in time, keyed by name. Hidden entries
// are never recorded. Only names and entry types are kept: a file that is
// rewritten in place looks the same before and after.
struct DirectorySnapshot {
    std::filesystem::path directory;
    std::map<std::string, std::filesystem::file_type> entries;

    bool Contains(const std::string& name) const { return entries.count(name) > 0; }
    std::size_t Size() const { return entries.size(); }
};

class ArtifactTracker {
public:
    using ExcludePredicate = std::function<bool(const std::string& name)>;

    // A missing directory yields an empty snapshot. Throws StorageError when
    // an existing directory cannot be read.
    static DirectorySnapshot Snapshot(const std::filesystem::path& directory);

    // Regular files present in after but not in before, minus excluded
    // names, sorted.
    static std::vector<std::string> Diff(const DirectorySnapshot& before,
                                         const DirectorySnapshot& after,
                                         const ExcludePredicate& exclude = nullptr);
};

}  // namespace runbox::sandbox
