#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::utils {

std::string Join(const std::vector<std::string>& items, const std::string& delimiter);

std::string Trim(const std::string& value);

std::vector<std::string> SplitCsv(const std::string& value);

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

// Entries of a directory, in iteration order. Throws StorageError when the
// directory cannot be opened or read to the end.
std::vector<std::filesystem::directory_entry> ReadDirectory(const std::filesystem::path& directory);

// Local time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string ToIsoString(std::chrono::system_clock::time_point time);

// Largest duration ParseSeconds accepts, roughly 31 years.
inline constexpr double kMaxParsedSeconds = 1e9;

// Parses a positive, finite number of seconds such as "2" or "0.25". Returns
// nullopt for anything else, including values above kMaxParsedSeconds.
std::optional<std::chrono::milliseconds> ParseSeconds(const std::string& text);

// Formats a duration as seconds without trailing zeros: 2s, 1.5s, 0.25s.
std::string FormatSeconds(std::chrono::milliseconds duration);

}  // namespace runbox::utils
