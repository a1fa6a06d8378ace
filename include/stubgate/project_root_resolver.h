#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stubgate {

constexpr int kMaxRootAscents = 10;

// Walks upward from the directory containing `file` and returns the first
// directory holding any of `markers`. The starting directory is checked, then
// at most `max_ascents` parents; the walk also ends at the filesystem root.
std::optional<std::filesystem::path>
FindProjectRoot(const std::filesystem::path &file,
                const std::vector<std::string> &markers,
                int max_ascents = kMaxRootAscents);

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent);

} // namespace stubgate
