#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chain::app {

bool FileExists(const std::filesystem::path& path);

// Candidate asset directories, nearest first: ./assets and its parents,
// $CHAIN_ASSETS, then the executable's directory and its parents.
const std::vector<std::filesystem::path>& AssetRoots();

std::filesystem::path AssetPath(const std::string& filename);

std::optional<std::string> ReadTextFile(const std::filesystem::path& path);

}  // namespace chain::app
