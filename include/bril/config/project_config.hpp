#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "bril/common/diagnostic/diagnostic.hpp"

namespace bril::config {

inline constexpr const char* kConfigFileName = "bril.toml";

struct ProjectConfig {
  // [imports] search_paths, resolved against root_dir
  std::vector<std::filesystem::path> search_paths;

  // [output] indent
  int json_indent = 2;

  // Directory where bril.toml was found
  std::filesystem::path root_dir;
};

// Search for bril.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse a bril.toml file. Both sections are optional.
// Returns a config diagnostic on parse errors or wrongly typed values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig; defaults when there is no bril.toml.
auto LoadOptionalConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> Result<ProjectConfig>;

}  // namespace bril::config
