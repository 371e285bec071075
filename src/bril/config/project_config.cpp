#include "bril/config/project_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

namespace bril::config {

namespace fs = std::filesystem;

namespace {

auto ConfigError(const fs::path& path, const std::string& detail)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("{}: {}", path.string(), detail),
          ErrorCategory::kConfig));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return ConfigError(
        config_path, fmt::format("failed to parse: {}", e.description()));
  }

  // [imports] section (optional)
  if (auto imports = tbl["imports"]) {
    if (auto paths = imports["search_paths"]) {
      auto* arr = paths.as_array();
      if (arr == nullptr) {
        return ConfigError(
            config_path, "'imports.search_paths' must be an array of strings");
      }
      for (const auto& elem : *arr) {
        auto str = elem.value<std::string>();
        if (!str) {
          return ConfigError(
              config_path,
              "'imports.search_paths' must be an array of strings");
        }
        // Resolve relative paths against config directory
        fs::path dir = *str;
        if (dir.is_relative()) {
          dir = config.root_dir / dir;
        }
        config.search_paths.push_back(dir);
      }
    }
  }

  // [output] section (optional)
  if (auto output = tbl["output"]) {
    if (auto indent = output["indent"]) {
      auto value = indent.value<int64_t>();
      if (!value || *value < 0 || *value > 16) {
        return ConfigError(
            config_path, "'output.indent' must be an integer from 0 to 16");
      }
      config.json_indent = static_cast<int>(*value);
    }
  }

  return config;
}

auto LoadOptionalConfig(const fs::path& start_dir) -> Result<ProjectConfig> {
  auto config_path = FindConfig(start_dir);
  if (!config_path) {
    return ProjectConfig{};
  }
  spdlog::debug("using config {}", config_path->string());
  return LoadConfig(*config_path);
}

}  // namespace bril::config
