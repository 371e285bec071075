#include "input.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bril::driver {

namespace fs = std::filesystem;

auto ReadInput(const std::optional<std::string>& path, SourceManager& sources)
    -> Result<FileId> {
  std::ostringstream content;
  std::string name;

  if (!path || *path == "-") {
    content << std::cin.rdbuf();
    if (std::cin.bad()) {
      return std::unexpected(Diagnostic::HostError("cannot read stdin"));
    }
    name = "<stdin>";
  } else {
    std::ifstream in(*path);
    if (!in) {
      return std::unexpected(
          Diagnostic::HostError(fmt::format("cannot open '{}'", *path)));
    }
    content << in.rdbuf();
    name = *path;
  }

  spdlog::debug("read {} ({} bytes)", name, content.str().size());
  return sources.AddFile(std::move(name), content.str());
}

void AddInputArgument(argparse::ArgumentParser& cmd) {
  cmd.add_argument("file").nargs(0, 1).help(
      "Input file (reads stdin if omitted or '-')");
}

auto BuildSearchDirs(
    const argparse::ArgumentParser& cmd, const config::ProjectConfig& config)
    -> std::vector<fs::path> {
  std::vector<fs::path> dirs = {fs::current_path()};
  if (auto vals = cmd.present<std::vector<std::string>>("-I")) {
    for (const auto& dir : *vals) {
      dirs.push_back(fs::absolute(dir));
    }
  }
  dirs.insert(
      dirs.end(), config.search_paths.begin(), config.search_paths.end());
  return dirs;
}

}  // namespace bril::driver
