#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/common/source_manager.hpp"
#include "bril/config/project_config.hpp"

namespace bril::driver {

// Read the named file, or stdin when `path` is absent or "-", and register
// the text with `sources`.
auto ReadInput(const std::optional<std::string>& path, SourceManager& sources)
    -> Result<FileId>;

// Add the optional positional input file to a subcommand.
void AddInputArgument(argparse::ArgumentParser& cmd);

// Directories searched for imported modules, in order: the working
// directory, then -I directories, then bril.toml search paths.
auto BuildSearchDirs(
    const argparse::ArgumentParser& cmd, const config::ProjectConfig& config)
    -> std::vector<std::filesystem::path>;

}  // namespace bril::driver
