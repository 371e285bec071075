#include "bril/link/module_loader.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "bril/text/parser.hpp"

namespace bril::link {

namespace fs = std::filesystem;

FileModuleLoader::FileModuleLoader(
    SourceManager* sources, std::vector<fs::path> search_dirs)
    : sources_(sources), search_dirs_(std::move(search_dirs)) {
  if (search_dirs_.empty()) {
    search_dirs_.push_back(fs::current_path());
  }
}

auto FileModuleLoader::Load(const std::string& name) -> Result<ir::Program> {
  std::string filename = name + ".bril";

  for (const auto& dir : search_dirs_) {
    fs::path candidate = dir / filename;
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
      spdlog::debug("module '{}': no {}", name, candidate.string());
      continue;
    }

    std::ifstream in(candidate);
    if (!in) {
      return std::unexpected(
          Diagnostic::ModuleLoad(
              name, fmt::format("cannot open '{}'", candidate.string())));
    }
    std::ostringstream content;
    content << in.rdbuf();

    spdlog::debug("module '{}': reading {}", name, candidate.string());
    FileId file = sources_->AddFile(candidate.string(), content.str());
    return text::ParseProgram(sources_->GetFile(file)->content, file);
  }

  return std::unexpected(Diagnostic::ModuleLoad(name, "file not found"));
}

}  // namespace bril::link
