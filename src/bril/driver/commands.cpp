#include "commands.hpp"

#include <iostream>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "bril/common/source_manager.hpp"
#include "bril/config/project_config.hpp"
#include "bril/json/codec.hpp"
#include "bril/link/import_resolver.hpp"
#include "bril/link/module_loader.hpp"
#include "bril/text/parser.hpp"
#include "bril/text/printer.hpp"
#include "input.hpp"
#include "print.hpp"

namespace bril::driver {

auto Txt2JsonCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = config::LoadOptionalConfig();
  if (!config) {
    PrintDiagnostic(config.error());
    return 1;
  }

  SourceManager sources;
  auto file = ReadInput(cmd.present<std::string>("file"), sources);
  if (!file) {
    PrintDiagnostic(file.error());
    return 1;
  }

  auto program = text::ParseProgram(sources.GetFile(*file)->content, *file);
  if (!program) {
    PrintDiagnostic(program.error(), sources);
    return 1;
  }

  std::cout << json::Dump(*program, config->json_indent) << "\n";
  return 0;
}

auto Json2TxtCommand(const argparse::ArgumentParser& cmd) -> int {
  SourceManager sources;
  auto file = ReadInput(cmd.present<std::string>("file"), sources);
  if (!file) {
    PrintDiagnostic(file.error());
    return 1;
  }

  auto program = json::ParseJson(sources.GetFile(*file)->content);
  if (!program) {
    PrintDiagnostic(program.error(), sources);
    return 1;
  }

  std::cout << text::ToText(*program);
  return 0;
}

auto ResolveCommand(const argparse::ArgumentParser& cmd) -> int {
  auto config = config::LoadOptionalConfig();
  if (!config) {
    PrintDiagnostic(config.error());
    return 1;
  }

  SourceManager sources;
  auto file = ReadInput(cmd.present<std::string>("file"), sources);
  if (!file) {
    PrintDiagnostic(file.error());
    return 1;
  }

  auto program = json::ParseJson(sources.GetFile(*file)->content);
  if (!program) {
    PrintDiagnostic(program.error(), sources);
    return 1;
  }

  link::FileModuleLoader loader(&sources, BuildSearchDirs(cmd, *config));
  for (const auto& dir : loader.SearchDirs()) {
    spdlog::debug("module search path: {}", dir.string());
  }

  auto resolved = link::ResolveImports(*program, loader);
  if (!resolved) {
    PrintDiagnostic(resolved.error(), sources);
    return 1;
  }

  std::cout << json::Dump(*resolved, config->json_indent) << "\n";
  return 0;
}

}  // namespace bril::driver
