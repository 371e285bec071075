#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "bril/common/internal_error.hpp"
#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

// Log to stderr so stdout carries only program output.
void ConfigureLogging(bool verbose) {
  auto logger = spdlog::stderr_color_mt("bril");
  logger->set_pattern("[%n][%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("bril", "0.1.0");
  program.add_description(
      "Convert Bril programs between text and JSON and resolve imports");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log progress to stderr");

  // Subcommand: txt2json
  argparse::ArgumentParser txt2json_cmd("txt2json");
  txt2json_cmd.add_description("Parse the text format and emit JSON");
  bril::driver::AddInputArgument(txt2json_cmd);

  // Subcommand: json2txt
  argparse::ArgumentParser json2txt_cmd("json2txt");
  json2txt_cmd.add_description("Print a JSON program in the text format");
  bril::driver::AddInputArgument(json2txt_cmd);

  // Subcommand: resolve
  argparse::ArgumentParser resolve_cmd("resolve");
  resolve_cmd.add_description(
      "Merge imported modules (<name>.bril) into a JSON program");
  resolve_cmd.add_argument("-I", "--import-dir")
      .append()
      .help("Additional module search directory (repeatable)");
  bril::driver::AddInputArgument(resolve_cmd);

  program.add_subparser(txt2json_cmd);
  program.add_subparser(json2txt_cmd);
  program.add_subparser(resolve_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    bril::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  ConfigureLogging(program.get<bool>("--verbose"));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      bril::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("txt2json")) {
      return bril::driver::Txt2JsonCommand(txt2json_cmd);
    }

    if (program.is_subcommand_used("json2txt")) {
      return bril::driver::Json2TxtCommand(json2txt_cmd);
    }

    if (program.is_subcommand_used("resolve")) {
      return bril::driver::ResolveCommand(resolve_cmd);
    }
  } catch (const bril::common::InternalError& e) {
    bril::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
