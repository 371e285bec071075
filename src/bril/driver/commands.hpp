#pragma once

#include <argparse/argparse.hpp>

namespace bril::driver {

// Each command returns the process exit status.
auto Txt2JsonCommand(const argparse::ArgumentParser& cmd) -> int;
auto Json2TxtCommand(const argparse::ArgumentParser& cmd) -> int;
auto ResolveCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace bril::driver
