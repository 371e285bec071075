#include "bril/text/printer.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "bril/common/overloaded.hpp"

namespace bril::text {

namespace {

constexpr std::string_view kIndent = "  ";

auto FormatLiteral(const ir::Literal& value) -> std::string {
  return std::visit(
      Overloaded{
          [](int64_t v) { return fmt::format("{}", v); },
          [](bool v) { return std::string(v ? "true" : "false"); },
      },
      value);
}

// `op a b` or just `op` when there are no operands.
auto FormatCall(const std::string& op, const std::vector<std::string>& args)
    -> std::string {
  if (args.empty()) {
    return op;
  }
  return fmt::format("{} {}", op, fmt::join(args, " "));
}

}  // namespace

auto FormatInstruction(const ir::Instruction& instr) -> std::string {
  return std::visit(
      Overloaded{
          [](const ir::Const& c) {
            return fmt::format(
                "{}: {} = const {};", c.dest, c.type, FormatLiteral(c.value));
          },
          [](const ir::ValueOp& v) {
            return fmt::format(
                "{}: {} = {};", v.dest, v.type, FormatCall(v.op, v.args));
          },
          [](const ir::EffectOp& e) {
            return fmt::format("{};", FormatCall(e.op, e.args));
          },
          [](const ir::Label& l) { return fmt::format("{}:", l.name); },
      },
      instr);
}

Printer::Printer(std::ostream* out) : out_(out) {
}

void Printer::Print(const ir::Program& program) {
  for (const auto& function : program.functions) {
    Print(function);
  }
}

void Printer::Print(const ir::Function& function) {
  *out_ << function.name << " {\n";
  for (const auto& instr : function.instrs) {
    Print(instr);
  }
  *out_ << "}\n";
}

void Printer::Print(const ir::Instruction& instr) {
  *out_ << kIndent << FormatInstruction(instr) << "\n";
}

auto ToText(const ir::Program& program) -> std::string {
  std::ostringstream out;
  Printer(&out).Print(program);
  return out.str();
}

}  // namespace bril::text
