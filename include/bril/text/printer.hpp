#pragma once

#include <ostream>
#include <string>

#include "bril/ir/program.hpp"

namespace bril::text {

// Writes a structured program in the text format.
//
// The function header carries only the name: argument lists and return types
// are not printed, so text -> program -> text drops them. Imports are not
// printed either.
class Printer {
 public:
  explicit Printer(std::ostream* out);

  void Print(const ir::Program& program);
  void Print(const ir::Function& function);
  void Print(const ir::Instruction& instr);

 private:
  std::ostream* out_;
};

// Convenience wrapper returning the printed text.
auto ToText(const ir::Program& program) -> std::string;

// Text of one instruction without indentation or line break, e.g.
// `v: int = add a b;` or `loop:`.
auto FormatInstruction(const ir::Instruction& instr) -> std::string;

}  // namespace bril::text
