#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bril::ir {

// Literal payload of a const instruction.
using Literal = std::variant<int64_t, bool>;

// Const: dest: type = const value;
struct Const {
  std::string dest;
  std::string type;
  Literal value;

  auto operator==(const Const&) const -> bool = default;
};

// ValueOp: dest: type = op args...;
// Operands are identifiers; their order is significant.
struct ValueOp {
  std::string dest;
  std::string type;
  std::string op;
  std::vector<std::string> args;

  auto operator==(const ValueOp&) const -> bool = default;
};

// EffectOp: op args...;
// Executed for its side effect, produces no value.
struct EffectOp {
  std::string op;
  std::vector<std::string> args;

  auto operator==(const EffectOp&) const -> bool = default;
};

// Label: name:
// A jump target within the enclosing function's instruction list.
struct Label {
  std::string name;

  auto operator==(const Label&) const -> bool = default;
};

using Instruction = std::variant<Const, ValueOp, EffectOp, Label>;

struct Arg {
  std::string name;
  std::optional<std::string> type;

  auto operator==(const Arg&) const -> bool = default;
};

struct Function {
  std::string name;
  std::vector<Arg> args;
  std::optional<std::string> return_type;
  std::vector<Instruction> instrs;

  auto operator==(const Function&) const -> bool = default;
};

// A translation unit. `imports` holds module names in source order; a
// program returned by import resolution has none left.
struct Program {
  std::vector<std::string> imports;
  std::vector<Function> functions;

  auto operator==(const Program&) const -> bool = default;
};

}  // namespace bril::ir
