#include "bril/text/transformer.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "bril/common/internal_error.hpp"

namespace bril::text {

namespace {

constexpr const char* kContext = "ToStructured";

void ExpectKind(const ParseNode& node, NodeKind kind) {
  if (node.kind != kind) {
    common::ThrowInternalError(
        kContext, fmt::format(
                      "expected {} node, got {}", ToString(kind),
                      ToString(node.kind)));
  }
}

auto TokenText(const ParseNode& node, size_t index) -> const std::string& {
  if (index >= node.tokens.size()) {
    common::ThrowInternalError(
        kContext,
        fmt::format("{} node has no token #{}", ToString(node.kind), index));
  }
  return node.tokens[index].text;
}

auto ChildAt(const ParseNode& node, size_t index) -> const ParseNode& {
  if (index >= node.children.size()) {
    common::ThrowInternalError(
        kContext,
        fmt::format("{} node has no child #{}", ToString(node.kind), index));
  }
  return node.children[index];
}

auto TransformType(const ParseNode& node) -> std::string {
  ExpectKind(node, NodeKind::kType);
  return TokenText(node, 0);
}

auto TransformLiteral(const ParseNode& node) -> Result<ir::Literal> {
  const std::string& text = TokenText(node, 0);
  switch (node.kind) {
    case NodeKind::kBool:
      return ir::Literal{text == "true"};
    case NodeKind::kInt: {
      // from_chars rejects a leading '+', the grammar allows it.
      std::string_view digits = text;
      if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
      }
      int64_t value = 0;
      auto [end, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (ec != std::errc{} || end != digits.data() + digits.size()) {
        return std::unexpected(
            Diagnostic::SyntaxError(
                node.span,
                fmt::format("integer literal '{}' is out of range", text)));
      }
      return ir::Literal{value};
    }
    default:
      common::ThrowInternalError(
          kContext,
          fmt::format("expected literal node, got {}", ToString(node.kind)));
  }
}

// Operand tokens start at `first` and run to the end of the token list.
auto CollectArgs(const ParseNode& node, size_t first)
    -> std::vector<std::string> {
  std::vector<std::string> args;
  for (size_t i = first; i < node.tokens.size(); ++i) {
    args.push_back(node.tokens[i].text);
  }
  return args;
}

auto TransformInstr(const ParseNode& node) -> Result<ir::Instruction> {
  switch (node.kind) {
    case NodeKind::kConst: {
      auto value = TransformLiteral(ChildAt(node, 1));
      if (!value) {
        return std::unexpected(std::move(value.error()));
      }
      return ir::Const{
          .dest = TokenText(node, 0),
          .type = TransformType(ChildAt(node, 0)),
          .value = *value,
      };
    }
    case NodeKind::kValueOp:
      return ir::ValueOp{
          .dest = TokenText(node, 0),
          .type = TransformType(ChildAt(node, 0)),
          .op = TokenText(node, 1),
          .args = CollectArgs(node, 2),
      };
    case NodeKind::kEffectOp:
      return ir::EffectOp{
          .op = TokenText(node, 0),
          .args = CollectArgs(node, 1),
      };
    case NodeKind::kLabel:
      return ir::Label{.name = TokenText(node, 0)};
    default:
      common::ThrowInternalError(
          kContext, fmt::format(
                        "expected instruction node, got {}",
                        ToString(node.kind)));
  }
}

auto TransformArg(const ParseNode& node) -> ir::Arg {
  ExpectKind(node, NodeKind::kArg);
  ir::Arg arg{.name = TokenText(node, 0), .type = std::nullopt};
  if (!node.children.empty()) {
    arg.type = TransformType(node.children.front());
  }
  return arg;
}

// Children are leading args, then an optional return type, then the body.
auto TransformFunction(const ParseNode& node) -> Result<ir::Function> {
  ExpectKind(node, NodeKind::kFunction);
  ir::Function function{
      .name = TokenText(node, 0),
      .args = {},
      .return_type = std::nullopt,
      .instrs = {},
  };

  size_t i = 0;
  for (; i < node.children.size() && node.children[i].kind == NodeKind::kArg;
       ++i) {
    function.args.push_back(TransformArg(node.children[i]));
  }
  if (i < node.children.size() && node.children[i].kind == NodeKind::kType) {
    function.return_type = TransformType(node.children[i]);
    ++i;
  }
  for (; i < node.children.size(); ++i) {
    auto instr = TransformInstr(node.children[i]);
    if (!instr) {
      return std::unexpected(std::move(instr.error()));
    }
    function.instrs.push_back(std::move(*instr));
  }
  return function;
}

}  // namespace

auto ToStructured(const ParseNode& tree) -> Result<ir::Program> {
  ExpectKind(tree, NodeKind::kProgram);
  ir::Program program;

  // Imports precede functions by construction of the grammar.
  size_t i = 0;
  for (; i < tree.children.size() && tree.children[i].kind == NodeKind::kImport;
       ++i) {
    program.imports.push_back(TokenText(tree.children[i], 0));
  }

  // Name -> span of the first definition, for the note on duplicates.
  std::unordered_map<std::string, SourceSpan> first_defined;
  std::unordered_set<std::string> reported;
  std::vector<std::string> duplicates;
  std::optional<SourceSpan> first_repeat;

  for (; i < tree.children.size(); ++i) {
    const ParseNode& node = tree.children[i];
    auto function = TransformFunction(node);
    if (!function) {
      return std::unexpected(std::move(function.error()));
    }

    const Token& name = node.tokens.front();
    bool inserted = first_defined.emplace(name.text, name.span).second;
    if (!inserted && reported.insert(name.text).second) {
      duplicates.push_back(name.text);
      if (!first_repeat) {
        first_repeat = name.span;
      }
    }
    program.functions.push_back(std::move(*function));
  }

  if (!duplicates.empty()) {
    const std::string& first = duplicates.front();
    return std::unexpected(
        Diagnostic::DuplicateFunction(*first_repeat, duplicates)
            .WithNote(
                first_defined.at(first),
                fmt::format("'{}' first defined here", first)));
  }
  return program;
}

}  // namespace bril::text
