#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "bril/common/source_span.hpp"
#include "bril/text/token.hpp"

namespace bril::text {

// Concrete parse tree node kinds, one per grammar rule.
//
// Token and child layout per kind:
//   kProgram   children: kImport*, kFunction*
//   kImport    tokens: [module]
//   kFunction  tokens: [name]     children: kArg*, kType?, instr*
//   kArg       tokens: [name]     children: kType?
//   kType      tokens: [name]
//   kConst     tokens: [dest]     children: kType, (kInt | kBool)
//   kValueOp   tokens: [dest, op, args...]  children: kType
//   kEffectOp  tokens: [op, args...]
//   kLabel     tokens: [name]
//   kInt       tokens: [literal]
//   kBool      tokens: [literal]
// where instr is one of kConst, kValueOp, kEffectOp, kLabel.
enum class NodeKind : uint8_t {
  kProgram,
  kImport,
  kFunction,
  kArg,
  kType,
  kConst,
  kValueOp,
  kEffectOp,
  kLabel,
  kInt,
  kBool,
};

struct ParseNode {
  NodeKind kind;
  SourceSpan span;
  std::vector<Token> tokens;
  std::vector<ParseNode> children;
};

auto ToString(NodeKind kind) -> std::string_view;

}  // namespace bril::text
