#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bril/common/source_span.hpp"

namespace bril::text {

enum class TokenKind : uint8_t {
  kIdentifier,  // Also carries the contextual words import, const, true, false
  kInteger,     // Signed decimal literal, sign included in the text
  kLeftBrace,
  kRightBrace,
  kLeftParen,
  kRightParen,
  kColon,
  kSemicolon,
  kEquals,
  kEndOfFile,
};

struct Token {
  TokenKind kind;
  std::string text;
  SourceSpan span;

  auto operator==(const Token&) const -> bool = default;
};

auto ToString(TokenKind kind) -> std::string_view;

}  // namespace bril::text
