#include "bril/text/lexer.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace bril::text {

auto ToString(TokenKind kind) -> std::string_view {
  switch (kind) {
    case TokenKind::kIdentifier:
      return "identifier";
    case TokenKind::kInteger:
      return "integer";
    case TokenKind::kLeftBrace:
      return "'{'";
    case TokenKind::kRightBrace:
      return "'}'";
    case TokenKind::kLeftParen:
      return "'('";
    case TokenKind::kRightParen:
      return "')'";
    case TokenKind::kColon:
      return "':'";
    case TokenKind::kSemicolon:
      return "';'";
    case TokenKind::kEquals:
      return "'='";
    case TokenKind::kEndOfFile:
      return "end of input";
  }
  return "token";
}

namespace {

// Letters are ASCII only; the grammar does not admit other scripts.
auto IsLetter(char c) -> bool {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto IsDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

auto IsIdentifierStart(char c) -> bool {
  return c == '_' || c == '%' || IsLetter(c);
}

auto IsIdentifierChar(char c) -> bool {
  return IsIdentifierStart(c) || c == '.' || IsDigit(c);
}

auto IsSpace(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

auto PunctuationKind(char c) -> std::optional<TokenKind> {
  switch (c) {
    case '{':
      return TokenKind::kLeftBrace;
    case '}':
      return TokenKind::kRightBrace;
    case '(':
      return TokenKind::kLeftParen;
    case ')':
      return TokenKind::kRightParen;
    case ':':
      return TokenKind::kColon;
    case ';':
      return TokenKind::kSemicolon;
    case '=':
      return TokenKind::kEquals;
    default:
      return std::nullopt;
  }
}

class Scanner {
 public:
  Scanner(std::string_view source, FileId file_id)
      : source_(source), file_id_(file_id) {
  }

  auto Run() -> Result<std::vector<Token>> {
    std::vector<Token> tokens;
    while (true) {
      SkipTrivia();
      if (AtEnd()) {
        break;
      }

      size_t start = pos_;
      char c = source_[pos_];

      if (IsIdentifierStart(c)) {
        while (!AtEnd() && IsIdentifierChar(source_[pos_])) {
          ++pos_;
        }
        tokens.push_back(Make(TokenKind::kIdentifier, start));
        continue;
      }

      if (IsDigit(c) || ((c == '-' || c == '+') && IsDigit(Peek(1)))) {
        ++pos_;
        while (!AtEnd() && IsDigit(source_[pos_])) {
          ++pos_;
        }
        tokens.push_back(Make(TokenKind::kInteger, start));
        continue;
      }

      if (auto kind = PunctuationKind(c)) {
        ++pos_;
        tokens.push_back(Make(*kind, start));
        continue;
      }

      return std::unexpected(
          Diagnostic::SyntaxError(
              Span(start, start + 1),
              fmt::format("unexpected character '{}'", c)));
    }

    tokens.push_back(
        Token{
            .kind = TokenKind::kEndOfFile,
            .text = "",
            .span = Span(source_.size(), source_.size()),
        });
    return tokens;
  }

 private:
  [[nodiscard]] auto AtEnd() const -> bool {
    return pos_ >= source_.size();
  }

  [[nodiscard]] auto Peek(size_t ahead) const -> char {
    size_t at = pos_ + ahead;
    return at < source_.size() ? source_[at] : '\0';
  }

  void SkipTrivia() {
    while (!AtEnd()) {
      char c = source_[pos_];
      if (IsSpace(c)) {
        ++pos_;
      } else if (c == '#') {
        while (!AtEnd() && source_[pos_] != '\n') {
          ++pos_;
        }
      } else {
        return;
      }
    }
  }

  [[nodiscard]] auto Span(size_t begin, size_t end) const -> SourceSpan {
    return SourceSpan{
        .file_id = file_id_,
        .begin = static_cast<uint32_t>(begin),
        .end = static_cast<uint32_t>(end),
    };
  }

  [[nodiscard]] auto Make(TokenKind kind, size_t start) const -> Token {
    return Token{
        .kind = kind,
        .text = std::string(source_.substr(start, pos_ - start)),
        .span = Span(start, pos_),
    };
  }

  std::string_view source_;
  FileId file_id_;
  size_t pos_ = 0;
};

}  // namespace

auto Tokenize(std::string_view source, FileId file_id)
    -> Result<std::vector<Token>> {
  return Scanner(source, file_id).Run();
}

}  // namespace bril::text
