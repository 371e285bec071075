#include "bril/text/parser.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "bril/text/lexer.hpp"
#include "bril/text/transformer.hpp"

namespace bril::text {

auto ToString(NodeKind kind) -> std::string_view {
  switch (kind) {
    case NodeKind::kProgram:
      return "program";
    case NodeKind::kImport:
      return "import";
    case NodeKind::kFunction:
      return "function";
    case NodeKind::kArg:
      return "arg";
    case NodeKind::kType:
      return "type";
    case NodeKind::kConst:
      return "const";
    case NodeKind::kValueOp:
      return "vop";
    case NodeKind::kEffectOp:
      return "eop";
    case NodeKind::kLabel:
      return "label";
    case NodeKind::kInt:
      return "int";
    case NodeKind::kBool:
      return "bool";
  }
  return "node";
}

namespace {

constexpr std::string_view kImportWord = "import";
constexpr std::string_view kConstWord = "const";

auto Cover(const SourceSpan& first, const SourceSpan& last) -> SourceSpan {
  return SourceSpan{
      .file_id = first.file_id, .begin = first.begin, .end = last.end};
}

// Recursive-descent parser over a token vector.
//
// Instruction alternatives are attempted with Try* methods that return
// nullopt and restore the cursor when they do not match. Each failed match
// records what was expected at the furthest token reached, which becomes the
// syntax error if every alternative fails.
class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  }

  auto ParseProgram() -> Result<ParseNode> {
    ParseNode program{
        .kind = NodeKind::kProgram,
        .span = Current().span,
        .tokens = {},
        .children = {},
    };

    while (AtImport()) {
      const Token& keyword = Advance();
      const Token& module = Advance();
      const Token& semi = Advance();
      program.children.push_back(
          ParseNode{
              .kind = NodeKind::kImport,
              .span = Cover(keyword.span, semi.span),
              .tokens = {module},
              .children = {},
          });
    }

    while (!At(TokenKind::kEndOfFile)) {
      auto function = ParseFunction();
      if (!function) {
        return std::unexpected(std::move(function.error()));
      }
      program.children.push_back(std::move(*function));
    }

    program.span = Cover(program.span, Current().span);
    return program;
  }

 private:
  // function := IDENT arg* (":" type)? "{" instrOrLabel* "}"
  auto ParseFunction() -> Result<ParseNode> {
    auto name = Expect(TokenKind::kIdentifier, "function name");
    if (!name) {
      return std::unexpected(std::move(name.error()));
    }

    ParseNode function{
        .kind = NodeKind::kFunction,
        .span = name->span,
        .tokens = {*name},
        .children = {},
    };

    while (true) {
      if (At(TokenKind::kIdentifier)) {
        const Token& arg = Advance();
        function.children.push_back(
            ParseNode{
                .kind = NodeKind::kArg,
                .span = arg.span,
                .tokens = {arg},
                .children = {},
            });
      } else if (At(TokenKind::kLeftParen)) {
        auto arg = ParseTypedArg();
        if (!arg) {
          return std::unexpected(std::move(arg.error()));
        }
        function.children.push_back(std::move(*arg));
      } else {
        break;
      }
    }

    if (At(TokenKind::kColon)) {
      Advance();
      auto type = ExpectType();
      if (!type) {
        return std::unexpected(std::move(type.error()));
      }
      function.children.push_back(std::move(*type));
    }

    if (auto open = Expect(TokenKind::kLeftBrace, "'{'"); !open) {
      return std::unexpected(std::move(open.error()));
    }

    while (!At(TokenKind::kRightBrace)) {
      if (At(TokenKind::kEndOfFile)) {
        return std::unexpected(ErrorAtCurrent("'}'"));
      }
      auto instr = ParseInstrOrLabel();
      if (!instr) {
        return std::unexpected(std::move(instr.error()));
      }
      function.children.push_back(std::move(*instr));
    }

    const Token& close = Advance();
    function.span = Cover(function.span, close.span);
    return function;
  }

  // arg := "(" IDENT ":" type ")"
  auto ParseTypedArg() -> Result<ParseNode> {
    const Token& open = Advance();
    auto name = Expect(TokenKind::kIdentifier, "argument name");
    if (!name) {
      return std::unexpected(std::move(name.error()));
    }
    if (auto colon = Expect(TokenKind::kColon, "':'"); !colon) {
      return std::unexpected(std::move(colon.error()));
    }
    auto type = ExpectType();
    if (!type) {
      return std::unexpected(std::move(type.error()));
    }
    auto close = Expect(TokenKind::kRightParen, "')'");
    if (!close) {
      return std::unexpected(std::move(close.error()));
    }

    std::vector<ParseNode> children;
    children.push_back(std::move(*type));
    return ParseNode{
        .kind = NodeKind::kArg,
        .span = Cover(open.span, close->span),
        .tokens = {*name},
        .children = std::move(children),
    };
  }

  auto ExpectType() -> Result<ParseNode> {
    auto name = Expect(TokenKind::kIdentifier, "type name");
    if (!name) {
      return std::unexpected(std::move(name.error()));
    }
    return TypeNode(*name);
  }

  // instrOrLabel := constInstr | valueOp | effectOp | label, in that order.
  //
  // The furthest failure is kept across instructions: when a label wins over
  // a longer alternative that failed further on (`a: int = const 4 }`), the
  // error for the next instruction is reported where that alternative died.
  auto ParseInstrOrLabel() -> Result<ParseNode> {
    if (auto node = TryParseConst()) {
      return std::move(*node);
    }
    if (auto node = TryParseValueOp()) {
      return std::move(*node);
    }
    if (auto node = TryParseEffectOp()) {
      return std::move(*node);
    }
    if (auto node = TryParseLabel()) {
      return std::move(*node);
    }

    const Token& at = tokens_[std::max(furthest_, pos_)];
    return std::unexpected(
        Diagnostic::SyntaxError(
            at.span, UnexpectedMessage(
                         at, expected_.empty() ? "instruction or label"
                                               : expected_)));
  }

  // constInstr := IDENT ":" type "=" "const" literal ";"
  auto TryParseConst() -> std::optional<ParseNode> {
    size_t start = pos_;
    const Token* dest = Match(TokenKind::kIdentifier, "identifier");
    const Token* type = nullptr;
    std::optional<ParseNode> literal;
    if (dest != nullptr && Match(TokenKind::kColon, "':'") != nullptr &&
        (type = Match(TokenKind::kIdentifier, "type name")) != nullptr &&
        Match(TokenKind::kEquals, "'='") != nullptr &&
        MatchWord(kConstWord) != nullptr &&
        (literal = MatchLiteral()).has_value()) {
      if (const Token* semi = Match(TokenKind::kSemicolon, "';'")) {
        std::vector<ParseNode> children;
        children.push_back(TypeNode(*type));
        children.push_back(std::move(*literal));
        return ParseNode{
            .kind = NodeKind::kConst,
            .span = Cover(dest->span, semi->span),
            .tokens = {*dest},
            .children = std::move(children),
        };
      }
    }
    pos_ = start;
    return std::nullopt;
  }

  // valueOp := IDENT ":" type "=" IDENT IDENT* ";"
  auto TryParseValueOp() -> std::optional<ParseNode> {
    size_t start = pos_;
    const Token* dest = Match(TokenKind::kIdentifier, "identifier");
    const Token* type = nullptr;
    const Token* op = nullptr;
    if (dest != nullptr && Match(TokenKind::kColon, "':'") != nullptr &&
        (type = Match(TokenKind::kIdentifier, "type name")) != nullptr &&
        Match(TokenKind::kEquals, "'='") != nullptr &&
        (op = Match(TokenKind::kIdentifier, "operation name")) != nullptr) {
      std::vector<Token> tokens = {*dest, *op};
      while (At(TokenKind::kIdentifier)) {
        tokens.push_back(Advance());
      }
      if (const Token* semi = Match(TokenKind::kSemicolon, "';'")) {
        std::vector<ParseNode> children;
        children.push_back(TypeNode(*type));
        return ParseNode{
            .kind = NodeKind::kValueOp,
            .span = Cover(dest->span, semi->span),
            .tokens = std::move(tokens),
            .children = std::move(children),
        };
      }
    }
    pos_ = start;
    return std::nullopt;
  }

  // effectOp := IDENT IDENT* ";"
  auto TryParseEffectOp() -> std::optional<ParseNode> {
    size_t start = pos_;
    if (const Token* op = Match(TokenKind::kIdentifier, "operation name")) {
      std::vector<Token> tokens = {*op};
      while (At(TokenKind::kIdentifier)) {
        tokens.push_back(Advance());
      }
      if (const Token* semi = Match(TokenKind::kSemicolon, "';'")) {
        return ParseNode{
            .kind = NodeKind::kEffectOp,
            .span = Cover(op->span, semi->span),
            .tokens = std::move(tokens),
            .children = {},
        };
      }
    }
    pos_ = start;
    return std::nullopt;
  }

  // label := IDENT ":"
  auto TryParseLabel() -> std::optional<ParseNode> {
    size_t start = pos_;
    if (const Token* name = Match(TokenKind::kIdentifier, "label name")) {
      if (const Token* colon = Match(TokenKind::kColon, "':'")) {
        return ParseNode{
            .kind = NodeKind::kLabel,
            .span = Cover(name->span, colon->span),
            .tokens = {*name},
            .children = {},
        };
      }
    }
    pos_ = start;
    return std::nullopt;
  }

  // literal := signedInt | "true" | "false"
  auto MatchLiteral() -> std::optional<ParseNode> {
    if (At(TokenKind::kInteger)) {
      const Token& tok = Advance();
      return ParseNode{
          .kind = NodeKind::kInt,
          .span = tok.span,
          .tokens = {tok},
          .children = {},
      };
    }
    if (At(TokenKind::kIdentifier) &&
        (Current().text == "true" || Current().text == "false")) {
      const Token& tok = Advance();
      return ParseNode{
          .kind = NodeKind::kBool,
          .span = tok.span,
          .tokens = {tok},
          .children = {},
      };
    }
    NoteExpected("integer or boolean literal");
    return std::nullopt;
  }

  static auto TypeNode(const Token& name) -> ParseNode {
    return ParseNode{
        .kind = NodeKind::kType,
        .span = name.span,
        .tokens = {name},
        .children = {},
    };
  }

  // `import` is a contextual word: only `import IDENT ;` is an import,
  // anything else starting with it is a function named import.
  [[nodiscard]] auto AtImport() const -> bool {
    return At(TokenKind::kIdentifier) && Current().text == kImportWord &&
           PeekKind(1) == TokenKind::kIdentifier &&
           PeekKind(2) == TokenKind::kSemicolon;
  }

  [[nodiscard]] auto Current() const -> const Token& {
    return tokens_[pos_];
  }

  [[nodiscard]] auto PeekKind(size_t ahead) const -> TokenKind {
    size_t at = pos_ + ahead;
    return at < tokens_.size() ? tokens_[at].kind : TokenKind::kEndOfFile;
  }

  [[nodiscard]] auto At(TokenKind kind) const -> bool {
    return Current().kind == kind;
  }

  // Never moves past the trailing kEndOfFile token.
  auto Advance() -> const Token& {
    const Token& tok = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
      ++pos_;
    }
    return tok;
  }

  auto Match(TokenKind kind, std::string_view what) -> const Token* {
    if (At(kind)) {
      return &Advance();
    }
    NoteExpected(what);
    return nullptr;
  }

  auto MatchWord(std::string_view word) -> const Token* {
    if (At(TokenKind::kIdentifier) && Current().text == word) {
      return &Advance();
    }
    NoteExpected(fmt::format("'{}'", word));
    return nullptr;
  }

  // The first alternative to reach a position keeps its expectation, so the
  // higher-priority rule names the error on ties.
  void NoteExpected(std::string_view what) {
    if (pos_ > furthest_ || expected_.empty()) {
      furthest_ = pos_;
      expected_ = std::string(what);
    }
  }

  auto Expect(TokenKind kind, std::string_view what) -> Result<Token> {
    if (At(kind)) {
      return Advance();
    }
    return std::unexpected(ErrorAtCurrent(what));
  }

  [[nodiscard]] auto ErrorAtCurrent(std::string_view what) const
      -> Diagnostic {
    return Diagnostic::SyntaxError(
        Current().span, UnexpectedMessage(Current(), what));
  }

  static auto UnexpectedMessage(const Token& at, std::string_view what)
      -> std::string {
    if (at.kind == TokenKind::kEndOfFile) {
      return fmt::format("unexpected end of input, expected {}", what);
    }
    return fmt::format("unexpected '{}', expected {}", at.text, what);
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  size_t furthest_ = 0;
  std::string expected_;
};

}  // namespace

auto Parse(std::string_view source, FileId file_id) -> Result<ParseNode> {
  auto tokens = Tokenize(source, file_id);
  if (!tokens) {
    return std::unexpected(std::move(tokens.error()));
  }
  return Parser(std::move(*tokens)).ParseProgram();
}

auto ParseProgram(std::string_view source, FileId file_id)
    -> Result<ir::Program> {
  auto tree = Parse(source, file_id);
  if (!tree) {
    return std::unexpected(std::move(tree.error()));
  }
  return ToStructured(*tree);
}

}  // namespace bril::text
