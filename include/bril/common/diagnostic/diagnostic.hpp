#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "bril/common/source_span.hpp"

namespace bril {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed or conflicting Bril input
  kHostError,  // I/O, malformed external input, configuration
  kNote,       // Auxiliary message
};

// What went wrong, for callers that react to specific failures.
enum class ErrorCategory : uint8_t {
  kSyntax,             // Text does not conform to the grammar
  kDuplicateFunction,  // A function name is defined more than once
  kModuleLoad,         // An imported module could not be read
  kMalformedProgram,   // Interchange document does not describe a program
  kConfig,             // bril.toml could not be read or is invalid
};

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<ErrorCategory> category;  // Only set on primary items

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes.
// `subjects` names the functions or modules the failure is about, in report
// order, so callers need not parse the message.
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;
  std::vector<std::string> subjects;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Is(ErrorCategory cat) const -> bool {
    return primary.category == cat;
  }

  // Factory: error in Bril input with a known location
  static auto Error(DiagSpan span, std::string msg, ErrorCategory cat)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .message = std::move(msg),
             .category = cat},
        .notes = {},
        .subjects = {},
    };
  }

  // Factory: text does not match the grammar
  static auto SyntaxError(SourceSpan span, std::string msg) -> Diagnostic {
    return Error(span, std::move(msg), ErrorCategory::kSyntax);
  }

  // Factory: one or more function names are defined twice
  static auto DuplicateFunction(DiagSpan span, std::vector<std::string> names)
      -> Diagnostic {
    auto diag = Error(
        span,
        fmt::format("function(s) defined twice: {}", fmt::join(names, ", ")),
        ErrorCategory::kDuplicateFunction);
    diag.subjects = std::move(names);
    return diag;
  }

  // Factory: an imported module is unavailable
  static auto ModuleLoad(std::string name, std::string detail) -> Diagnostic {
    auto diag = HostError(
        fmt::format("failed to load {}.bril: {}", name, detail),
        ErrorCategory::kModuleLoad);
    diag.subjects.push_back(std::move(name));
    return diag;
  }

  // Factory: host error without source location
  static auto HostError(
      std::string msg, std::optional<ErrorCategory> cat = std::nullopt)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .category = cat},
        .notes = {},
        .subjects = {},
    };
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .category = std::nullopt,
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace bril
