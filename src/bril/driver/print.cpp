#include "print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "bril/common/overloaded.hpp"
#include "bril/common/source_span.hpp"

namespace bril::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Print the line containing `span` and a ^~~ marker under it.
void PrintSourceExcerpt(const SourceSpan& span, const FileInfo& file) {
  const std::string& content = file.content;
  uint32_t begin = std::min(span.begin, static_cast<uint32_t>(content.size()));

  size_t line_start_pos = content.rfind('\n', begin == 0 ? 0 : begin - 1);
  uint32_t line_start =
      (line_start_pos == std::string::npos || begin == 0)
          ? 0
          : static_cast<uint32_t>(line_start_pos + 1);
  size_t line_end_pos = content.find('\n', begin);
  uint32_t line_end = (line_end_pos == std::string::npos)
                          ? static_cast<uint32_t>(content.size())
                          : static_cast<uint32_t>(line_end_pos);

  auto pos = ComputeLineColumn(content, begin);
  std::string source_line = content.substr(line_start, line_end - line_start);
  std::string line_num_str = std::to_string(pos.line);
  size_t field_width = std::max(line_num_str.size(), size_t{4});
  std::string num_field(field_width - line_num_str.size(), ' ');
  num_field += line_num_str;
  std::string blank_field(field_width, ' ');

  constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);
  fmt::print(
      stderr, " {} {}\n", fmt::styled(num_field + " |", kGutterStyle),
      source_line);

  // Clamp span to current line
  uint32_t span_end = (span.end > begin) ? span.end : begin + 1;
  span_end = std::min(span_end, std::max(line_end, begin + 1));
  uint32_t span_width = span_end - begin;
  if (span_width == 0) {
    span_width = 1;
  }

  std::string marker = "^" + std::string(span_width - 1, '~');
  constexpr auto kMarkerStyle = fmt::fg(fmt::terminal_color::green);
  fmt::print(
      stderr, " {} {}{}\n", fmt::styled(blank_field + " |", kGutterStyle),
      std::string(begin - line_start, ' '), fmt::styled(marker, kMarkerStyle));
}

void PrintDiagItem(
    const DiagItem& item, const SourceManager* sources, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  std::string location;
  std::optional<SourceSpan> span_opt;

  std::visit(
      Overloaded{
          [&](const SourceSpan& span) {
            span_opt = span;
            if (sources != nullptr) {
              location = FormatSourceLocation(span, *sources);
            }
          },
          [&](UnknownSpan) {
            // No location available
          },
      },
      item.span);

  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  if (!location.empty()) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled(location, fmt::emphasis::bold),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  } else {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("bril", kToolStyle),
        fmt::styled(kind_str, kind_style),
        fmt::styled(item.message, message_style));
  }

  if (is_primary && span_opt && sources != nullptr && span_opt->file_id) {
    if (const FileInfo* file = sources->GetFile(span_opt->file_id)) {
      PrintSourceExcerpt(*span_opt, *file);
    }
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("bril", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintDiagItem(diag.primary, nullptr, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, nullptr, false);
  }
}

void PrintDiagnostic(const Diagnostic& diag, const SourceManager& sources) {
  PrintDiagItem(diag.primary, &sources, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, &sources, false);
  }
}

}  // namespace bril::driver
