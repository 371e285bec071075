#pragma once

#include <string>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/common/source_manager.hpp"

namespace bril::driver {

void PrintError(const std::string& message);

// Print a diagnostic and its notes to stderr. Items with a source span are
// prefixed with file:line:col; the primary item also shows the source line
// with a marker under the span.
void PrintDiagnostic(const Diagnostic& diag);
void PrintDiagnostic(const Diagnostic& diag, const SourceManager& sources);

}  // namespace bril::driver
