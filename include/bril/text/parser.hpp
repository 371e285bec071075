#pragma once

#include <string_view>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/common/source_manager.hpp"
#include "bril/ir/program.hpp"
#include "bril/text/parse_tree.hpp"

namespace bril::text {

// Parse Bril text into a concrete parse tree rooted at a kProgram node.
//
// Instructions are classified by trying, in order, a const instruction, a
// value operation, an effect operation and a label; the first alternative
// that matches wins. Fails with a syntax diagnostic when no alternative
// matches or the surrounding structure is malformed.
//
// Stateless and reentrant: every call works on its own token buffer.
auto Parse(std::string_view source, FileId file_id = kInvalidFileId)
    -> Result<ParseNode>;

// Parse and transform in one step. This is the entry point for callers that
// want a structured program from text.
auto ParseProgram(std::string_view source, FileId file_id = kInvalidFileId)
    -> Result<ir::Program>;

}  // namespace bril::text
