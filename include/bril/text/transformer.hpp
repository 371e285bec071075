#pragma once

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/ir/program.hpp"
#include "bril/text/parse_tree.hpp"

namespace bril::text {

// Build the structured program from a kProgram parse tree.
//
// Fails with a duplicate-function diagnostic naming every function that is
// defined more than once in this tree (each name once, in the order the
// repeats occur), and with a syntax diagnostic when an integer literal does
// not fit in 64 bits.
auto ToStructured(const ParseNode& tree) -> Result<ir::Program>;

}  // namespace bril::text
