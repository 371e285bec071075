#pragma once

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/ir/program.hpp"
#include "bril/link/module_loader.hpp"

namespace bril::link {

// Merge every module `program` imports, directly or transitively, into one
// program without imports.
//
// Modules are processed in first-requested order: the program's own imports
// in source order, then the imports each loaded module adds, each name at
// most once. Functions of the result are the program's own followed by each
// module's in processing order.
//
// A program without imports is returned unchanged. Fails with the loader's
// diagnostic when a module is unavailable or does not parse, and with a
// duplicate-function diagnostic when a module defines a name that is already
// merged; no partial result is produced.
auto ResolveImports(const ir::Program& program, ModuleLoader& loader)
    -> Result<ir::Program>;

}  // namespace bril::link
