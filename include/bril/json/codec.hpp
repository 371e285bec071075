#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/ir/program.hpp"

namespace bril::json {

// Encode a program in the canonical interchange form.
// `imports`, a function's `args` and `type`, and an argument's `type` are
// omitted when empty or absent.
auto ToJson(const ir::Program& program) -> nlohmann::json;

// Decode a program from the interchange form. Fails with a
// malformed-program diagnostic naming the offending path, e.g.
// `functions[0].instrs[3].dest`.
auto FromJson(const nlohmann::json& doc) -> Result<ir::Program>;

// Parse interchange text, then decode it.
auto ParseJson(const std::string& text) -> Result<ir::Program>;

// Serialize with sorted keys and the given indentation.
auto Dump(const ir::Program& program, int indent = 2) -> std::string;

}  // namespace bril::json
