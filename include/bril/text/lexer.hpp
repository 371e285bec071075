#pragma once

#include <string_view>
#include <vector>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/common/source_manager.hpp"
#include "bril/text/token.hpp"

namespace bril::text {

// Split Bril text into tokens. Whitespace and `#` line comments are dropped.
// The returned vector always ends with a kEndOfFile token.
// Fails with a syntax diagnostic on the first character that cannot start a
// token.
auto Tokenize(std::string_view source, FileId file_id)
    -> Result<std::vector<Token>>;

}  // namespace bril::text
