#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace bril::common {

// Exception type for internal errors (broken invariants between our own
// components, not malformed user input)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format("internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace bril::common
