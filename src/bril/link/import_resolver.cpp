#include "bril/link/import_resolver.hpp"

#include <cstddef>
#include <deque>
#include <expected>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace bril::link {

namespace {

// FIFO of module names that never holds the same name twice.
class PendingQueue {
 public:
  void Push(const std::string& name) {
    if (queued_.insert(name).second) {
      order_.push_back(name);
    }
  }

  auto Pop() -> std::string {
    std::string name = std::move(order_.front());
    order_.pop_front();
    queued_.erase(name);
    return name;
  }

  [[nodiscard]] auto Empty() const -> bool {
    return order_.empty();
  }

 private:
  std::deque<std::string> order_;
  std::unordered_set<std::string> queued_;
};

// Function namespace accumulated so far, in insertion order.
class MergedFunctions {
 public:
  explicit MergedFunctions(const std::vector<ir::Function>& seed) {
    for (const auto& function : seed) {
      Insert(function);
    }
  }

  [[nodiscard]] auto Contains(const std::string& name) const -> bool {
    return index_.contains(name);
  }

  // A later definition of an existing name replaces it in place.
  void Insert(ir::Function function) {
    auto it = index_.find(function.name);
    if (it != index_.end()) {
      functions_[it->second] = std::move(function);
      return;
    }
    index_.emplace(function.name, functions_.size());
    functions_.push_back(std::move(function));
  }

  auto Take() && -> std::vector<ir::Function> {
    return std::move(functions_);
  }

 private:
  std::vector<ir::Function> functions_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace

auto ResolveImports(const ir::Program& program, ModuleLoader& loader)
    -> Result<ir::Program> {
  if (program.imports.empty()) {
    return program;
  }

  PendingQueue pending;
  for (const auto& name : program.imports) {
    pending.Push(name);
  }
  std::unordered_set<std::string> seen;
  MergedFunctions merged(program.functions);

  while (!pending.Empty()) {
    std::string name = pending.Pop();
    seen.insert(name);

    spdlog::debug("resolving import '{}'", name);
    auto module = loader.Load(name);
    if (!module) {
      return std::unexpected(std::move(module.error()));
    }

    for (const auto& dep : module->imports) {
      if (!seen.contains(dep)) {
        pending.Push(dep);
      }
    }

    std::vector<std::string> duplicates;
    for (const auto& function : module->functions) {
      if (merged.Contains(function.name)) {
        duplicates.push_back(function.name);
      }
    }
    if (!duplicates.empty()) {
      return std::unexpected(
          Diagnostic::DuplicateFunction(UnknownSpan{}, std::move(duplicates))
              .WithNote(fmt::format("while merging module '{}'", name)));
    }

    spdlog::debug(
        "merging {} function(s) from '{}'", module->functions.size(), name);
    for (auto& function : module->functions) {
      merged.Insert(std::move(function));
    }
  }

  return ir::Program{
      .imports = {},
      .functions = std::move(merged).Take(),
  };
}

}  // namespace bril::link
