#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/common/source_manager.hpp"
#include "bril/ir/program.hpp"

namespace bril::link {

// Supplies imported modules by name to the import resolver.
class ModuleLoader {
 public:
  ModuleLoader() = default;
  virtual ~ModuleLoader() = default;

  ModuleLoader(const ModuleLoader&) = delete;
  auto operator=(const ModuleLoader&) -> ModuleLoader& = delete;
  ModuleLoader(ModuleLoader&&) = delete;
  auto operator=(ModuleLoader&&) -> ModuleLoader& = delete;

  // Returns the parsed module, a module-load diagnostic when it does not
  // exist, or the module's own parse diagnostic.
  virtual auto Load(const std::string& name) -> Result<ir::Program> = 0;
};

// Loads `<name>.bril` from the first search directory that has it.
// Text read is registered with `sources` so diagnostics can quote it; the
// SourceManager must outlive the loader.
class FileModuleLoader final : public ModuleLoader {
 public:
  FileModuleLoader(
      SourceManager* sources, std::vector<std::filesystem::path> search_dirs);

  auto Load(const std::string& name) -> Result<ir::Program> override;

  [[nodiscard]] auto SearchDirs() const
      -> const std::vector<std::filesystem::path>& {
    return search_dirs_;
  }

 private:
  SourceManager* sources_;
  std::vector<std::filesystem::path> search_dirs_;
};

}  // namespace bril::link
