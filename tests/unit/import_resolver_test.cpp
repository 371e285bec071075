#include <gtest/gtest.h>

#include <expected>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "bril/common/diagnostic/diagnostic.hpp"
#include "bril/ir/program.hpp"
#include "bril/link/import_resolver.hpp"
#include "bril/link/module_loader.hpp"
#include "bril/text/parser.hpp"

namespace bril::link {
namespace {

using Modules = std::map<std::string, std::string>;

// Serves module text from memory and counts loads per name.
class MapModuleLoader final : public ModuleLoader {
 public:
  explicit MapModuleLoader(Modules modules)
      : modules_(std::move(modules)) {
  }

  auto Load(const std::string& name) -> Result<ir::Program> override {
    ++loads_[name];
    order_.push_back(name);
    auto it = modules_.find(name);
    if (it == modules_.end()) {
      return std::unexpected(Diagnostic::ModuleLoad(name, "file not found"));
    }
    return text::ParseProgram(it->second);
  }

  [[nodiscard]] auto Loads(const std::string& name) const -> int {
    auto it = loads_.find(name);
    return it == loads_.end() ? 0 : it->second;
  }

  [[nodiscard]] auto Order() const -> const std::vector<std::string>& {
    return order_;
  }

 private:
  Modules modules_;
  std::map<std::string, int> loads_;
  std::vector<std::string> order_;
};

auto Parse(const std::string& source) -> ir::Program {
  auto program = text::ParseProgram(source);
  EXPECT_TRUE(program.has_value()) << program.error().primary.message;
  return program.value_or(ir::Program{});
}

auto FunctionNames(const ir::Program& program) -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const auto& function : program.functions) {
    names.push_back(function.name);
  }
  return names;
}

// =============================================================================
// Successful resolution
// =============================================================================

TEST(ImportResolverTest, ProgramWithoutImportsIsUnchanged) {
  MapModuleLoader loader(Modules{});
  ir::Program program = Parse("main { print x; }");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, program);
  EXPECT_TRUE(loader.Order().empty());
}

TEST(ImportResolverTest, TransitiveImportsAreMergedInOrder) {
  MapModuleLoader loader(Modules{
      {"b", "import c;\nhelper { ret; }\n"},
      {"c", "util { ret; }\n"},
  });
  ir::Program program = Parse("import b;\nmain { call helper; }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value()) << resolved.error().primary.message;
  EXPECT_TRUE(resolved->imports.empty());
  EXPECT_EQ(
      FunctionNames(*resolved),
      (std::vector<std::string>{"main", "helper", "util"}));
}

TEST(ImportResolverTest, ModulesProcessedInFirstRequestedOrder) {
  MapModuleLoader loader(Modules{
      {"a", "import c;\nfa { }\n"},
      {"b", "fb { }\n"},
      {"c", "fc { }\n"},
  });
  ir::Program program = Parse("import a;\nimport b;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(loader.Order(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(
      FunctionNames(*resolved),
      (std::vector<std::string>{"main", "fa", "fb", "fc"}));
}

TEST(ImportResolverTest, SharedDependencyLoadedOnce) {
  MapModuleLoader loader(Modules{
      {"a", "import shared;\nfa { }\n"},
      {"b", "import shared;\nfb { }\n"},
      {"shared", "common { }\n"},
  });
  ir::Program program = Parse("import a;\nimport b;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value()) << resolved.error().primary.message;
  EXPECT_EQ(loader.Loads("shared"), 1);
  EXPECT_EQ(
      FunctionNames(*resolved),
      (std::vector<std::string>{"main", "fa", "fb", "common"}));
}

TEST(ImportResolverTest, RepeatedImportLoadedOnce) {
  MapModuleLoader loader(Modules{{"util", "helper { }\n"}});
  ir::Program program = Parse("import util;\nimport util;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value()) << resolved.error().primary.message;
  EXPECT_EQ(loader.Loads("util"), 1);
  EXPECT_EQ(
      FunctionNames(*resolved), (std::vector<std::string>{"main", "helper"}));
}

TEST(ImportResolverTest, ImportCycleTerminates) {
  MapModuleLoader loader(Modules{
      {"a", "import b;\nfa { }\n"},
      {"b", "import a;\nfb { }\n"},
  });
  ir::Program program = Parse("import a;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value()) << resolved.error().primary.message;
  EXPECT_EQ(loader.Loads("a"), 1);
  EXPECT_EQ(loader.Loads("b"), 1);
  EXPECT_EQ(
      FunctionNames(*resolved), (std::vector<std::string>{"main", "fa", "fb"}));
}

TEST(ImportResolverTest, ModuleWithoutFunctions) {
  MapModuleLoader loader(Modules{{"empty", ""}});
  ir::Program program = Parse("import empty;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(FunctionNames(*resolved), (std::vector<std::string>{"main"}));
}

// =============================================================================
// Failures
// =============================================================================

TEST(ImportResolverTest, CollisionWithImportingProgram) {
  MapModuleLoader loader(Modules{{"util", "helper { }\nmain { }\n"}});
  ir::Program program = Parse("import util;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_FALSE(resolved.has_value());
  const Diagnostic& diag = resolved.error();
  EXPECT_TRUE(diag.Is(ErrorCategory::kDuplicateFunction));
  EXPECT_EQ(diag.subjects, (std::vector<std::string>{"main"}));
  ASSERT_EQ(diag.notes.size(), 1);
  EXPECT_EQ(diag.notes[0].message, "while merging module 'util'");
}

TEST(ImportResolverTest, HelperDefinedByProgramAndModule) {
  MapModuleLoader loader(Modules{{"b", "helper { print y; }\n"}});
  ir::Program program =
      Parse("import b;\nhelper { print x; }\nmain { call helper; }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_FALSE(resolved.has_value());
  EXPECT_TRUE(resolved.error().Is(ErrorCategory::kDuplicateFunction));
  EXPECT_EQ(resolved.error().subjects, (std::vector<std::string>{"helper"}));
}

TEST(ImportResolverTest, CollisionBetweenModulesListsNamesInModuleOrder) {
  MapModuleLoader loader(Modules{
      {"a", "g { }\nf { }\n"},
      {"b", "f { }\nother { }\ng { }\n"},
  });
  ir::Program program = Parse("import a;\nimport b;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_FALSE(resolved.has_value());
  EXPECT_EQ(resolved.error().subjects, (std::vector<std::string>{"f", "g"}));
  EXPECT_EQ(
      resolved.error().primary.message, "function(s) defined twice: f, g");
}

TEST(ImportResolverTest, MissingModule) {
  MapModuleLoader loader(Modules{{"a", "import missing;\nfa { }\n"}});
  ir::Program program = Parse("import a;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_FALSE(resolved.has_value());
  EXPECT_TRUE(resolved.error().Is(ErrorCategory::kModuleLoad));
  EXPECT_EQ(resolved.error().subjects, (std::vector<std::string>{"missing"}));
  EXPECT_EQ(
      resolved.error().primary.message,
      "failed to load missing.bril: file not found");
}

TEST(ImportResolverTest, SyntaxErrorInModulePropagates) {
  MapModuleLoader loader(Modules{{"bad", "f { x: int = ; }\n"}});
  ir::Program program = Parse("import bad;\nmain { }\n");

  auto resolved = ResolveImports(program, loader);
  ASSERT_FALSE(resolved.has_value());
  EXPECT_TRUE(resolved.error().Is(ErrorCategory::kSyntax));
}

TEST(ImportResolverTest, InputProgramIsNotModified) {
  MapModuleLoader loader(Modules{{"util", "helper { }\n"}});
  ir::Program program = Parse("import util;\nmain { }\n");
  const ir::Program before = program;

  auto resolved = ResolveImports(program, loader);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(program, before);
}

}  // namespace
}  // namespace bril::link
