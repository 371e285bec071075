#pragma once

#include <filesystem>
#include <gtest/gtest.h>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace bril::test {

// Result of running a CLI command
struct CliResult {
  int exit_code;
  std::string stdout_output;
  std::string stderr_output;

  [[nodiscard]] auto Success() const -> bool {
    return exit_code == 0;
  }
};

// Test fixture for CLI integration tests
//
// Provides utilities for:
// - Running the bril binary with arguments, optionally feeding stdin
// - Managing temporary directories for test isolation
// - Creating test files (bril.toml, .bril modules, JSON programs)
//
// Usage:
//   TEST_F(CliTest, MyTest) {
//     auto result = RunWithInput("main { }", {"txt2json"});
//     EXPECT_TRUE(result.Success());
//   }
//
class CliTestFixture : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Run bril with given arguments from the test directory
  auto Run(std::initializer_list<std::string> args) -> CliResult;

  // Run bril with `input` on stdin
  auto RunWithInput(
      const std::string& input, std::initializer_list<std::string> args)
      -> CliResult;

  // Run bril from a specific directory
  auto RunIn(
      const std::filesystem::path& dir, std::initializer_list<std::string> args)
      -> CliResult;

  // Create a file in the test directory
  void WriteFile(
      const std::filesystem::path& relative_path, const std::string& content);

  // Get path to test directory
  [[nodiscard]] auto TestDir() const -> const std::filesystem::path& {
    return test_dir_;
  }

 private:
  std::filesystem::path test_dir_;
  std::filesystem::path bril_bin_;

  auto RunImpl(
      const std::filesystem::path& working_dir,
      const std::vector<std::string>& args,
      const std::optional<std::string>& input) -> CliResult;
};

}  // namespace bril::test
