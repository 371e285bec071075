#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "bril/config/project_config.hpp"

namespace bril::config {
namespace {

namespace fs = std::filesystem;

class ProjectConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::random_device rd;
    std::uniform_int_distribution<> dis(0, 999999);
    root_ = fs::temp_directory_path() /
            ("bril_config_test_" + std::to_string(dis(rd)));
    fs::create_directories(root_);
  }

  void TearDown() override {
    if (!root_.empty() && fs::exists(root_)) {
      fs::remove_all(root_);
    }
  }

  auto WriteConfig(const fs::path& dir, const std::string& content)
      -> fs::path {
    fs::create_directories(root_ / dir);
    auto path = root_ / dir / kConfigFileName;
    std::ofstream out(path);
    out << content;
    return path;
  }

  [[nodiscard]] auto Root() const -> const fs::path& {
    return root_;
  }

 private:
  fs::path root_;
};

// =============================================================================
// LoadConfig
// =============================================================================

TEST_F(ProjectConfigTest, EmptyFileGivesDefaults) {
  auto config = LoadConfig(WriteConfig(".", ""));
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_TRUE(config->search_paths.empty());
  EXPECT_EQ(config->json_indent, 2);
}

TEST_F(ProjectConfigTest, SearchPathsResolveAgainstConfigDirectory) {
  auto path = WriteConfig(
      "proj", "[imports]\nsearch_paths = [\"lib\", \"/opt/bril/std\"]\n");
  auto config = LoadConfig(path);
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  ASSERT_EQ(config->search_paths.size(), 2);
  EXPECT_EQ(config->search_paths[0], Root() / "proj" / "lib");
  EXPECT_EQ(config->search_paths[1], fs::path("/opt/bril/std"));
  EXPECT_EQ(config->root_dir, Root() / "proj");
}

TEST_F(ProjectConfigTest, OutputIndent) {
  auto config = LoadConfig(WriteConfig(".", "[output]\nindent = 4\n"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->json_indent, 4);
}

TEST_F(ProjectConfigTest, IndentOutOfRangeIsRejected) {
  auto config = LoadConfig(WriteConfig(".", "[output]\nindent = 17\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().Is(ErrorCategory::kConfig));
  EXPECT_NE(
      config.error().primary.message.find(
          "'output.indent' must be an integer from 0 to 16"),
      std::string::npos);
}

TEST_F(ProjectConfigTest, SearchPathsMustBeStrings) {
  auto config =
      LoadConfig(WriteConfig(".", "[imports]\nsearch_paths = [1, 2]\n"));
  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().Is(ErrorCategory::kConfig));
}

TEST_F(ProjectConfigTest, InvalidTomlNamesTheFile) {
  auto path = WriteConfig(".", "[imports\n");
  auto config = LoadConfig(path);
  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().Is(ErrorCategory::kConfig));
  EXPECT_TRUE(config.error().primary.message.starts_with(path.string()));
}

// =============================================================================
// FindConfig / LoadOptionalConfig
// =============================================================================

TEST_F(ProjectConfigTest, FindConfigSearchesParentDirectories) {
  auto path = WriteConfig("proj", "");
  fs::create_directories(Root() / "proj" / "src" / "deep");

  auto found = FindConfig(Root() / "proj" / "src" / "deep");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, path);
}

TEST_F(ProjectConfigTest, NearestConfigWins) {
  WriteConfig(".", "[output]\nindent = 8\n");
  auto inner = WriteConfig("proj", "[output]\nindent = 0\n");

  auto config = LoadOptionalConfig(Root() / "proj");
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->json_indent, 0);
  EXPECT_EQ(FindConfig(Root() / "proj"), inner);
}

TEST_F(ProjectConfigTest, LoadOptionalConfigPropagatesErrors) {
  WriteConfig("proj", "[output]\nindent = \"wide\"\n");
  auto config = LoadOptionalConfig(Root() / "proj");
  ASSERT_FALSE(config.has_value());
  EXPECT_TRUE(config.error().Is(ErrorCategory::kConfig));
}

}  // namespace
}  // namespace bril::config
