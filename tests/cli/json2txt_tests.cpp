#include <gtest/gtest.h>

#include <string>

#include "tests/cli/cli_test_fixture.hpp"

namespace bril::test {
namespace {

class Json2TxtTest : public CliTestFixture {};

TEST_F(Json2TxtTest, PrintsTextFormat) {
  WriteFile("prog.json", R"({
    "functions": [{
      "name": "main",
      "args": [{"name": "n", "type": "int"}],
      "instrs": [
        {"op": "const", "dest": "v", "type": "int", "value": 1},
        {"op": "add", "dest": "w", "type": "int", "args": ["v", "n"]},
        {"label": "done"},
        {"op": "print", "args": ["w"]},
        {"op": "ret"}
      ]
    }]
  })");

  auto result = Run({"json2txt", "prog.json"});

  EXPECT_TRUE(result.Success()) << result.stderr_output;
  EXPECT_EQ(
      result.stdout_output,
      "main {\n"
      "  v: int = const 1;\n"
      "  w: int = add v n;\n"
      "  done:\n"
      "  print w;\n"
      "  ret;\n"
      "}\n");
}

TEST_F(Json2TxtTest, ReadsStdin) {
  auto result = RunWithInput(
      R"({"functions": [{"name": "f", "instrs": [)"
      R"({"op": "const", "dest": "b", "type": "bool", "value": true}]}]})",
      {"json2txt"});

  EXPECT_TRUE(result.Success()) << result.stderr_output;
  EXPECT_EQ(result.stdout_output, "f {\n  b: bool = const true;\n}\n");
}

TEST_F(Json2TxtTest, TextRoundTripsThroughJson) {
  const std::string text =
      "main {\n"
      "  a: int = const 4;\n"
      "  b: int = add a a;\n"
      "  print b;\n"
      "  loop:\n"
      "}\n";
  auto to_json = RunWithInput(text, {"txt2json"});
  ASSERT_TRUE(to_json.Success()) << to_json.stderr_output;

  auto back = RunWithInput(to_json.stdout_output, {"json2txt"});
  ASSERT_TRUE(back.Success()) << back.stderr_output;
  EXPECT_EQ(back.stdout_output, text);
}

TEST_F(Json2TxtTest, MalformedProgramNamesPath) {
  auto result = RunWithInput(
      R"({"functions": [{"name": "main", "instrs": [{"op": 3}]}]})",
      {"json2txt"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.stdout_output.empty());
  EXPECT_NE(
      result.stderr_output.find(
          "malformed program: functions[0].instrs[0].op"),
      std::string::npos)
      << result.stderr_output;
}

TEST_F(Json2TxtTest, InvalidJson) {
  auto result = RunWithInput("{ not json", {"json2txt"});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.stderr_output.find("invalid JSON"), std::string::npos)
      << result.stderr_output;
}

}  // namespace
}  // namespace bril::test
