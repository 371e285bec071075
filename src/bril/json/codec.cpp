#include "bril/json/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "bril/common/overloaded.hpp"

namespace bril::json {

namespace {

using nlohmann::json;

auto EncodeLiteral(const ir::Literal& value) -> json {
  return std::visit([](auto v) { return json(v); }, value);
}

auto EncodeInstr(const ir::Instruction& instr) -> json {
  return std::visit(
      Overloaded{
          [](const ir::Const& c) {
            return json{
                {"op", "const"},
                {"dest", c.dest},
                {"type", c.type},
                {"value", EncodeLiteral(c.value)},
            };
          },
          [](const ir::ValueOp& v) {
            return json{
                {"op", v.op},
                {"dest", v.dest},
                {"type", v.type},
                {"args", v.args},
            };
          },
          [](const ir::EffectOp& e) {
            return json{
                {"op", e.op},
                {"args", e.args},
            };
          },
          [](const ir::Label& l) { return json{{"label", l.name}}; },
      },
      instr);
}

auto EncodeFunction(const ir::Function& function) -> json {
  json out = json::object();
  out["name"] = function.name;
  if (!function.args.empty()) {
    json args = json::array();
    for (const auto& arg : function.args) {
      json encoded = {{"name", arg.name}};
      if (arg.type) {
        encoded["type"] = *arg.type;
      }
      args.push_back(std::move(encoded));
    }
    out["args"] = std::move(args);
  }
  if (function.return_type) {
    out["type"] = *function.return_type;
  }
  json instrs = json::array();
  for (const auto& instr : function.instrs) {
    instrs.push_back(EncodeInstr(instr));
  }
  out["instrs"] = std::move(instrs);
  return out;
}

auto Malformed(std::string_view path, std::string_view problem)
    -> std::unexpected<Diagnostic> {
  return std::unexpected(
      Diagnostic::HostError(
          fmt::format("malformed program: {}: {}", path, problem),
          ErrorCategory::kMalformedProgram));
}

auto TypeMismatch(
    std::string_view path, std::string_view expected, const json& value)
    -> std::unexpected<Diagnostic> {
  return Malformed(
      path, fmt::format("expected {}, got {}", expected, value.type_name()));
}

auto Member(std::string_view path, std::string_view key) -> std::string {
  return fmt::format("{}.{}", path, key);
}

auto Element(std::string_view path, size_t index) -> std::string {
  return fmt::format("{}[{}]", path, index);
}

// Decoding helpers. `path` names the value being decoded for diagnostics.

auto DecodeString(const json& value, std::string_view path)
    -> Result<std::string> {
  if (!value.is_string()) {
    return TypeMismatch(path, "string", value);
  }
  return value.get<std::string>();
}

auto RequireString(
    const json& object, std::string_view path, std::string_view key)
    -> Result<std::string> {
  auto it = object.find(std::string(key));
  if (it == object.end()) {
    return Malformed(path, fmt::format("missing key '{}'", key));
  }
  return DecodeString(*it, Member(path, key));
}

auto OptionalString(
    const json& object, std::string_view path, std::string_view key)
    -> Result<std::optional<std::string>> {
  auto it = object.find(std::string(key));
  if (it == object.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  auto value = DecodeString(*it, Member(path, key));
  if (!value) {
    return std::unexpected(std::move(value.error()));
  }
  return std::optional<std::string>{std::move(*value)};
}

auto DecodeStringList(
    const json& object, std::string_view path, std::string_view key)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> out;
  auto it = object.find(std::string(key));
  if (it == object.end()) {
    return out;
  }
  std::string list_path = Member(path, key);
  if (!it->is_array()) {
    return TypeMismatch(list_path, "array", *it);
  }
  for (size_t i = 0; i < it->size(); ++i) {
    auto item = DecodeString((*it)[i], Element(list_path, i));
    if (!item) {
      return std::unexpected(std::move(item.error()));
    }
    out.push_back(std::move(*item));
  }
  return out;
}

auto DecodeLiteral(const json& value, std::string_view path)
    -> Result<ir::Literal> {
  if (value.is_boolean()) {
    return ir::Literal{value.get<bool>()};
  }
  if (value.is_number_unsigned()) {
    auto raw = value.get<uint64_t>();
    if (raw > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      return Malformed(path, "integer out of range");
    }
    return ir::Literal{static_cast<int64_t>(raw)};
  }
  if (value.is_number_integer()) {
    return ir::Literal{value.get<int64_t>()};
  }
  return TypeMismatch(path, "integer or boolean", value);
}

auto DecodeInstr(const json& value, std::string_view path)
    -> Result<ir::Instruction> {
  if (!value.is_object()) {
    return TypeMismatch(path, "object", value);
  }

  if (value.contains("label")) {
    auto name = RequireString(value, path, "label");
    if (!name) {
      return std::unexpected(std::move(name.error()));
    }
    return ir::Label{.name = std::move(*name)};
  }

  auto op = RequireString(value, path, "op");
  if (!op) {
    return std::unexpected(std::move(op.error()));
  }

  if (*op == "const" && value.contains("value")) {
    auto dest = RequireString(value, path, "dest");
    if (!dest) {
      return std::unexpected(std::move(dest.error()));
    }
    auto type = RequireString(value, path, "type");
    if (!type) {
      return std::unexpected(std::move(type.error()));
    }
    auto literal = DecodeLiteral(value.at("value"), Member(path, "value"));
    if (!literal) {
      return std::unexpected(std::move(literal.error()));
    }
    return ir::Const{
        .dest = std::move(*dest),
        .type = std::move(*type),
        .value = *literal,
    };
  }

  auto args = DecodeStringList(value, path, "args");
  if (!args) {
    return std::unexpected(std::move(args.error()));
  }

  if (value.contains("dest")) {
    auto dest = RequireString(value, path, "dest");
    if (!dest) {
      return std::unexpected(std::move(dest.error()));
    }
    auto type = RequireString(value, path, "type");
    if (!type) {
      return std::unexpected(std::move(type.error()));
    }
    return ir::ValueOp{
        .dest = std::move(*dest),
        .type = std::move(*type),
        .op = std::move(*op),
        .args = std::move(*args),
    };
  }

  return ir::EffectOp{.op = std::move(*op), .args = std::move(*args)};
}

auto DecodeArg(const json& value, std::string_view path) -> Result<ir::Arg> {
  if (!value.is_object()) {
    return TypeMismatch(path, "object", value);
  }
  auto name = RequireString(value, path, "name");
  if (!name) {
    return std::unexpected(std::move(name.error()));
  }
  auto type = OptionalString(value, path, "type");
  if (!type) {
    return std::unexpected(std::move(type.error()));
  }
  return ir::Arg{.name = std::move(*name), .type = std::move(*type)};
}

auto DecodeFunction(const json& value, std::string_view path)
    -> Result<ir::Function> {
  if (!value.is_object()) {
    return TypeMismatch(path, "object", value);
  }

  auto name = RequireString(value, path, "name");
  if (!name) {
    return std::unexpected(std::move(name.error()));
  }
  auto return_type = OptionalString(value, path, "type");
  if (!return_type) {
    return std::unexpected(std::move(return_type.error()));
  }

  ir::Function function{
      .name = std::move(*name),
      .args = {},
      .return_type = std::move(*return_type),
      .instrs = {},
  };

  if (auto it = value.find("args"); it != value.end()) {
    std::string args_path = Member(path, "args");
    if (!it->is_array()) {
      return TypeMismatch(args_path, "array", *it);
    }
    for (size_t i = 0; i < it->size(); ++i) {
      auto arg = DecodeArg((*it)[i], Element(args_path, i));
      if (!arg) {
        return std::unexpected(std::move(arg.error()));
      }
      function.args.push_back(std::move(*arg));
    }
  }

  auto it = value.find("instrs");
  if (it == value.end()) {
    return Malformed(path, "missing key 'instrs'");
  }
  std::string instrs_path = Member(path, "instrs");
  if (!it->is_array()) {
    return TypeMismatch(instrs_path, "array", *it);
  }
  for (size_t i = 0; i < it->size(); ++i) {
    auto instr = DecodeInstr((*it)[i], Element(instrs_path, i));
    if (!instr) {
      return std::unexpected(std::move(instr.error()));
    }
    function.instrs.push_back(std::move(*instr));
  }
  return function;
}

}  // namespace

auto ToJson(const ir::Program& program) -> nlohmann::json {
  json out = json::object();
  json functions = json::array();
  for (const auto& function : program.functions) {
    functions.push_back(EncodeFunction(function));
  }
  out["functions"] = std::move(functions);
  if (!program.imports.empty()) {
    out["imports"] = program.imports;
  }
  return out;
}

auto FromJson(const nlohmann::json& doc) -> Result<ir::Program> {
  constexpr std::string_view kRoot = "program";
  if (!doc.is_object()) {
    return TypeMismatch(kRoot, "object", doc);
  }

  ir::Program program;
  auto imports = DecodeStringList(doc, kRoot, "imports");
  if (!imports) {
    return std::unexpected(std::move(imports.error()));
  }
  program.imports = std::move(*imports);

  auto it = doc.find("functions");
  if (it == doc.end()) {
    return Malformed(kRoot, "missing key 'functions'");
  }
  if (!it->is_array()) {
    return TypeMismatch("functions", "array", *it);
  }
  for (size_t i = 0; i < it->size(); ++i) {
    auto function = DecodeFunction((*it)[i], Element("functions", i));
    if (!function) {
      return std::unexpected(std::move(function.error()));
    }
    program.functions.push_back(std::move(*function));
  }
  return program;
}

auto ParseJson(const std::string& text) -> Result<ir::Program> {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("invalid JSON: {}", e.what()),
            ErrorCategory::kMalformedProgram));
  }
  return FromJson(doc);
}

auto Dump(const ir::Program& program, int indent) -> std::string {
  return ToJson(program).dump(indent);
}

}  // namespace bril::json
