#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pcli2mcp {

enum class ParamKind {
  kString,
  kNumber,
  kBoolean,
  kEnum,
  kStringList,
};

const char* ParamKindName(ParamKind kind);

// One declared tool parameter together with the rule that turns it into
// command-line tokens. An empty flag makes the parameter positional.
struct ParamSpec {
  std::string name;
  ParamKind kind = ParamKind::kString;
  std::string description;
  bool required = false;
  nlohmann::json default_value;  // null when there is no default
  std::vector<std::string> enum_values;
  std::optional<double> minimum;
  std::optional<double> maximum;
  bool allow_empty = false;
  std::string flag;
  int precision = -1;  // fixed decimals for kNumber, -1 = shortest form
};

enum class OutputKind {
  kText,
  kImage,
};

struct ToolDefinition {
  std::string name;
  std::string description;
  std::string program;
  std::vector<std::string> subcommand;
  std::vector<ParamSpec> params;
  std::vector<std::vector<std::string>> at_least_one_of;
  OutputKind output = OutputKind::kText;

  const ParamSpec* FindParam(const std::string& param_name) const;
  bool HasParam(const std::string& param_name) const;
};

// MCP `inputSchema` for a tool, derived from its parameter table so the
// advertised schema and the emitted flags cannot drift apart.
nlohmann::json BuildInputSchema(const ToolDefinition& tool);

// {name, description, inputSchema} as listed by tools/list.
nlohmann::json ToMcpTool(const ToolDefinition& tool);

class ToolRegistry {
 public:
  explicit ToolRegistry(std::vector<ToolDefinition> tools);

  const ToolDefinition* Find(const std::string& name) const;
  const std::vector<ToolDefinition>& List() const { return tools_; }
  size_t Size() const { return tools_.size(); }

  nlohmann::json ToMcpToolList() const;

 private:
  std::vector<ToolDefinition> tools_;
  std::unordered_map<std::string, size_t> index_;
};

// The fixed pcli2 catalog. `program` is the executable every tool runs.
ToolRegistry BuildPcli2ToolRegistry(const std::string& program);

}  // namespace pcli2mcp
