#include "tool_registry.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pcli2mcp {
namespace {

static ParamSpec StringParam(std::string name, std::string flag, std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.kind = ParamKind::kString;
  p.flag = std::move(flag);
  p.description = std::move(description);
  return p;
}

static ParamSpec RequiredString(std::string name, std::string flag, std::string description) {
  auto p = StringParam(std::move(name), std::move(flag), std::move(description));
  p.required = true;
  return p;
}

static ParamSpec BoolParam(std::string name, std::string flag, std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.kind = ParamKind::kBoolean;
  p.flag = std::move(flag);
  p.description = std::move(description);
  p.default_value = false;
  return p;
}

static ParamSpec EnumParam(std::string name,
                           std::string flag,
                           std::vector<std::string> values,
                           std::string default_value,
                           std::string description) {
  ParamSpec p;
  p.name = std::move(name);
  p.kind = ParamKind::kEnum;
  p.flag = std::move(flag);
  p.enum_values = std::move(values);
  p.default_value = std::move(default_value);
  p.description = std::move(description);
  return p;
}

static ParamSpec ThresholdParam() {
  ParamSpec p;
  p.name = "threshold";
  p.kind = ParamKind::kNumber;
  p.flag = "--threshold";
  p.description = "Minimum similarity percentage a match must reach (0-100).";
  p.default_value = 80.0;
  p.minimum = 0.0;
  p.maximum = 100.0;
  p.precision = 2;
  return p;
}

static ParamSpec FormatParam(std::vector<std::string> values) {
  return EnumParam("format", "--format", std::move(values), "json", "Output format.");
}

static ParamSpec TenantParam() {
  return StringParam("tenant", "--tenant", "Tenant to run against instead of the active one.");
}

static ParamSpec UuidParam(const std::string& what) {
  return StringParam("uuid", "--uuid", "UUID of the " + what + ".");
}

static ParamSpec PathParam(const std::string& what) {
  return StringParam("path", "--path", "Full path of the " + what + ", e.g. /Root/Folder/Part.stl.");
}

// Listing flags shared by every tabular command.
static void AddListingFlags(ToolDefinition* t, std::vector<std::string> formats, bool with_metadata) {
  t->params.push_back(FormatParam(std::move(formats)));
  t->params.push_back(BoolParam("headers", "--headers", "Include a header row in CSV output."));
  if (with_metadata) t->params.push_back(BoolParam("metadata", "--metadata", "Include asset metadata columns."));
  t->params.push_back(BoolParam("pretty", "--pretty", "Pretty-print JSON output."));
  t->params.push_back(TenantParam());
}

static ToolDefinition MakeTool(const std::string& program,
                               std::string name,
                               std::vector<std::string> subcommand,
                               std::string description) {
  ToolDefinition t;
  t.name = std::move(name);
  t.program = program;
  t.subcommand = std::move(subcommand);
  t.description = std::move(description);
  return t;
}

static ToolDefinition MakeMatchTool(const std::string& program,
                                    std::string name,
                                    std::string subcommand,
                                    std::string description,
                                    bool with_threshold) {
  auto t = MakeTool(program, std::move(name), {"asset", std::move(subcommand)}, std::move(description));
  t.params.push_back(UuidParam("reference asset"));
  t.params.push_back(PathParam("reference asset"));
  if (with_threshold) t.params.push_back(ThresholdParam());
  AddListingFlags(&t, {"json", "csv"}, true);
  t.at_least_one_of.push_back({"uuid", "path"});
  return t;
}

static nlohmann::json ParamSchema(const ParamSpec& p) {
  nlohmann::json s = nlohmann::json::object();
  switch (p.kind) {
    case ParamKind::kString:
      s["type"] = "string";
      if (!p.allow_empty) s["minLength"] = 1;
      break;
    case ParamKind::kNumber:
      s["type"] = "number";
      if (p.minimum) s["minimum"] = *p.minimum;
      if (p.maximum) s["maximum"] = *p.maximum;
      break;
    case ParamKind::kBoolean:
      s["type"] = "boolean";
      break;
    case ParamKind::kEnum:
      s["type"] = "string";
      s["enum"] = p.enum_values;
      break;
    case ParamKind::kStringList:
      s["type"] = "array";
      s["items"] = {{"type", "string"}, {"minLength", 1}};
      break;
  }
  if (!p.description.empty()) s["description"] = p.description;
  if (!p.default_value.is_null()) s["default"] = p.default_value;
  return s;
}

}  // namespace

const char* ParamKindName(ParamKind kind) {
  switch (kind) {
    case ParamKind::kString:
      return "string";
    case ParamKind::kNumber:
      return "number";
    case ParamKind::kBoolean:
      return "boolean";
    case ParamKind::kEnum:
      return "enum";
    case ParamKind::kStringList:
      return "array of strings";
  }
  return "unknown";
}

const ParamSpec* ToolDefinition::FindParam(const std::string& param_name) const {
  for (const auto& p : params) {
    if (p.name == param_name) return &p;
  }
  return nullptr;
}

bool ToolDefinition::HasParam(const std::string& param_name) const {
  return FindParam(param_name) != nullptr;
}

nlohmann::json BuildInputSchema(const ToolDefinition& tool) {
  nlohmann::json schema;
  schema["type"] = "object";
  schema["properties"] = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();
  for (const auto& p : tool.params) {
    schema["properties"][p.name] = ParamSchema(p);
    if (p.required) required.push_back(p.name);
  }
  if (!required.empty()) schema["required"] = std::move(required);
  schema["additionalProperties"] = false;

  nlohmann::json groups = nlohmann::json::array();
  for (const auto& group : tool.at_least_one_of) {
    nlohmann::json any_of = nlohmann::json::array();
    for (const auto& name : group) any_of.push_back({{"required", {name}}});
    groups.push_back({{"anyOf", std::move(any_of)}});
  }
  if (groups.size() == 1) {
    schema["anyOf"] = groups[0]["anyOf"];
  } else if (!groups.empty()) {
    schema["allOf"] = std::move(groups);
  }
  return schema;
}

nlohmann::json ToMcpTool(const ToolDefinition& tool) {
  nlohmann::json j;
  j["name"] = tool.name;
  j["description"] = tool.description;
  j["inputSchema"] = BuildInputSchema(tool);
  return j;
}

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> tools) : tools_(std::move(tools)) {
  for (size_t i = 0; i < tools_.size(); i++) {
    const auto& t = tools_[i];
    if (!index_.emplace(t.name, i).second) throw std::invalid_argument("duplicate tool name: " + t.name);
    for (const auto& group : t.at_least_one_of) {
      for (const auto& name : group) {
        if (!t.HasParam(name)) {
          throw std::invalid_argument("tool " + t.name + " constrains undeclared parameter: " + name);
        }
      }
    }
  }
}

const ToolDefinition* ToolRegistry::Find(const std::string& name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return nullptr;
  return &tools_[it->second];
}

nlohmann::json ToolRegistry::ToMcpToolList() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools_) out.push_back(ToMcpTool(t));
  return out;
}

ToolRegistry BuildPcli2ToolRegistry(const std::string& program) {
  std::vector<ToolDefinition> tools;

  {
    auto t = MakeTool(program, "pcli2_tenant_list", {"tenant", "list"}, "List the tenants the current user can access.");
    t.params.push_back(FormatParam({"json", "csv"}));
    t.params.push_back(BoolParam("headers", "--headers", "Include a header row in CSV output."));
    t.params.push_back(BoolParam("pretty", "--pretty", "Pretty-print JSON output."));
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_folder_list", {"folder", "list"},
                      "List folders, optionally below a parent folder path.");
    t.params.push_back(StringParam("folder_path", "--folder-path", "Parent folder path; the tenant root when omitted."));
    AddListingFlags(&t, {"json", "csv", "tree"}, false);
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_folder_get", {"folder", "get"}, "Get details of one folder by UUID or path.");
    t.params.push_back(UuidParam("folder"));
    t.params.push_back(PathParam("folder"));
    AddListingFlags(&t, {"json", "csv", "tree"}, false);
    t.at_least_one_of.push_back({"uuid", "path"});
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_asset_list", {"asset", "list"}, "List the assets stored in a folder.");
    t.params.push_back(StringParam("folder_uuid", "--folder-uuid", "UUID of the folder to list."));
    t.params.push_back(StringParam("folder_path", "--folder-path", "Path of the folder to list."));
    AddListingFlags(&t, {"json", "csv"}, true);
    t.at_least_one_of.push_back({"folder_uuid", "folder_path"});
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_asset_get", {"asset", "get"}, "Get details of one asset by UUID or path.");
    t.params.push_back(UuidParam("asset"));
    t.params.push_back(PathParam("asset"));
    AddListingFlags(&t, {"json", "csv"}, true);
    t.at_least_one_of.push_back({"uuid", "path"});
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_asset_metadata_create", {"asset", "metadata", "create"},
                      "Create or update a metadata field on an asset.");
    t.params.push_back(UuidParam("asset"));
    t.params.push_back(PathParam("asset"));
    t.params.push_back(RequiredString("name", "--name", "Metadata field name."));
    auto value = RequiredString("value", "--value", "Metadata field value.");
    value.allow_empty = true;
    t.params.push_back(std::move(value));
    t.params.push_back(EnumParam("type", "--type", {"text", "number", "boolean"}, "text", "Metadata field type."));
    t.params.push_back(TenantParam());
    t.at_least_one_of.push_back({"uuid", "path"});
    tools.push_back(std::move(t));
  }

  tools.push_back(MakeMatchTool(program, "pcli2_geometric_match", "geometric-match",
                                "Find assets whose 3D geometry matches a reference asset.", true));
  tools.push_back(MakeMatchTool(program, "pcli2_part_match", "part-match",
                                "Find assets that contain the reference asset as a part.", true));
  tools.push_back(MakeMatchTool(program, "pcli2_visual_match", "visual-match",
                                "Find assets that look like the reference asset.", false));

  {
    auto t = MakeTool(program, "pcli2_text_match", {"asset", "text-match"},
                      "Search assets by name and metadata text.");
    t.params.push_back(RequiredString("text", "--text", "Text to search for."));
    ParamSpec folders;
    folders.name = "folder_paths";
    folders.kind = ParamKind::kStringList;
    folders.flag = "--folder-path";
    folders.description = "Restrict the search to these folder paths.";
    t.params.push_back(std::move(folders));
    t.params.push_back(BoolParam("fuzzy", "--fuzzy", "Allow approximate text matches."));
    AddListingFlags(&t, {"json", "csv"}, true);
    tools.push_back(std::move(t));
  }

  {
    auto t = MakeTool(program, "pcli2_asset_thumbnail", {"asset", "thumbnail"},
                      "Fetch the rendered thumbnail image of an asset.");
    t.params.push_back(UuidParam("asset"));
    t.params.push_back(PathParam("asset"));
    t.params.push_back(TenantParam());
    t.at_least_one_of.push_back({"uuid", "path"});
    t.output = OutputKind::kImage;
    tools.push_back(std::move(t));
  }

  return ToolRegistry(std::move(tools));
}

}  // namespace pcli2mcp
